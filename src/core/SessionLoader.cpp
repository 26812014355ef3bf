#include "SessionLoader.h"
#include "Scorer.h"
#include "RecordReader.h"
#include "Errors.h"
#include "Utils.h"

namespace revkit {

ReviewSession SessionLoader::load_text(const std::string& text, const std::string& source) const {
    RecordReader reader({"module"});
    RecordDocument doc = reader.parse(text, source);

    std::string name = "review";
    for(const auto& f : doc.header) {
        if(f.key == "session") name = f.value;
        else throw FormatError(source, f.line, "unknown session key '" + f.key + "'");
    }

    ReviewSession session(name);
    for(const auto& rec : doc.records) {
        Finding finding;
        finding.module_id = rec.name;
        bool have_severity = false;
        for(const auto& f : rec.fields) {
            if(f.key == "severity") {
                auto s = parse_severity(f.value);
                if(!s) throw FormatError(source, f.line, "severity must be P0..P3, got '" + f.value + "'");
                finding.severity = *s;
                have_severity = true;
            } else if(f.key == "category") {
                finding.category = f.value;
            } else if(f.key == "description") {
                finding.description = f.value;
            } else if(f.key == "location") {
                finding.location = Location::parse(f.value);
            } else {
                throw FormatError(source, f.line, "unknown finding key '" + f.key + "'");
            }
        }
        if(!have_severity) throw FormatError(source, rec.line, "finding for '" + rec.name + "' has no severity");
        aggregator_.record_finding(session, std::move(finding));
    }
    return session;
}

ReviewSession SessionLoader::load_file(const std::string& path) const {
    auto text = utils::read_file(path);
    if(!text) throw Error("cannot read session file: " + path);
    return load_text(*text, path);
}

}
