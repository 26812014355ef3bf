#include "RecordReader.h"
#include "Errors.h"
#include "Utils.h"
#include <algorithm>
#include <sstream>

namespace revkit {

const Field* Record::get(const std::string& key) const {
    for(auto it = fields.rbegin(); it != fields.rend(); ++it) if(it->key == key) return &*it;
    return nullptr;
}

std::vector<std::string> Record::get_all(const std::string& key) const {
    std::vector<std::string> out;
    for(const auto& f : fields) if(f.key == key) out.push_back(f.value);
    return out;
}

const Field* RecordDocument::header_get(const std::string& key) const {
    for(auto it = header.rbegin(); it != header.rend(); ++it) if(it->key == key) return &*it;
    return nullptr;
}

bool RecordReader::is_leader(const std::string& key) const {
    return std::find(leaders_.begin(), leaders_.end(), key) != leaders_.end();
}

RecordDocument RecordReader::parse(const std::string& text, const std::string& source) const {
    RecordDocument doc;
    doc.source = source;
    std::istringstream in(text);
    std::string raw;
    size_t lineno = 0;
    while(std::getline(in, raw)) {
        ++lineno;
        if(raw.find('\0') != std::string::npos) throw FormatError(source, lineno, "line contains null bytes");
        if(raw.size() > kMaxLineLength) throw FormatError(source, lineno, "line too long");
        std::string line = utils::trim(raw);
        if(line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if(eq == std::string::npos) throw FormatError(source, lineno, "expected key=value");
        Field f{utils::trim(line.substr(0, eq)), utils::trim(line.substr(eq + 1)), lineno};
        if(f.key.empty()) throw FormatError(source, lineno, "empty key");
        if(is_leader(f.key)) {
            if(f.value.empty()) throw FormatError(source, lineno, "empty value for '" + f.key + "'");
            Record r;
            r.kind = f.key;
            r.name = f.value;
            r.line = lineno;
            doc.records.push_back(std::move(r));
        } else if(doc.records.empty()) {
            doc.header.push_back(std::move(f));
        } else {
            doc.records.back().fields.push_back(std::move(f));
        }
    }
    return doc;
}

RecordDocument RecordReader::parse_file(const std::string& path) const {
    auto text = utils::read_file(path);
    if(!text) throw Error("cannot read file: " + path);
    return parse(*text, path);
}

}
