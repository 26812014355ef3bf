#include "ManifestLoader.h"
#include "RecordReader.h"
#include "Errors.h"
#include "Utils.h"
#include "Logging.h"
#include <algorithm>

namespace revkit {

Module ManifestLoader::build_module(const Record& rec, const std::string& source) const {
    Module m;
    m.id = rec.name;
    bool have_category = false, have_tokens = false;
    for(const auto& f : rec.fields) {
        if(f.key == "title") {
            m.title = f.value;
        } else if(f.key == "category") {
            auto c = parse_category(f.value);
            if(!c) throw FormatError(source, f.line, "unknown category '" + f.value + "'");
            m.category = *c;
            have_category = true;
        } else if(f.key == "tokens") {
            if(!utils::parse_int64(f.value, m.token_estimate)) throw FormatError(source, f.line, "tokens must be an integer");
            have_tokens = true;
        } else if(f.key == "depends") {
            for(auto& d : utils::split_csv(f.value)) m.dependencies.push_back(std::move(d));
        } else if(f.key == "tags") {
            for(auto& t : utils::split_csv(f.value)) m.tags.insert(std::move(t));
        } else if(f.key == "checklist_items") {
            long long n = 0;
            if(!utils::parse_int64(f.value, n) || n < 0) throw FormatError(source, f.line, "checklist_items must be a non-negative integer");
            m.checklist_items = n;
        } else {
            throw FormatError(source, f.line, "unknown module key '" + f.key + "'");
        }
    }
    if(!have_category) throw FormatError(source, rec.line, "module '" + m.id + "' has no category");
    if(!have_tokens) throw FormatError(source, rec.line, "module '" + m.id + "' has no tokens");
    if(m.title.empty()) m.title = m.id;
    return m;
}

Goal ManifestLoader::build_goal(const Record& rec, const std::string& source) const {
    Goal g;
    g.name = rec.name;
    for(const auto& f : rec.fields) {
        if(f.key == "title") g.title = f.value;
        else if(f.key == "modules") { for(auto& id : utils::split_csv(f.value)) g.module_ids.push_back(std::move(id)); }
        else if(f.key == "tags") { for(auto& t : utils::split_csv(f.value)) g.tags.push_back(std::move(t)); }
        else throw FormatError(source, f.line, "unknown goal key '" + f.key + "'");
    }
    if(g.module_ids.empty() && g.tags.empty()) throw FormatError(source, rec.line, "goal '" + g.name + "' selects nothing");
    return g;
}

void ManifestLoader::load_text(const std::string& text, const std::string& source, ModuleRegistry& registry, GoalCatalog& goals) const {
    RecordReader reader({"id", "goal"});
    RecordDocument doc = reader.parse(text, source);
    if(!doc.header.empty()) throw FormatError(source, doc.header.front().line, "key '" + doc.header.front().key + "' outside of a record");

    for(const auto& rec : doc.records) {
        if(rec.kind == "id") {
            registry.register_module(build_module(rec, source));
        } else if(!goals.add(build_goal(rec, source))) {
            throw FormatError(source, rec.line, "duplicate goal '" + rec.name + "'");
        }
    }
    goals.validate(registry);
    registry.seal();
    Logger::instance().info("loaded " + std::to_string(registry.size()) + " modules and " +
                            std::to_string(goals.goals().size()) + " goals from " + source);
}

void ManifestLoader::load_file(const std::string& path, ModuleRegistry& registry, GoalCatalog& goals) const {
    auto text = utils::read_file(path);
    if(!text) throw Error("cannot read manifest: " + path);
    load_text(*text, path, registry, goals);
}

}
