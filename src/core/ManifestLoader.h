#pragma once
#include "ModuleRegistry.h"
#include "GoalCatalog.h"
#include "RecordReader.h"
#include <string>

namespace revkit {

// Populates a registry and goal catalog from a manifest, then seals the
// registry. Any error leaves the registry unsealed.
//
//   id=owasp-core            goal=pre-deploy
//   title=OWASP basics       modules=owasp-core,secrets
//   category=core            tags=deploy
//   tokens=1200
//   depends=a,b
//   tags=security,web
//   checklist_items=25
class ManifestLoader {
public:
    void load_text(const std::string& text, const std::string& source, ModuleRegistry& registry, GoalCatalog& goals) const;
    void load_file(const std::string& path, ModuleRegistry& registry, GoalCatalog& goals) const;

private:
    Module build_module(const Record& rec, const std::string& source) const;
    Goal build_goal(const Record& rec, const std::string& source) const;
};

}
