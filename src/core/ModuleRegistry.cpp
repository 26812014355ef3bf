#include "ModuleRegistry.h"
#include "Errors.h"
#include "Logging.h"
#include <algorithm>

namespace revkit {

void ModuleRegistry::register_module(Module module) {
    if(sealed_) throw RegistrySealedError(module.id);
    if(module.id.empty()) throw InvalidModuleError(module.id, "empty id");
    if(module.token_estimate <= 0) throw InvalidModuleError(module.id, "token estimate must be positive");
    if(module.checklist_items && *module.checklist_items < 0) throw InvalidModuleError(module.id, "negative checklist item count");
    if(index_.count(module.id)) throw DuplicateIdError(module.id);
    if(std::find(module.dependencies.begin(), module.dependencies.end(), module.id) != module.dependencies.end()) {
        throw InvalidDependencyError(module.id, {module.id});
    }
    std::vector<std::string> deps;
    for(auto& d : module.dependencies) {
        if(std::find(deps.begin(), deps.end(), d) == deps.end()) deps.push_back(d);
    }
    module.dependencies = std::move(deps);
    module.registration_index = modules_.size();
    index_.emplace(module.id, modules_.size());
    Logger::instance().trace("registered module " + module.id);
    modules_.push_back(std::move(module));
}

void ModuleRegistry::seal() {
    if(sealed_) return;
    check_dependencies_known();
    check_acyclic();
    sealed_ = true;
    Logger::instance().debug("module registry sealed with " + std::to_string(modules_.size()) + " modules");
}

const Module* ModuleRegistry::find(const std::string& id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &modules_[it->second];
}

const Module& ModuleRegistry::at(const std::string& id) const {
    const Module* m = find(id);
    if(!m) throw UnknownModuleError({id});
    return *m;
}

void ModuleRegistry::check_dependencies_known() const {
    for(const auto& m : modules_) {
        std::vector<std::string> missing;
        for(const auto& d : m.dependencies) if(!index_.count(d)) missing.push_back(d);
        if(!missing.empty()) throw InvalidDependencyError(m.id, std::move(missing));
    }
}

// Iterative DFS with an explicit recursion stack; a back edge to a node on
// the stack yields the cycle path from that node back to itself.
void ModuleRegistry::check_acyclic() const {
    enum class Mark { White, Grey, Black };
    std::vector<Mark> mark(modules_.size(), Mark::White);
    struct Frame { size_t node; size_t next_dep; };

    for(size_t root = 0; root < modules_.size(); ++root) {
        if(mark[root] != Mark::White) continue;
        std::vector<Frame> stack;
        stack.push_back({root, 0});
        mark[root] = Mark::Grey;
        while(!stack.empty()) {
            Frame& top = stack.back();
            const auto& deps = modules_[top.node].dependencies;
            if(top.next_dep == deps.size()) {
                mark[top.node] = Mark::Black;
                stack.pop_back();
                continue;
            }
            size_t dep = index_.at(deps[top.next_dep++]);
            if(mark[dep] == Mark::Grey) {
                std::vector<std::string> cycle;
                auto it = std::find_if(stack.begin(), stack.end(), [&](const Frame& f){ return f.node == dep; });
                for(; it != stack.end(); ++it) cycle.push_back(modules_[it->node].id);
                cycle.push_back(modules_[dep].id);
                throw CyclicDependencyError(std::move(cycle));
            }
            if(mark[dep] == Mark::White) {
                mark[dep] = Mark::Grey;
                stack.push_back({dep, 0});
            }
        }
    }
}

}
