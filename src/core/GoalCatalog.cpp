#include "GoalCatalog.h"
#include "ModuleRegistry.h"
#include "Errors.h"
#include <algorithm>

namespace revkit {

namespace {
void append_unique(std::vector<std::string>& dst, const std::string& v) {
    if(std::find(dst.begin(), dst.end(), v) == dst.end()) dst.push_back(v);
}
}

bool GoalCatalog::add(Goal goal) {
    if(find(goal.name)) return false;
    goals_.push_back(std::move(goal));
    return true;
}

const Goal* GoalCatalog::find(const std::string& name) const {
    auto it = std::find_if(goals_.begin(), goals_.end(), [&](const Goal& g){ return g.name == name; });
    return it == goals_.end() ? nullptr : &*it;
}

const Goal& GoalCatalog::at(const std::string& name) const {
    const Goal* g = find(name);
    if(!g) throw UnknownGoalError(name);
    return *g;
}

void GoalCatalog::validate(const ModuleRegistry& registry) const {
    std::vector<std::string> unknown;
    for(const auto& g : goals_) {
        for(const auto& id : g.module_ids) if(!registry.contains(id)) append_unique(unknown, id);
    }
    if(!unknown.empty()) throw UnknownModuleError(std::move(unknown));
}

SelectionCriteria GoalCatalog::expand(const SelectionCriteria& criteria) const {
    SelectionCriteria out;
    out.token_budget = criteria.token_budget;
    out.max_modules = criteria.max_modules;
    for(const auto& id : criteria.explicit_ids) append_unique(out.explicit_ids, id);
    for(const auto& t : criteria.goal_tags) append_unique(out.goal_tags, t);
    for(const auto& name : criteria.presets) {
        const Goal& g = at(name);
        for(const auto& id : g.module_ids) append_unique(out.explicit_ids, id);
        for(const auto& t : g.tags) append_unique(out.goal_tags, t);
    }
    return out;
}

}
