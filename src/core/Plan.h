#pragma once
#include "Module.h"
#include <string>
#include <vector>
#include <optional>

namespace revkit {

struct SelectionCriteria {
    std::vector<std::string> explicit_ids;
    std::vector<std::string> goal_tags;
    std::vector<std::string> presets; // expanded through GoalCatalog before resolving
    std::optional<long long> token_budget;
    std::optional<size_t> max_modules;
};

struct ExecutionPlan {
    std::vector<const Module*> ordered_modules; // dependencies strictly before dependents
    long long total_tokens = 0;
    std::vector<std::string> dropped_modules;   // in drop order
    std::vector<std::string> warnings;

    std::vector<std::string> ordered_ids() const {
        std::vector<std::string> ids;
        ids.reserve(ordered_modules.size());
        for(const auto* m : ordered_modules) ids.push_back(m->id);
        return ids;
    }
};

}
