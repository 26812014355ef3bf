#pragma once
#include "Plan.h"
#include <string>
#include <vector>

namespace revkit {

class ModuleRegistry;

// A named review goal: the static goal -> modules/tags lookup table.
struct Goal {
    std::string name;
    std::string title;
    std::vector<std::string> module_ids;
    std::vector<std::string> tags;
};

class GoalCatalog {
public:
    // Returns false when a goal with the same name already exists.
    bool add(Goal goal);
    const Goal* find(const std::string& name) const;
    const Goal& at(const std::string& name) const; // throws UnknownGoalError
    const std::vector<Goal>& goals() const { return goals_; }
    bool empty() const { return goals_.empty(); }

    // Every module id named by a goal must be registered.
    void validate(const ModuleRegistry& registry) const;

    // Moves presets into explicit ids / goal tags, preserving first-seen order.
    SelectionCriteria expand(const SelectionCriteria& criteria) const;

private:
    std::vector<Goal> goals_;
};

}
