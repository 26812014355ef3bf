#pragma once
#include "Plan.h"
#include "ModuleRegistry.h"
#include <vector>

namespace revkit {

class GoalCatalog;

// Turns SelectionCriteria into an ExecutionPlan over a sealed registry.
// resolve() has no side effects, so one Resolver may be shared by threads.
class Resolver {
public:
    explicit Resolver(const ModuleRegistry& registry, const GoalCatalog* goals = nullptr);

    ExecutionPlan resolve(const SelectionCriteria& criteria) const;

private:
    std::vector<bool> collect_seeds(const SelectionCriteria& criteria, std::vector<bool>& explicit_mask,
                                    std::vector<std::string>& warnings) const;
    std::vector<bool> dependency_closure(const std::vector<bool>& seeds) const;
    std::vector<size_t> topological_order(const std::vector<bool>& members) const;

    const ModuleRegistry& registry_;
    const GoalCatalog* goals_;
};

}
