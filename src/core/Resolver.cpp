#include "Resolver.h"
#include "GoalCatalog.h"
#include "Errors.h"
#include "Logging.h"
#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

namespace revkit {

Resolver::Resolver(const ModuleRegistry& registry, const GoalCatalog* goals)
    : registry_(registry), goals_(goals) {
    if(!registry_.sealed()) throw std::logic_error("Resolver requires a sealed ModuleRegistry");
}

std::vector<bool> Resolver::collect_seeds(const SelectionCriteria& criteria, std::vector<bool>& explicit_mask,
                                          std::vector<std::string>& warnings) const {
    const auto& mods = registry_.modules();
    std::vector<bool> seeds(mods.size(), false);
    explicit_mask.assign(mods.size(), false);

    std::vector<std::string> unknown;
    for(const auto& id : criteria.explicit_ids) {
        const Module* m = registry_.find(id);
        if(!m) {
            if(std::find(unknown.begin(), unknown.end(), id) == unknown.end()) unknown.push_back(id);
            continue;
        }
        seeds[m->registration_index] = true;
        explicit_mask[m->registration_index] = true;
    }
    if(!unknown.empty()) throw UnknownModuleError(std::move(unknown));

    for(const auto& tag : criteria.goal_tags) {
        bool matched = false;
        for(const auto& m : registry_.lookup_by_tag(tag)) {
            seeds[m.registration_index] = true;
            matched = true;
        }
        if(!matched) warnings.push_back("goal tag '" + tag + "' matched no modules");
    }
    return seeds;
}

std::vector<bool> Resolver::dependency_closure(const std::vector<bool>& seeds) const {
    const auto& mods = registry_.modules();
    std::vector<bool> members(mods.size(), false);
    std::vector<size_t> stack;
    for(size_t i = 0; i < mods.size(); ++i) {
        if(!seeds[i] || members[i]) continue;
        members[i] = true;
        stack.push_back(i);
        while(!stack.empty()) {
            size_t cur = stack.back();
            stack.pop_back();
            for(const auto& dep : mods[cur].dependencies) {
                size_t d = registry_.at(dep).registration_index;
                if(!members[d]) { members[d] = true; stack.push_back(d); }
            }
        }
    }
    return members;
}

// Kahn's algorithm; the ready set is keyed by (category priority, registration
// index) so equal inputs always produce the same order.
std::vector<size_t> Resolver::topological_order(const std::vector<bool>& members) const {
    const auto& mods = registry_.modules();
    std::vector<size_t> pending(mods.size(), 0);
    std::vector<std::vector<size_t>> dependents(mods.size());
    std::set<std::pair<int, size_t>> ready;
    for(size_t i = 0; i < mods.size(); ++i) {
        if(!members[i]) continue;
        for(const auto& dep : mods[i].dependencies) {
            size_t d = registry_.at(dep).registration_index;
            ++pending[i];
            dependents[d].push_back(i);
        }
        if(pending[i] == 0) ready.insert({category_priority(mods[i].category), i});
    }
    std::vector<size_t> order;
    while(!ready.empty()) {
        size_t cur = ready.begin()->second;
        ready.erase(ready.begin());
        order.push_back(cur);
        for(size_t dep : dependents[cur]) {
            if(--pending[dep] == 0) ready.insert({category_priority(mods[dep].category), dep});
        }
    }
    return order;
}

ExecutionPlan Resolver::resolve(const SelectionCriteria& input) const {
    SelectionCriteria criteria = input;
    if(!input.presets.empty()) {
        if(!goals_) throw UnknownGoalError(input.presets.front());
        criteria = goals_->expand(input);
    }

    const auto& mods = registry_.modules();
    ExecutionPlan plan;
    std::vector<bool> explicit_mask;
    std::vector<bool> seeds = collect_seeds(criteria, explicit_mask, plan.warnings);
    std::vector<bool> retained = dependency_closure(seeds);
    std::vector<size_t> order = topological_order(retained);

    std::vector<size_t> dependents(mods.size(), 0);
    long long total = 0;
    size_t count = 0;
    for(size_t i : order) {
        total += mods[i].token_estimate;
        ++count;
        for(const auto& dep : mods[i].dependencies) ++dependents[registry_.at(dep).registration_index];
    }

    auto over_budget = [&]{ return criteria.token_budget && total > *criteria.token_budget; };
    auto over_cap = [&]{ return criteria.max_modules && count > *criteria.max_modules; };

    auto drop = [&](size_t idx, const std::string& reason) {
        const Module& m = mods[idx];
        retained[idx] = false;
        total -= m.token_estimate;
        --count;
        for(const auto& dep : m.dependencies) --dependents[registry_.at(dep).registration_index];
        plan.dropped_modules.push_back(m.id);
        plan.warnings.push_back("dropped '" + m.id + "' (" + category_to_string(m.category) + ", " +
                                std::to_string(m.token_estimate) + " tokens): " + reason);
        Logger::instance().debug("resolver dropped " + m.id + ": " + reason);
    };

    // Dependencies pulled in only for a dropped module go with it.
    auto prune_orphans = [&](size_t idx) {
        std::vector<size_t> stack{idx};
        while(!stack.empty()) {
            size_t cur = stack.back();
            stack.pop_back();
            for(const auto& dep : mods[cur].dependencies) {
                size_t d = registry_.at(dep).registration_index;
                if(!retained[d] || seeds[d] || dependents[d] != 0) continue;
                if(mods[d].category == ModuleCategory::Core) continue;
                drop(d, "orphaned dependency of '" + mods[cur].id + "'");
                stack.push_back(d);
            }
        }
    };

    // Explicitly requested modules are only considered once nothing else is droppable.
    auto pick_candidate = [&](bool allow_explicit) {
        size_t best = mods.size();
        for(size_t i : order) {
            if(!retained[i] || dependents[i] != 0) continue;
            if(mods[i].category == ModuleCategory::Core) continue;
            if(explicit_mask[i] && !allow_explicit) continue;
            if(best == mods.size()) { best = i; continue; }
            int pc = category_priority(mods[i].category), pb = category_priority(mods[best].category);
            if(pc > pb || (pc == pb && i > best)) best = i;
        }
        return best;
    };

    while(over_budget() || over_cap()) {
        size_t best = pick_candidate(false);
        if(best == mods.size()) best = pick_candidate(true);
        if(best == mods.size()) break;
        std::string reason = over_budget()
            ? "token budget " + std::to_string(*criteria.token_budget) + " exceeded (total " + std::to_string(total) + ")"
            : "module cap " + std::to_string(*criteria.max_modules) + " exceeded (count " + std::to_string(count) + ")";
        drop(best, reason);
        prune_orphans(best);
    }

    if(over_budget()) {
        std::vector<std::string> required;
        for(size_t i : order) if(retained[i]) required.push_back(mods[i].id);
        throw BudgetInfeasibleError(*criteria.token_budget, total, std::move(required));
    }
    if(over_cap()) {
        plan.warnings.push_back("module cap " + std::to_string(*criteria.max_modules) + " not reachable: " +
                                std::to_string(count) + " modules are core or required dependencies");
    }

    for(size_t i : order) if(retained[i]) plan.ordered_modules.push_back(&mods[i]);
    plan.total_tokens = total;
    Logger::instance().debug("resolved " + std::to_string(plan.ordered_modules.size()) + " modules, " +
                             std::to_string(total) + " tokens");
    return plan;
}

}
