#pragma once
#include "Plan.h"
#include <string>
#include <ostream>

namespace revkit {

class ModuleRegistry;

namespace planio {

constexpr int kPlanVersion = 1;

// Plan file: plan_version, total_tokens, then module=, dropped=, warning= lines.
void write_plan(const ExecutionPlan& plan, std::ostream& os);
std::string plan_to_string(const ExecutionPlan& plan);

// Re-validates ids against the registry and the dependency-order invariant.
ExecutionPlan parse_plan(const std::string& text, const std::string& source, const ModuleRegistry& registry);
ExecutionPlan read_plan(const std::string& path, const ModuleRegistry& registry);

}
}
