#include "PlanIO.h"
#include "ModuleRegistry.h"
#include "RecordReader.h"
#include "Errors.h"
#include "Utils.h"
#include "Logging.h"
#include <sstream>
#include <unordered_set>

namespace revkit {
namespace planio {

void write_plan(const ExecutionPlan& plan, std::ostream& os) {
    os << "# revkit execution plan\n";
    os << "plan_version=" << kPlanVersion << "\n";
    os << "total_tokens=" << plan.total_tokens << "\n";
    for(const auto* m : plan.ordered_modules) os << "module=" << m->id << "\n";
    for(const auto& id : plan.dropped_modules) os << "dropped=" << id << "\n";
    for(const auto& w : plan.warnings) os << "warning=" << w << "\n";
}

std::string plan_to_string(const ExecutionPlan& plan) {
    std::ostringstream os;
    write_plan(plan, os);
    return os.str();
}

ExecutionPlan parse_plan(const std::string& text, const std::string& source, const ModuleRegistry& registry) {
    RecordReader reader({});
    RecordDocument doc = reader.parse(text, source);

    const Field* version = doc.header_get("plan_version");
    long long v = 0;
    if(!version || !utils::parse_int64(version->value, v)) throw FormatError(source, version ? version->line : 0, "missing or invalid plan_version");
    if(v != kPlanVersion) throw FormatError(source, version->line, "unsupported plan_version=" + version->value);

    ExecutionPlan plan;
    std::optional<long long> declared_total;
    std::vector<std::string> unknown;
    std::unordered_set<std::string> seen;
    for(const auto& f : doc.header) {
        if(f.key == "plan_version") continue;
        if(f.key == "total_tokens") {
            long long t = 0;
            if(!utils::parse_int64(f.value, t) || t < 0) throw FormatError(source, f.line, "invalid total_tokens");
            declared_total = t;
        } else if(f.key == "module") {
            if(!seen.insert(f.value).second) throw FormatError(source, f.line, "module listed twice: " + f.value);
            const Module* m = registry.find(f.value);
            if(!m) { unknown.push_back(f.value); continue; }
            plan.ordered_modules.push_back(m);
        } else if(f.key == "dropped") {
            plan.dropped_modules.push_back(f.value);
        } else if(f.key == "warning") {
            plan.warnings.push_back(f.value);
        } else {
            throw FormatError(source, f.line, "unknown plan key '" + f.key + "'");
        }
    }
    if(!unknown.empty()) throw UnknownModuleError(std::move(unknown));

    std::unordered_set<std::string> placed;
    for(const auto* m : plan.ordered_modules) {
        std::vector<std::string> unmet;
        for(const auto& dep : m->dependencies) if(!placed.count(dep)) unmet.push_back(dep);
        if(!unmet.empty()) throw InvalidDependencyError(m->id, std::move(unmet));
        placed.insert(m->id);
        plan.total_tokens += m->token_estimate;
    }
    if(declared_total && *declared_total != plan.total_tokens) {
        std::string msg = "plan declares total_tokens=" + std::to_string(*declared_total) +
                          " but registry estimates sum to " + std::to_string(plan.total_tokens);
        Logger::instance().warn(msg);
        plan.warnings.push_back(msg);
    }
    return plan;
}

ExecutionPlan read_plan(const std::string& path, const ModuleRegistry& registry) {
    auto text = utils::read_file(path);
    if(!text) throw Error("cannot read plan file: " + path);
    return parse_plan(*text, path, registry);
}

}
}
