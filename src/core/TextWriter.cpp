#include "TextWriter.h"
#include "GoalCatalog.h"
#include "JsonUtil.h"
#include "Utils.h"
#include <sstream>
#include <iomanip>

namespace revkit {
namespace textwriter {

std::string plan(const ExecutionPlan& plan) {
    std::ostringstream os;
    for(const auto* m : plan.ordered_modules) os << m->id << "\n";
    os << "total_tokens=" << plan.total_tokens << "\n";
    return os.str();
}

std::string composition(const CompositionManifest& manifest) {
    std::ostringstream os;
    for(const auto& e : manifest.entries) {
        os << std::left << std::setw(32) << e.id << " declared=" << e.declared_tokens
           << " measured=" << e.measured_tokens << " bytes=" << e.length << "\n";
    }
    os << "declared_tokens=" << manifest.declared_tokens << "\n";
    os << "measured_tokens=" << manifest.measured_tokens << "\n";
    os << "sha256=" << manifest.sha256 << "\n";
    for(const auto& w : manifest.warnings) os << "warning: " << w << "\n";
    return os.str();
}

std::string score(const ScoreReport& report) {
    std::ostringstream os;
    os << "session: " << report.session_name << "\n";
    os << "risk_level: " << risk_level_to_string(report.risk_level) << "\n";
    os << "total_findings: " << report.total_findings << "\n";
    os << "counts_by_severity:\n";
    for(const auto& kv : report.counts_by_severity) os << "  " << severity_to_string(kv.first) << ": " << kv.second << "\n";
    if(report.checklist_percentage) {
        os << "checklist_percentage: " << jsonutil::format_decimal(*report.checklist_percentage)
           << " (" << (report.checklist_items_total - report.checklist_items_failing) << "/"
           << report.checklist_items_total << " items passing)\n";
    } else {
        os << "checklist_percentage: n/a\n";
    }
    if(!report.findings_by_module.empty()) {
        os << "findings_by_module:\n";
        for(const auto& kv : report.findings_by_module) os << "  " << kv.first << ": " << kv.second << "\n";
    }
    return os.str();
}

std::string modules(const std::vector<const Module*>& modules) {
    std::ostringstream os;
    long long total = 0;
    for(const auto* m : modules) {
        os << std::left << std::setw(32) << m->id << std::setw(13) << category_to_string(m->category)
           << std::right << std::setw(7) << m->token_estimate << "  " << m->title;
        if(!m->dependencies.empty()) os << " [deps: " << utils::join(m->dependencies, ",") << "]";
        os << "\n";
        total += m->token_estimate;
    }
    os << modules.size() << " modules, " << total << " tokens\n";
    return os.str();
}

std::string goals(const GoalCatalog& goals) {
    std::ostringstream os;
    for(const auto& g : goals.goals()) {
        os << g.name;
        if(!g.title.empty()) os << " - " << g.title;
        os << "\n";
        if(!g.module_ids.empty()) os << "  modules: " << utils::join(g.module_ids, ",") << "\n";
        if(!g.tags.empty()) os << "  tags: " << utils::join(g.tags, ",") << "\n";
    }
    return os.str();
}

}
}
