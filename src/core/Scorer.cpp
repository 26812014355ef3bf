#include "Scorer.h"
#include "ModuleRegistry.h"
#include "Errors.h"
#include "Logging.h"
#include <algorithm>

namespace revkit {

size_t ScoreReport::count(Severity s) const {
    auto it = counts_by_severity.find(s);
    return it == counts_by_severity.end() ? 0 : it->second;
}

bool ScoreReport::has_at_least(Severity threshold) const {
    for(const auto& kv : counts_by_severity) {
        if(kv.second > 0 && severity_at_least(kv.first, threshold)) return true;
    }
    return false;
}

void FindingsAggregator::record_finding(ReviewSession& session, Finding finding) const {
    if(session.finalized()) throw SessionClosedError(session.name());
    if(!registry_.contains(finding.module_id)) throw UnknownModuleError({finding.module_id});
    Logger::instance().trace("finding " + std::string(severity_to_string(finding.severity)) + " on " + finding.module_id);
    session.append(std::move(finding));
}

ScoreReport FindingsAggregator::finalize(ReviewSession& session) const {
    session.close();
    ScoreReport report = score(session);
    Logger::instance().debug("session " + session.name() + " finalized: " + std::to_string(report.total_findings) +
                             " findings, risk " + risk_level_to_string(report.risk_level));
    return report;
}

ScoreReport FindingsAggregator::score(const ReviewSession& session) const {
    ScoreReport r;
    r.session_name = session.name();
    for(int i = 0; i < kSeverityCount; ++i) r.counts_by_severity[static_cast<Severity>(i)] = 0;

    // module id -> failing (P0..P2) findings, for checklist modules only
    std::map<std::string, long long> checklist_failing;
    for(const auto& f : session.findings()) {
        ++r.counts_by_severity[f.severity];
        ++r.total_findings;
        ++r.findings_by_module[f.module_id];
        if(!f.category.empty()) ++r.findings_by_category[f.category];

        const Module* m = registry_.find(f.module_id);
        if(!m || m->category != ModuleCategory::Checklist || !m->checklist_items || *m->checklist_items <= 0) continue;
        long long& failing = checklist_failing[m->id];
        if(f.severity != Severity::P3) ++failing;
    }

    for(const auto& kv : checklist_failing) {
        const Module& m = registry_.at(kv.first);
        r.checklist_items_total += *m.checklist_items;
        r.checklist_items_failing += std::min(kv.second, *m.checklist_items);
    }
    if(r.checklist_items_total > 0) {
        r.checklist_percentage = static_cast<double>(r.checklist_items_total - r.checklist_items_failing) /
                                 static_cast<double>(r.checklist_items_total) * 100.0;
    }

    r.risk_level = RiskLevel::Low;
    for(int i = 0; i < kSeverityCount; ++i) {
        Severity s = static_cast<Severity>(i);
        if(r.count(s) > 0) { r.risk_level = risk_level_for(s); break; }
    }
    return r;
}

}
