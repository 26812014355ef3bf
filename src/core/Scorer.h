#pragma once
#include "ReviewSession.h"
#include "Severity.h"
#include <map>
#include <string>
#include <optional>
#include <cstddef>

namespace revkit {

class ModuleRegistry;

struct ScoreReport {
    std::string session_name;
    std::map<Severity, size_t> counts_by_severity; // always holds P0..P3
    size_t total_findings = 0;
    // Present only when the session touched checklist modules with an item count.
    std::optional<double> checklist_percentage;
    long long checklist_items_total = 0;
    long long checklist_items_failing = 0;
    RiskLevel risk_level = RiskLevel::Low;
    std::map<std::string, size_t> findings_by_module;
    std::map<std::string, size_t> findings_by_category;

    size_t count(Severity s) const;
    // True when any finding is at least as urgent as threshold.
    bool has_at_least(Severity threshold) const;
};

class FindingsAggregator {
public:
    explicit FindingsAggregator(const ModuleRegistry& registry) : registry_(registry) {}

    // Throws SessionClosedError after finalize, UnknownModuleError for unregistered ids.
    void record_finding(ReviewSession& session, Finding finding) const;
    // Closes the session (once) and scores it.
    ScoreReport finalize(ReviewSession& session) const;

private:
    ScoreReport score(const ReviewSession& session) const;

    const ModuleRegistry& registry_;
};

}
