#pragma once
#include "Plan.h"
#include "Composer.h"
#include "Scorer.h"
#include <string>
#include <vector>

namespace revkit {

class GoalCatalog;

// Canonical JSON (object keys sorted) for every CLI output.
class JSONWriter {
public:
    explicit JSONWriter(bool pretty = false) : pretty_(pretty) {}

    std::string write(const ExecutionPlan& plan) const;
    std::string write(const CompositionManifest& manifest) const;
    std::string write(const ScoreReport& report) const;
    std::string write_modules(const std::vector<const Module*>& modules) const;
    std::string write_goals(const GoalCatalog& goals) const;

private:
    bool pretty_;
};

}
