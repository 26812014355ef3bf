#pragma once
#include "Plan.h"
#include "Composer.h"
#include "Scorer.h"
#include <string>
#include <vector>

namespace revkit {

class GoalCatalog;

// Plain-text renderings used when --json is not requested.
namespace textwriter {

std::string plan(const ExecutionPlan& plan);
std::string composition(const CompositionManifest& manifest);
std::string score(const ScoreReport& report);
std::string modules(const std::vector<const Module*>& modules);
std::string goals(const GoalCatalog& goals);

}
}
