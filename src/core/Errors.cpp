#include "Errors.h"
#include "Utils.h"

namespace revkit {

DuplicateIdError::DuplicateIdError(std::string id)
    : Error("duplicate module id: " + id), id_(std::move(id)) {}

InvalidModuleError::InvalidModuleError(std::string id, const std::string& reason)
    : Error("invalid module '" + id + "': " + reason), id_(std::move(id)) {}

InvalidDependencyError::InvalidDependencyError(std::string module_id, std::vector<std::string> missing)
    : Error("module '" + module_id + "' has invalid dependencies: " + utils::join(missing, ",")),
      module_id_(std::move(module_id)), missing_(std::move(missing)) {}

CyclicDependencyError::CyclicDependencyError(std::vector<std::string> cycle)
    : Error("dependency cycle: " + utils::join(cycle, " -> ")), cycle_(std::move(cycle)) {}

RegistrySealedError::RegistrySealedError(std::string id)
    : Error("registry is sealed; cannot register '" + id + "'"), id_(std::move(id)) {}

UnknownModuleError::UnknownModuleError(std::vector<std::string> ids)
    : Error("unknown module id(s): " + utils::join(ids, ",")), ids_(std::move(ids)) {}

UnknownGoalError::UnknownGoalError(std::string name)
    : Error("unknown goal preset: " + name), name_(std::move(name)) {}

BudgetInfeasibleError::BudgetInfeasibleError(long long budget, long long minimum_total, std::vector<std::string> required)
    : Error("token budget " + std::to_string(budget) + " is infeasible; required modules need at least " +
            std::to_string(minimum_total) + " tokens"),
      budget_(budget), minimum_total_(minimum_total), required_(std::move(required)) {}

SessionClosedError::SessionClosedError(const std::string& session_name)
    : Error("review session '" + session_name + "' is already finalized") {}

FormatError::FormatError(std::string file, size_t line, const std::string& detail)
    : Error(file + ":" + std::to_string(line) + ": " + detail), file_(std::move(file)), line_(line) {}

ContentLoadError::ContentLoadError(std::string id, const std::string& detail)
    : Error("content for module '" + id + "' unavailable: " + detail), id_(std::move(id)) {}

}
