#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace revkit {

// Process exit codes surfaced by the CLI.
enum class ExitCode : int {
    Ok = 0,
    ThresholdReached = 1,
    BudgetInfeasible = 2,
    InvalidManifest = 3,
    UnknownModule = 4,
    Usage = 5,
    Runtime = 6
};

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
    virtual ExitCode exit_code() const { return ExitCode::Runtime; }
};

class DuplicateIdError : public Error {
public:
    explicit DuplicateIdError(std::string id);
    const std::string& id() const { return id_; }
    ExitCode exit_code() const override { return ExitCode::InvalidManifest; }
private:
    std::string id_;
};

class InvalidModuleError : public Error {
public:
    InvalidModuleError(std::string id, const std::string& reason);
    const std::string& id() const { return id_; }
    ExitCode exit_code() const override { return ExitCode::InvalidManifest; }
private:
    std::string id_;
};

class InvalidDependencyError : public Error {
public:
    InvalidDependencyError(std::string module_id, std::vector<std::string> missing);
    const std::string& module_id() const { return module_id_; }
    const std::vector<std::string>& missing() const { return missing_; }
    ExitCode exit_code() const override { return ExitCode::InvalidManifest; }
private:
    std::string module_id_;
    std::vector<std::string> missing_;
};

class CyclicDependencyError : public Error {
public:
    explicit CyclicDependencyError(std::vector<std::string> cycle);
    // First and last element are the same id: [A, B, A].
    const std::vector<std::string>& cycle() const { return cycle_; }
    ExitCode exit_code() const override { return ExitCode::InvalidManifest; }
private:
    std::vector<std::string> cycle_;
};

class RegistrySealedError : public Error {
public:
    explicit RegistrySealedError(std::string id);
    const std::string& id() const { return id_; }
private:
    std::string id_;
};

class UnknownModuleError : public Error {
public:
    explicit UnknownModuleError(std::vector<std::string> ids);
    const std::vector<std::string>& ids() const { return ids_; }
    ExitCode exit_code() const override { return ExitCode::UnknownModule; }
private:
    std::vector<std::string> ids_;
};

class UnknownGoalError : public Error {
public:
    explicit UnknownGoalError(std::string name);
    const std::string& name() const { return name_; }
    ExitCode exit_code() const override { return ExitCode::UnknownModule; }
private:
    std::string name_;
};

class BudgetInfeasibleError : public Error {
public:
    BudgetInfeasibleError(long long budget, long long minimum_total, std::vector<std::string> required);
    long long budget() const { return budget_; }
    long long minimum_total() const { return minimum_total_; }
    // Modules that could not be removed, in plan order.
    const std::vector<std::string>& required() const { return required_; }
    ExitCode exit_code() const override { return ExitCode::BudgetInfeasible; }
private:
    long long budget_;
    long long minimum_total_;
    std::vector<std::string> required_;
};

class SessionClosedError : public Error {
public:
    explicit SessionClosedError(const std::string& session_name);
};

class FormatError : public Error {
public:
    FormatError(std::string file, size_t line, const std::string& detail);
    const std::string& file() const { return file_; }
    size_t line() const { return line_; }
    ExitCode exit_code() const override { return ExitCode::InvalidManifest; }
private:
    std::string file_;
    size_t line_;
};

class ContentLoadError : public Error {
public:
    ContentLoadError(std::string id, const std::string& detail);
    const std::string& id() const { return id_; }
private:
    std::string id_;
};

}
