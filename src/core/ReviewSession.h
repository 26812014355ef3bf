#pragma once
#include "Severity.h"
#include <string>
#include <vector>
#include <optional>

namespace revkit {

struct Location {
    std::string file;
    std::optional<long long> line;

    std::string to_string() const;
    // "path" or "path:line"; a trailing ":<digits>" is read as the line.
    static std::optional<Location> parse(const std::string& text);
};

struct Finding {
    std::string module_id;
    Severity severity = Severity::P3;
    std::string category;
    std::string description;
    std::optional<Location> location;
};

enum class SessionStatus { Created, InProgress, Finalized };
const char* session_status_to_string(SessionStatus s);

// Findings recorded by one review flow. Mutated only through
// FindingsAggregator; not internally synchronized.
class ReviewSession {
public:
    explicit ReviewSession(std::string name = "review") : name_(std::move(name)) {}

    const std::string& name() const { return name_; }
    SessionStatus status() const { return status_; }
    bool finalized() const { return status_ == SessionStatus::Finalized; }
    const std::vector<Finding>& findings() const { return findings_; }

private:
    friend class FindingsAggregator;
    void append(Finding finding);
    void close();

    std::string name_;
    SessionStatus status_ = SessionStatus::Created;
    std::vector<Finding> findings_;
};

}
