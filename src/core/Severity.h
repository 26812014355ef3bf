#pragma once
#include <string>
#include <optional>

namespace revkit {

// P0 = fix now, P1 = fix this week, P2 = fix within 30 days, P3 = backlog.
enum class Severity { P0 = 0, P1 = 1, P2 = 2, P3 = 3 };

enum class RiskLevel { Critical, High, Medium, Low };

constexpr int kSeverityCount = 4;

const char* severity_to_string(Severity s);
std::optional<Severity> parse_severity(const std::string& text); // "P0".."P3", case-insensitive

// True when a is as urgent as b or more (P0 outranks P1).
inline bool severity_at_least(Severity a, Severity b) { return static_cast<int>(a) <= static_cast<int>(b); }

const char* risk_level_to_string(RiskLevel r);
RiskLevel risk_level_for(Severity worst);

}
