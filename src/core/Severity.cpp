#include "Severity.h"
#include "Utils.h"

namespace revkit {

const char* severity_to_string(Severity s) {
    switch(s) {
        case Severity::P0: return "P0";
        case Severity::P1: return "P1";
        case Severity::P2: return "P2";
        case Severity::P3: return "P3";
    }
    return "P3";
}

std::optional<Severity> parse_severity(const std::string& text) {
    std::string s = utils::trim(text);
    if(s.size() != 2 || (s[0] != 'P' && s[0] != 'p')) return std::nullopt;
    switch(s[1]) {
        case '0': return Severity::P0;
        case '1': return Severity::P1;
        case '2': return Severity::P2;
        case '3': return Severity::P3;
        default: return std::nullopt;
    }
}

const char* risk_level_to_string(RiskLevel r) {
    switch(r) {
        case RiskLevel::Critical: return "Critical";
        case RiskLevel::High: return "High";
        case RiskLevel::Medium: return "Medium";
        case RiskLevel::Low: return "Low";
    }
    return "Low";
}

RiskLevel risk_level_for(Severity worst) {
    switch(worst) {
        case Severity::P0: return RiskLevel::Critical;
        case Severity::P1: return RiskLevel::High;
        case Severity::P2: return RiskLevel::Medium;
        case Severity::P3: return RiskLevel::Low;
    }
    return RiskLevel::Low;
}

}
