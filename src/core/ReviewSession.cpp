#include "ReviewSession.h"
#include "Errors.h"
#include "Utils.h"

namespace revkit {

std::string Location::to_string() const {
    return line ? file + ":" + std::to_string(*line) : file;
}

std::optional<Location> Location::parse(const std::string& text) {
    std::string s = utils::trim(text);
    if(s.empty()) return std::nullopt;
    Location loc;
    auto colon = s.rfind(':');
    long long n = 0;
    if(colon != std::string::npos && colon + 1 < s.size() && colon > 0 &&
       s[colon + 1] != '-' && s[colon + 1] != '+' && utils::parse_int64(s.substr(colon + 1), n) && n > 0) {
        loc.file = s.substr(0, colon);
        loc.line = n;
    } else {
        loc.file = s;
    }
    return loc;
}

const char* session_status_to_string(SessionStatus s) {
    switch(s) {
        case SessionStatus::Created: return "created";
        case SessionStatus::InProgress: return "in_progress";
        case SessionStatus::Finalized: return "finalized";
    }
    return "created";
}

void ReviewSession::append(Finding finding) {
    if(status_ == SessionStatus::Finalized) throw SessionClosedError(name_);
    findings_.push_back(std::move(finding));
    status_ = SessionStatus::InProgress;
}

void ReviewSession::close() {
    if(status_ == SessionStatus::Finalized) throw SessionClosedError(name_);
    status_ = SessionStatus::Finalized;
}

}
