#pragma once
#include "ReviewSession.h"
#include <string>

namespace revkit {

class FindingsAggregator;

// Replays a findings file into a fresh session through the aggregator.
//
//   session=payments-review
//   module=owasp-core
//   severity=P1
//   category=injection
//   description=Unparameterized query
//   location=src/db/query.cpp:88
class SessionLoader {
public:
    explicit SessionLoader(const FindingsAggregator& aggregator) : aggregator_(aggregator) {}

    ReviewSession load_text(const std::string& text, const std::string& source) const;
    ReviewSession load_file(const std::string& path) const;

private:
    const FindingsAggregator& aggregator_;
};

}
