#pragma once
#include "Plan.h"
#include "ContentLoader.h"
#include <string>
#include <vector>
#include <cstddef>

namespace revkit {

struct ComposedEntry {
    std::string id;
    long long declared_tokens = 0;
    long long measured_tokens = 0;
    size_t offset = 0; // byte offset inside the artifact
    size_t length = 0;
};

struct CompositionManifest {
    std::vector<ComposedEntry> entries;
    long long declared_tokens = 0; // plan total
    long long measured_tokens = 0;
    size_t artifact_bytes = 0;
    std::string sha256;
    std::vector<std::string> warnings;
};

struct Composition {
    std::string artifact;
    CompositionManifest manifest;
};

// Concatenates module content in plan order. A measured size more than
// kTokenTolerance above the declared total is reported, never fatal.
class Composer {
public:
    static constexpr double kTokenTolerance = 0.10;
    static constexpr size_t kBytesPerToken = 4;

    explicit Composer(ContentLoader& loader) : loader_(loader) {}

    Composition compose(const ExecutionPlan& plan) const;

    static long long estimate_tokens(const std::string& text);

private:
    ContentLoader& loader_;
};

}
