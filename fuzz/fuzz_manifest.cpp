#include "core/ManifestLoader.h"
#include "core/Errors.h"
#include "core/Logging.h"
#include <cstdint>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    revkit::Logger::instance().set_level(revkit::LogLevel::Error);
    std::string input(reinterpret_cast<const char*>(data), size);

    revkit::ModuleRegistry registry;
    revkit::GoalCatalog goals;
    try {
        revkit::ManifestLoader().load_text(input, "fuzz", registry, goals);
    } catch (const revkit::Error&) {
        // Rejected manifests are expected; anything else escapes and crashes.
    }
    return 0;
}
