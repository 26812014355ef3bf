#pragma once
#include "Config.h"
#include "Logging.h"
#include <string>

namespace revkit {

class ConfigValidator {
public:
    // Normalizes cfg and reports the first problem on stderr.
    bool validate(Config& cfg);

    // $REVKIT_MANIFEST when --manifest is absent; content dir next to the manifest.
    void apply_environment_defaults(Config& cfg);

    // Merges --explicit-file into explicit_ids.
    bool load_external_files(Config& cfg);

    LogLevel effective_log_level(const Config& cfg) const;

private:
    bool validate_severity(const std::string& severity, const std::string& flag_name);
};

}
