#include "ConfigValidator.h"
#include "Module.h"
#include "Severity.h"
#include "Utils.h"
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace revkit {

bool ConfigValidator::validate(Config& cfg) {
    if(cfg.command.empty()) {
        std::cerr << "No command given (resolve, compose, score, list, validate)\n";
        return false;
    }
    if(cfg.manifest_file.empty()) {
        std::cerr << "--manifest FILE (or REVKIT_MANIFEST) is required\n";
        return false;
    }

    // pretty vs compact: if both set, compact wins
    if(cfg.pretty && cfg.compact) {
        cfg.pretty = false;
    }

    if(cfg.verbose && cfg.quiet) {
        std::cerr << "--verbose and --quiet are mutually exclusive\n";
        return false;
    }
    if(!cfg.log_level.empty()) {
        LogLevel lvl;
        if(!parse_log_level(cfg.log_level, lvl)) {
            std::cerr << "Invalid --log-level value: " << cfg.log_level << "\n";
            return false;
        }
    }

    if(cfg.token_budget && *cfg.token_budget <= 0) {
        std::cerr << "--budget must be positive\n";
        return false;
    }
    if(cfg.max_modules && *cfg.max_modules <= 0) {
        std::cerr << "--max-modules must be positive\n";
        return false;
    }

    if(cfg.command == "compose" && cfg.plan_file.empty()) {
        std::cerr << "compose requires --plan FILE\n";
        return false;
    }
    if(cfg.command == "score" && cfg.session_file.empty()) {
        std::cerr << "score requires --session FILE\n";
        return false;
    }
    if(!validate_severity(cfg.fail_on_severity, "--fail-on")) {
        return false;
    }
    if(!cfg.list_category.empty() && !parse_category(cfg.list_category)) {
        std::cerr << "Invalid --category value: " << cfg.list_category << "\n";
        return false;
    }
    if(!cfg.save_plan_file.empty() && cfg.save_plan_file == cfg.output_file) {
        std::cerr << "--save-plan and --output must name different files\n";
        return false;
    }

    return true;
}

void ConfigValidator::apply_environment_defaults(Config& cfg) {
    if(cfg.manifest_file.empty()) {
        const char* env = std::getenv("REVKIT_MANIFEST");
        if(env && *env) cfg.manifest_file = env;
    }
    if(cfg.content_dir.empty() && !cfg.manifest_file.empty()) {
        std::filesystem::path parent = std::filesystem::path(cfg.manifest_file).parent_path();
        cfg.content_dir = (parent / "modules").string();
    }
}

bool ConfigValidator::load_external_files(Config& cfg) {
    if(cfg.explicit_file.empty()) return true;
    if(!std::filesystem::exists(cfg.explicit_file)) {
        std::cerr << "Cannot open --explicit-file: " << cfg.explicit_file << "\n";
        return false;
    }
    for(const auto& raw : utils::read_lines(cfg.explicit_file)) {
        std::string line = utils::trim(raw);
        if(line.empty() || line[0] == '#') continue;
        cfg.explicit_ids.push_back(line);
    }
    return true;
}

LogLevel ConfigValidator::effective_log_level(const Config& cfg) const {
    LogLevel lvl = LogLevel::Info;
    if(cfg.verbose) lvl = LogLevel::Debug;
    if(cfg.quiet) lvl = LogLevel::Error;
    if(!cfg.log_level.empty()) parse_log_level(cfg.log_level, lvl);
    return lvl;
}

bool ConfigValidator::validate_severity(const std::string& severity, const std::string& flag_name) {
    if(severity.empty()) return true;
    if(!parse_severity(severity)) {
        std::cerr << "Invalid " << flag_name << " value: " << severity << " (expected P0..P3)\n";
        return false;
    }
    return true;
}

}
