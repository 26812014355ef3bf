#pragma once
#include "Plan.h"
#include <string>
#include <vector>
#include <optional>

namespace revkit {

struct Config {
    std::string command; // resolve | compose | score | list | validate
    std::string manifest_file; // falls back to $REVKIT_MANIFEST
    std::string content_dir;   // default <manifest dir>/modules
    std::string output_file;   // default stdout
    // Selection (resolve)
    std::vector<std::string> explicit_ids;
    std::string explicit_file; // newline-delimited ids, '#' comments
    std::vector<std::string> goal_tags;
    std::vector<std::string> presets;
    std::optional<long long> token_budget;
    std::optional<long long> max_modules;
    std::string save_plan_file;
    // compose / score
    std::string plan_file;
    std::string report_file; // compose: composition manifest destination
    std::string session_file;
    std::string fail_on_severity; // exit 1 if any finding at or above
    // list
    std::string list_tag;
    std::string list_category;
    bool list_goals = false;
    // Output
    bool json = false;
    bool pretty = false;
    bool compact = false; // wins over pretty
    std::string log_level; // empty = info unless --verbose/--quiet
    bool verbose = false;
    bool quiet = false;
};

SelectionCriteria to_criteria(const Config& cfg);

}
