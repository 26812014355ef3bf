#include "ArgumentParser.h"
#include "Errors.h"
#include "Utils.h"
#include <iostream>

namespace revkit {

namespace {
void append_csv(std::vector<std::string>& dst, const std::string& v) {
    for(auto& s : utils::split_csv(v)) dst.push_back(std::move(s));
}
}

ArgumentParser::ArgumentParser() {
    specs_ = {
        {"--manifest", ArgKind::String, "Module manifest (default $REVKIT_MANIFEST)", [](Config& c, const std::string& v){ c.manifest_file = v; }},
        {"--content-dir", ArgKind::String, "Directory holding <id>.md module content", [](Config& c, const std::string& v){ c.content_dir = v; }},
        {"--output", ArgKind::String, "Write result to FILE (default stdout)", [](Config& c, const std::string& v){ c.output_file = v; }},
        {"--explicit", ArgKind::CSV, "Module ids to include", [](Config& c, const std::string& v){ append_csv(c.explicit_ids, v); }},
        {"--explicit-file", ArgKind::String, "File with module ids, one per line", [](Config& c, const std::string& v){ c.explicit_file = v; }},
        {"--goal", ArgKind::CSV, "Goal tags; modules carrying any tag are included", [](Config& c, const std::string& v){ append_csv(c.goal_tags, v); }},
        {"--preset", ArgKind::CSV, "Named goals from the manifest catalog", [](Config& c, const std::string& v){ append_csv(c.presets, v); }},
        {"--budget", ArgKind::Int, "Token budget", [](Config& c, const std::string& v){ long long n = 0; utils::parse_int64(v, n); c.token_budget = n; }},
        {"--max-modules", ArgKind::Int, "Cap on optional modules in the plan", [](Config& c, const std::string& v){ long long n = 0; utils::parse_int64(v, n); c.max_modules = n; }},
        {"--save-plan", ArgKind::String, "Also write the resolved plan file to FILE", [](Config& c, const std::string& v){ c.save_plan_file = v; }},
        {"--plan", ArgKind::String, "Plan file to compose", [](Config& c, const std::string& v){ c.plan_file = v; }},
        {"--report", ArgKind::String, "compose: write the composition manifest to FILE", [](Config& c, const std::string& v){ c.report_file = v; }},
        {"--session", ArgKind::String, "Findings file to score", [](Config& c, const std::string& v){ c.session_file = v; }},
        {"--fail-on", ArgKind::String, "Exit 1 if any finding is at or above P0..P3", [](Config& c, const std::string& v){ c.fail_on_severity = v; }},
        {"--tag", ArgKind::String, "list: only modules with TAG", [](Config& c, const std::string& v){ c.list_tag = v; }},
        {"--category", ArgKind::String, "list: only modules of CATEGORY", [](Config& c, const std::string& v){ c.list_category = v; }},
        {"--goals", ArgKind::None, "list: show the goal catalog", [](Config& c, const std::string&){ c.list_goals = true; }},
        {"--json", ArgKind::None, "Emit JSON", [](Config& c, const std::string&){ c.json = true; }},
        {"--pretty", ArgKind::None, "Pretty-print JSON", [](Config& c, const std::string&){ c.pretty = true; }},
        {"--compact", ArgKind::None, "Minified JSON output", [](Config& c, const std::string&){ c.compact = true; }},
        {"--log-level", ArgKind::String, "error|warn|info|debug|trace", [](Config& c, const std::string& v){ c.log_level = v; }},
        {"--verbose", ArgKind::None, "Debug logging", [](Config& c, const std::string&){ c.verbose = true; }},
        {"--quiet", ArgKind::None, "Errors only", [](Config& c, const std::string&){ c.quiet = true; }},
    };
}

const ArgumentParser::FlagSpec* ArgumentParser::find_spec(const std::string& flag) const {
    for(const auto& s : specs_) if(flag == s.name) return &s;
    return nullptr;
}

bool ArgumentParser::fail(const std::string& msg) {
    std::cerr << msg << "\n";
    exit_code_ = static_cast<int>(ExitCode::Usage);
    return false;
}

bool ArgumentParser::parse(int argc, char** argv, Config& cfg) {
    help_ = version_ = false;
    exit_code_ = 0;
    for(int i = 1; i < argc; ++i) {
        if(!argv[i]) continue;
        std::string a = argv[i];
        if(a == "--help" || a == "-h") { help_ = true; return false; }
        if(a == "--version") { version_ = true; return false; }
        if(a.rfind("--", 0) != 0) {
            if(!cfg.command.empty()) return fail("Unexpected argument: " + a);
            cfg.command = a;
            continue;
        }
        const FlagSpec* spec = find_spec(a);
        if(!spec) return fail("Unknown arg: " + a);
        std::string val;
        if(spec->kind != ArgKind::None) {
            if(i + 1 >= argc || !argv[i + 1]) return fail("Missing value for " + a);
            val = argv[++i];
            if(spec->kind == ArgKind::Int) {
                long long n = 0;
                if(!utils::parse_int64(val, n)) return fail("Invalid integer for " + a + ": " + val);
            }
        }
        spec->apply(cfg, val);
    }
    return true;
}

void ArgumentParser::print_help(std::ostream& os) const {
    os << "options:\n";
    for(const auto& s : specs_) {
        std::string name = s.name;
        if(s.kind == ArgKind::String) name += " VALUE";
        else if(s.kind == ArgKind::Int) name += " N";
        else if(s.kind == ArgKind::CSV) name += " a,b,...";
        os << "  " << name;
        if(name.size() < 30) for(size_t i = name.size(); i < 30; ++i) os << ' '; else os << ' ';
        os << s.help << "\n";
    }
    os << "  --version                     Print version & exit\n";
    os << "  --help                        Show this help\n";
}

}
