#include "Module.h"
#include "Utils.h"
#include <algorithm>
#include <cctype>

namespace revkit {

const char* category_to_string(ModuleCategory c) {
    switch(c) {
        case ModuleCategory::Core: return "core";
        case ModuleCategory::Specialized: return "specialized";
        case ModuleCategory::TechStack: return "tech_stack";
        case ModuleCategory::Checklist: return "checklist";
    }
    return "core";
}

std::optional<ModuleCategory> parse_category(const std::string& text) {
    std::string s = utils::trim(text);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    std::replace(s.begin(), s.end(), '-', '_');
    if(s == "core") return ModuleCategory::Core;
    if(s == "specialized") return ModuleCategory::Specialized;
    if(s == "tech_stack" || s == "techstack") return ModuleCategory::TechStack;
    if(s == "checklist") return ModuleCategory::Checklist;
    return std::nullopt;
}

}
