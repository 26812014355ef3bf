#pragma once
#include <string>
#include <vector>
#include <set>
#include <optional>
#include <cstddef>

namespace revkit {

// Declaration order is drop priority in reverse: checklist modules go first.
enum class ModuleCategory { Core = 0, Specialized = 1, TechStack = 2, Checklist = 3 };

const char* category_to_string(ModuleCategory c);
std::optional<ModuleCategory> parse_category(const std::string& text);
inline int category_priority(ModuleCategory c) { return static_cast<int>(c); }

struct Module {
    std::string id;
    std::string title;
    ModuleCategory category = ModuleCategory::Core;
    long long token_estimate = 0;
    std::vector<std::string> dependencies; // declaration order, no duplicates
    std::set<std::string> tags;
    std::optional<long long> checklist_items;
    size_t registration_index = 0; // assigned by ModuleRegistry

    bool has_tag(const std::string& tag) const { return tags.count(tag) != 0; }
};

}
