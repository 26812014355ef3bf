#include "Config.h"

namespace revkit {

SelectionCriteria to_criteria(const Config& cfg) {
    SelectionCriteria c;
    c.explicit_ids = cfg.explicit_ids;
    c.goal_tags = cfg.goal_tags;
    c.presets = cfg.presets;
    c.token_budget = cfg.token_budget;
    if(cfg.max_modules) c.max_modules = static_cast<size_t>(*cfg.max_modules);
    return c;
}

}
