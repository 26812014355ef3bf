#include "ListCommand.h"
#include "../core/Config.h"
#include "../core/GoalCatalog.h"
#include "../core/JSONWriter.h"
#include "../core/ModuleRegistry.h"
#include "../core/TextWriter.h"

namespace revkit {

int ListCommand::run(CommandContext& context) {
    const auto& cfg = context.config;
    if(cfg.list_goals) {
        if(cfg.json) context.out << JSONWriter(cfg.pretty).write_goals(context.goals);
        else context.out << textwriter::goals(context.goals);
        return 0;
    }

    auto category = parse_category(cfg.list_category);
    std::vector<const Module*> selected;
    auto keep = [&](const Module& m){ return !category || m.category == *category; };
    if(!cfg.list_tag.empty()) {
        for(const auto& m : context.registry.lookup_by_tag(cfg.list_tag)) if(keep(m)) selected.push_back(&m);
    } else {
        for(const auto& m : context.registry.modules()) if(keep(m)) selected.push_back(&m);
    }

    if(cfg.json) context.out << JSONWriter(cfg.pretty).write_modules(selected);
    else context.out << textwriter::modules(selected);
    return 0;
}

}
