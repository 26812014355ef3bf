#include "ResolveCommand.h"
#include "../core/Config.h"
#include "../core/Errors.h"
#include "../core/JSONWriter.h"
#include "../core/Logging.h"
#include "../core/PlanIO.h"
#include "../core/Resolver.h"
#include "../core/TextWriter.h"
#include "../core/Utils.h"

namespace revkit {

int ResolveCommand::run(CommandContext& context) {
    const auto& cfg = context.config;
    Resolver resolver(context.registry, &context.goals);
    ExecutionPlan plan = resolver.resolve(to_criteria(cfg));
    for(const auto& w : plan.warnings) Logger::instance().warn(w);

    if(!cfg.save_plan_file.empty()) {
        if(!utils::write_file(cfg.save_plan_file, planio::plan_to_string(plan))) {
            throw Error("cannot write plan file: " + cfg.save_plan_file);
        }
        Logger::instance().info("plan written to " + cfg.save_plan_file);
    }

    if(cfg.json) context.out << JSONWriter(cfg.pretty).write(plan);
    else context.out << textwriter::plan(plan);
    return 0;
}

}
