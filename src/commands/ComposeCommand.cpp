#include "ComposeCommand.h"
#include "../core/Composer.h"
#include "../core/Config.h"
#include "../core/Errors.h"
#include "../core/JSONWriter.h"
#include "../core/Logging.h"
#include "../core/PlanIO.h"
#include "../core/TextWriter.h"
#include "../core/Utils.h"

namespace revkit {

int ComposeCommand::run(CommandContext& context) {
    const auto& cfg = context.config;
    ExecutionPlan plan = planio::read_plan(cfg.plan_file, context.registry);

    DirectoryContentLoader directory(cfg.content_dir);
    Composer composer(loader_ ? *loader_ : static_cast<ContentLoader&>(directory));
    Composition result = composer.compose(plan);

    context.out << result.artifact;

    const auto& man = result.manifest;
    if(!cfg.report_file.empty()) {
        std::string report = cfg.json ? JSONWriter(cfg.pretty).write(man) : textwriter::composition(man);
        if(!utils::write_file(cfg.report_file, report)) throw Error("cannot write report file: " + cfg.report_file);
    }
    Logger::instance().info("composed " + std::to_string(man.entries.size()) + " modules, " +
                            std::to_string(man.artifact_bytes) + " bytes, ~" + std::to_string(man.measured_tokens) +
                            " tokens (declared " + std::to_string(man.declared_tokens) + "), sha256=" + man.sha256);
    return 0;
}

}
