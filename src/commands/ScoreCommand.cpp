#include "ScoreCommand.h"
#include "../core/Config.h"
#include "../core/Errors.h"
#include "../core/JSONWriter.h"
#include "../core/Logging.h"
#include "../core/Scorer.h"
#include "../core/SessionLoader.h"
#include "../core/TextWriter.h"

namespace revkit {

int ScoreCommand::run(CommandContext& context) {
    const auto& cfg = context.config;
    FindingsAggregator aggregator(context.registry);
    ReviewSession session = SessionLoader(aggregator).load_file(cfg.session_file);
    ScoreReport report = aggregator.finalize(session);

    if(cfg.json) context.out << JSONWriter(cfg.pretty).write(report);
    else context.out << textwriter::score(report);

    if(!cfg.fail_on_severity.empty()) {
        auto threshold = parse_severity(cfg.fail_on_severity);
        if(threshold && report.has_at_least(*threshold)) {
            Logger::instance().info(std::string("findings at or above ") + severity_to_string(*threshold) + " present");
            return static_cast<int>(ExitCode::ThresholdReached);
        }
    }
    return 0;
}

}
