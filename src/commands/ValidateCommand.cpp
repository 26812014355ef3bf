#include "ValidateCommand.h"
#include "../core/Config.h"
#include "../core/ContentLoader.h"
#include "../core/Errors.h"
#include "../core/GoalCatalog.h"
#include "../core/Logging.h"
#include "../core/ModuleRegistry.h"
#include <filesystem>

namespace revkit {

int ValidateCommand::run(CommandContext& context) {
    const auto& cfg = context.config;
    long long total = 0;
    for(const auto& m : context.registry.modules()) total += m.token_estimate;

    size_t missing = 0;
    std::error_code ec;
    if(!cfg.content_dir.empty() && std::filesystem::is_directory(cfg.content_dir, ec)) {
        DirectoryContentLoader loader(cfg.content_dir);
        for(const auto& m : context.registry.modules()) {
            if(!std::filesystem::is_regular_file(loader.path_for(m.id), ec)) {
                Logger::instance().warn("no content for module '" + m.id + "' at " + loader.path_for(m.id));
                ++missing;
            }
        }
    } else {
        Logger::instance().info("content directory " + cfg.content_dir + " not present; skipping content checks");
    }

    context.out << "manifest ok: " << context.registry.size() << " modules, " << context.goals.goals().size()
                << " goals, " << total << " tokens\n";
    if(missing) {
        context.out << missing << " module(s) without content\n";
        return static_cast<int>(ExitCode::Runtime);
    }
    return 0;
}

}
