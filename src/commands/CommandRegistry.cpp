#include "CommandRegistry.h"
#include "ResolveCommand.h"
#include "ComposeCommand.h"
#include "ScoreCommand.h"
#include "ListCommand.h"
#include "ValidateCommand.h"
#include "../core/Config.h"
#include "../core/Errors.h"
#include "../core/Logging.h"
#include "../core/ManifestLoader.h"
#include "../core/Utils.h"
#include <sstream>

namespace revkit {

void CommandRegistry::register_command(CommandPtr command) {
    commands_.push_back(std::move(command));
}

void CommandRegistry::register_all_default() {
    register_command(std::make_unique<ResolveCommand>());
    register_command(std::make_unique<ComposeCommand>());
    register_command(std::make_unique<ScoreCommand>());
    register_command(std::make_unique<ListCommand>());
    register_command(std::make_unique<ValidateCommand>());
}

Command* CommandRegistry::find(const std::string& name) const {
    for(const auto& c : commands_) if(c->name() == name) return c.get();
    return nullptr;
}

int CommandRegistry::run(const std::string& name, CommandContext& context) {
    Command* cmd = find(name);
    if(!cmd) {
        Logger::instance().error("unknown command: " + name);
        return static_cast<int>(ExitCode::Usage);
    }
    Logger::instance().debug("Starting command: " + name);
    int rc = 0;
    try {
        rc = cmd->run(context);
    } catch(const Error& ex) {
        Logger::instance().error(name + ": " + ex.what());
        rc = static_cast<int>(ex.exit_code());
    } catch(const std::exception& ex) {
        Logger::instance().error(name + ": " + ex.what());
        rc = static_cast<int>(ExitCode::Runtime);
    }
    Logger::instance().debug("Finished command: " + name + " (exit " + std::to_string(rc) + ")");
    return rc;
}

int CommandRegistry::execute(const Config& cfg, std::ostream& out) {
    if(!find(cfg.command)) {
        Logger::instance().error("unknown command: " + cfg.command);
        return static_cast<int>(ExitCode::Usage);
    }
    ModuleRegistry registry;
    GoalCatalog goals;
    try {
        ManifestLoader().load_file(cfg.manifest_file, registry, goals);
    } catch(const Error& ex) {
        Logger::instance().error("manifest: " + std::string(ex.what()));
        return static_cast<int>(ex.exit_code());
    }
    CommandContext context(cfg, registry, goals, out);
    return run(cfg.command, context);
}

int CommandRegistry::execute_to_file(const Config& cfg, const std::string& path) {
    std::ostringstream buffer;
    int rc = execute(cfg, buffer);
    if(rc != static_cast<int>(ExitCode::Ok) && rc != static_cast<int>(ExitCode::ThresholdReached)) {
        Logger::instance().debug("leaving output file untouched: " + path);
        return rc;
    }
    if(!utils::write_file(path, buffer.str())) {
        Logger::instance().error("failed writing output file: " + path);
        return static_cast<int>(ExitCode::Runtime);
    }
    return rc;
}

void CommandRegistry::print_commands(std::ostream& os) const {
    os << "commands:\n";
    for(const auto& c : commands_) {
        std::string n = c->name();
        os << "  " << n;
        for(size_t i = n.size(); i < 30; ++i) os << ' ';
        os << c->description() << "\n";
    }
}

}
