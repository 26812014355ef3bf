#include "commands/CommandRegistry.h"
#include "core/ArgumentParser.h"
#include "core/Config.h"
#include "core/ConfigValidator.h"
#include "core/Errors.h"
#include "core/Logging.h"
#include "BuildInfo.h" // configured header (CMake adds generated dir to include path)
#include <iostream>

using namespace revkit;

static void print_help(const ArgumentParser& parser, const CommandRegistry& commands) {
    std::cout << "usage: revkit <command> --manifest FILE [options]\n";
    commands.print_commands(std::cout);
    parser.print_help(std::cout);
}

int main(int argc, char** argv) {
    Logger::instance().set_level(LogLevel::Info);
    CommandRegistry commands;
    commands.register_all_default();

    Config cfg;
    ArgumentParser parser;
    if(!parser.parse(argc, argv, cfg)) {
        if(parser.help_requested()) { print_help(parser, commands); return 0; }
        if(parser.version_requested()) {
            std::cout << "revkit " << buildinfo::APP_VERSION << " (compiler=" << buildinfo::COMPILER_ID << " "
                      << buildinfo::COMPILER_VERSION << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n";
            return 0;
        }
        print_help(parser, commands);
        return parser.exit_code();
    }

    ConfigValidator validator;
    validator.apply_environment_defaults(cfg);
    if(!validator.validate(cfg) || !validator.load_external_files(cfg)) {
        return static_cast<int>(ExitCode::Usage);
    }
    Logger::instance().set_level(validator.effective_log_level(cfg));

    if(cfg.output_file.empty()) {
        return commands.execute(cfg, std::cout);
    }
    return commands.execute_to_file(cfg, cfg.output_file);
}
