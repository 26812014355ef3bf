#pragma once
#include "Command.h"
#include <vector>
#include <ostream>
#include <string>

namespace revkit {

class CommandRegistry {
public:
    void register_command(CommandPtr command);
    void register_all_default();

    Command* find(const std::string& name) const;
    const std::vector<CommandPtr>& commands() const { return commands_; }

    // Runs one command, mapping errors to exit codes.
    int run(const std::string& name, CommandContext& context);

    // Loads and seals the manifest named by cfg, then runs cfg.command.
    int execute(const Config& cfg, std::ostream& out);

    // Like execute, but the output file is only replaced when the command
    // finishes with Ok or ThresholdReached.
    int execute_to_file(const Config& cfg, const std::string& path);

    void print_commands(std::ostream& os) const;

private:
    std::vector<CommandPtr> commands_;
};

}
