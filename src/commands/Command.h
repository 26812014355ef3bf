#pragma once
#include <string>
#include <memory>
#include <ostream>

namespace revkit {

struct Config;
class ModuleRegistry;
class GoalCatalog;

// Everything a command needs: parsed config, the sealed registry and goal
// catalog loaded from the manifest, and the primary output stream.
struct CommandContext {
    CommandContext(const Config& cfg, const ModuleRegistry& reg, const GoalCatalog& g, std::ostream& o)
        : config(cfg), registry(reg), goals(g), out(o) {}

    const Config& config;
    const ModuleRegistry& registry;
    const GoalCatalog& goals;
    std::ostream& out;
};

class Command {
public:
    virtual ~Command() = default;
    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
    // Returns the process exit code; taxonomy errors propagate as exceptions.
    virtual int run(CommandContext& context) = 0;
};

using CommandPtr = std::unique_ptr<Command>;

}
