#pragma once
#include "Command.h"

namespace revkit {

class ResolveCommand : public Command {
public:
    std::string name() const override { return "resolve"; }
    std::string description() const override { return "Resolve a selection into an ordered, budget-fitting plan"; }
    int run(CommandContext& context) override;
};

}
