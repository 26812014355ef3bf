#pragma once
#include "Command.h"

namespace revkit {

class ScoreCommand : public Command {
public:
    std::string name() const override { return "score"; }
    std::string description() const override { return "Finalize a findings file into a score report"; }
    int run(CommandContext& context) override;
};

}
