#pragma once
#include "Command.h"

namespace revkit {

class ListCommand : public Command {
public:
    std::string name() const override { return "list"; }
    std::string description() const override { return "List registered modules (by tag/category) or goals"; }
    int run(CommandContext& context) override;
};

}
