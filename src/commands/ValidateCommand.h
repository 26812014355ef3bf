#pragma once
#include "Command.h"

namespace revkit {

// The manifest is already loaded and sealed by the time this runs; it
// additionally checks that every module has content in --content-dir.
class ValidateCommand : public Command {
public:
    std::string name() const override { return "validate"; }
    std::string description() const override { return "Check the manifest and module content files"; }
    int run(CommandContext& context) override;
};

}
