#pragma once
#include "Command.h"
#include "../core/ContentLoader.h"

namespace revkit {

class ComposeCommand : public Command {
public:
    // Without a loader, module content is read from --content-dir.
    explicit ComposeCommand(ContentLoaderPtr loader = nullptr) : loader_(std::move(loader)) {}

    std::string name() const override { return "compose"; }
    std::string description() const override { return "Concatenate module content for a saved plan"; }
    int run(CommandContext& context) override;

private:
    ContentLoaderPtr loader_;
};

}
