#pragma once

#include "cli/parser.h"
#include "core/output/output.h"
#include <memory>

namespace nanoflow::cli::commands {

// nanoflow status: print the checkpointed state of a run
class StatusCommand {
public:
    explicit StatusCommand(std::shared_ptr<core::output::IOutput> output);

    int execute(const ParsedArgs& args);

private:
    std::shared_ptr<core::output::IOutput> output_;
};

} // namespace nanoflow::cli::commands
