#pragma once

#include "cli/parser.h"
#include "core/output/output.h"
#include <memory>

namespace nanoflow::cli::commands {

// nanoflow stages: list stage descriptors with their rendered commands
class StagesCommand {
public:
    explicit StagesCommand(std::shared_ptr<core::output::IOutput> output);

    int execute(const ParsedArgs& args);

private:
    std::shared_ptr<core::output::IOutput> output_;
};

} // namespace nanoflow::cli::commands
