#pragma once

#include "cli/parser.h"
#include "core/cancellation.h"
#include "core/orchestrator.h"
#include "core/output/output.h"
#include <memory>

namespace nanoflow::cli::commands {

// nanoflow run: build the pipeline from the run configuration and drive it
class RunCommand {
public:
    RunCommand(std::shared_ptr<core::output::IOutput> output, const core::CancellationToken& cancel);

    // Returns the run's exit code
    int execute(const ParsedArgs& args);

private:
    std::shared_ptr<core::output::IOutput> output_;
    const core::CancellationToken& cancel_;

    void print_report(const core::RunReport& report);
};

} // namespace nanoflow::cli::commands
