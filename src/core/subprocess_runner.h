#pragma once

#include "process_runner.h"
#include <chrono>

namespace nanoflow::core {

struct SubprocessOptions {
    size_t tail_bytes = 4096;                        // Per stream
    std::chrono::milliseconds kill_grace{2000};      // SIGTERM -> SIGKILL delay
    std::chrono::milliseconds poll_interval{100};
};

// POSIX fork/exec runner. Each child leads its own process group so a
// timeout or cancellation terminates the whole tree.
class SubprocessRunner : public IProcessRunner {
public:
    explicit SubprocessRunner(SubprocessOptions options = {});

    ProcessOutcome run(const ExecutionPlan& plan,
                       const std::vector<std::string>& args,
                       std::chrono::milliseconds timeout,
                       const CancellationToken& cancel) override;

    const SubprocessOptions& options() const { return options_; }

private:
    SubprocessOptions options_;
};

} // namespace nanoflow::core
