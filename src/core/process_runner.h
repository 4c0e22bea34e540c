#pragma once

#include "cancellation.h"
#include "runtime_context.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace nanoflow::core {

// Result of one external command. A non-zero exit code is data, not an error.
struct ProcessOutcome {
    int exit_code = -1;
    std::string stdout_tail;
    std::string stderr_tail;
    std::chrono::milliseconds duration{0};
    bool timed_out = false;
    bool canceled = false;
    std::optional<std::string> spawn_error;     // Process could not be started

    bool succeeded() const {
        return exit_code == 0 && !timed_out && !canceled && !spawn_error;
    }

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["exit_code"] = exit_code;
        j["duration_ms"] = duration.count();
        j["timed_out"] = timed_out;
        j["canceled"] = canceled;
        if (spawn_error) {
            j["spawn_error"] = *spawn_error;
        }
        j["stdout_tail"] = stdout_tail;
        j["stderr_tail"] = stderr_tail;
        return j;
    }
};

// Runs one external command to completion
class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;

    // Blocks until the child exits, the timeout expires or cancel is requested.
    // The child is always reaped before returning.
    virtual ProcessOutcome run(const ExecutionPlan& plan,
                               const std::vector<std::string>& args,
                               std::chrono::milliseconds timeout,
                               const CancellationToken& cancel) = 0;
};

} // namespace nanoflow::core
