#pragma once

#include "artifact_validator.h"
#include "cancellation.h"
#include "checkpoint_store.h"
#include "output/output.h"
#include "process_runner.h"
#include "run_state.h"
#include "runtime_context.h"
#include "stage_registry.h"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace nanoflow::core {

// Process exit codes of a run
inline constexpr int kExitSucceeded = 0;
inline constexpr int kExitFailed = 1;           // Retries exhausted, persistence failure
inline constexpr int kExitConfiguration = 2;
inline constexpr int kExitCanceled = 3;         // Partially completed after cancellation

struct OrchestratorOptions {
    int max_attempts = 3;
    std::chrono::milliseconds backoff{10000};
    std::chrono::milliseconds default_timeout{std::chrono::hours(24)};
    std::map<std::string, std::chrono::milliseconds> stage_timeouts;
    size_t diagnostic_bytes = 4096;
    bool dry_run = false;
    std::filesystem::path working_dir;          // Child cwd; current directory if empty
};

// A rendered command line (dry-run and verbose output)
struct PlannedCommand {
    std::string stage;
    std::string context_id;
    std::string executable;
    std::vector<std::string> args;
    std::optional<std::string> stdout_path;

    // Shell-quoted form for display
    std::string command_line() const;

    nlohmann::json to_json() const;
};

// Outcome of one orchestrator invocation
struct RunReport {
    std::string run_id;
    RunStatus status = RunStatus::Pending;
    int exit_code = kExitSucceeded;
    bool dry_run = false;

    std::vector<StageResult> attempts;          // Recorded during this invocation
    std::vector<std::string> skipped_stages;    // Already complete from an earlier invocation

    std::optional<std::string> failed_stage;
    int failed_attempts = 0;
    std::optional<std::string> error_kind;      // Outcome name or "persistence_error"
    std::optional<std::string> error;
    std::string diagnostics;                    // Tail of the failing attempt's output

    std::optional<std::filesystem::path> final_artifact;
    std::int64_t duration_ms = 0;

    std::vector<PlannedCommand> planned_commands;   // Dry-run only

    bool succeeded() const { return status == RunStatus::Succeeded; }

    nlohmann::json to_json() const;
};

// Drives one pipeline run: sequencing, context switching, validation,
// retries and checkpointing. Single control thread.
class Orchestrator {
public:
    Orchestrator(const StageRegistry& registry,
                 RuntimeContextResolver& resolver,
                 IProcessRunner& runner,
                 const CheckpointStore& store,
                 std::map<std::string, std::string> tools,
                 RunParameters params,
                 OrchestratorOptions options);

    // Run or resume. Never throws for stage, configuration or persistence
    // failures; those are reported through the RunReport.
    RunReport run(const std::string& run_id,
                  const CancellationToken& cancel,
                  std::shared_ptr<output::IOutput> output = nullptr);

    // Commands the next run would execute, without spawning or writing state
    RunReport plan(const std::string& run_id) const;

    const OrchestratorOptions& options() const { return options_; }

private:
    const StageRegistry& registry_;
    RuntimeContextResolver& resolver_;
    IProcessRunner& runner_;
    const CheckpointStore& store_;
    std::map<std::string, std::string> tools_;
    RunParameters params_;
    OrchestratorOptions options_;
    ArtifactValidator validator_;

    std::string executable_for(const std::string& tool) const;
    std::chrono::milliseconds timeout_for(const std::string& stage) const;
    std::filesystem::path working_dir() const;

    // Stage names in execution order
    std::vector<const StageDescriptor*> ordered_stages() const;

    StageResult run_attempt(const StageDescriptor& stage, int attempt,
                            const CancellationToken& cancel,
                            output::IOutput* output);

    void prepare_outputs(const StageDescriptor& stage) const;
    std::string diagnostics_of(const ProcessOutcome& outcome, const std::string& context_id) const;

    // False if canceled before the delay elapsed
    bool wait_backoff(const CancellationToken& cancel) const;

    std::optional<std::filesystem::path> final_artifact() const;
};

} // namespace nanoflow::core
