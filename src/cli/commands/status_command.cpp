#include "status_command.h"
#include "cli/config_overrides.h"
#include "core/checkpoint_store.h"
#include "core/errors.h"
#include "core/orchestrator.h"
#include "utils/time_utils.h"
#include <iomanip>
#include <sstream>

namespace nanoflow::cli::commands {

StatusCommand::StatusCommand(std::shared_ptr<core::output::IOutput> output)
    : output_(std::move(output)) {
}

int StatusCommand::execute(const ParsedArgs& args) {
    core::RunConfig config;
    try {
        config = resolve_run_config(args);
    } catch (const core::ConfigurationError& e) {
        output_->error(e.what());
        return core::kExitConfiguration;
    }

    if (config.run_id.empty()) {
        output_->error("--run-id is required");
        return core::kExitConfiguration;
    }
    if (config.output_dir.empty() && !config.checkpoint_dir) {
        output_->error("--output or --checkpoint-dir is required");
        return core::kExitConfiguration;
    }

    core::CheckpointStore store(config.effective_checkpoint_dir());
    std::optional<core::RunState> state;
    try {
        state = store.load(config.run_id);
    } catch (const core::ConfigurationError& e) {
        output_->error(e.what());
        return core::kExitConfiguration;
    } catch (const core::PersistenceError& e) {
        output_->error(e.what());
        return core::kExitFailed;
    }

    if (!state) {
        output_->error("No checkpoint for run '" + config.run_id + "' in " + store.dir().string());
        return core::kExitFailed;
    }

    auto owner = store.lock_owner(config.run_id);

    if (output_->is_json()) {
        auto j = state->to_json();
        if (owner) {
            j["locked_by"] = *owner;
        }
        output_->data(j);
        return core::kExitSucceeded;
    }

    std::ostringstream text;
    text << "Run:     " << state->run_id << "\n";
    text << "Status:  " << core::run_status_to_string(state->status) << "\n";
    if (state->resume_point) {
        text << "Resume:  " << *state->resume_point << "\n";
    }
    text << "Created: " << state->created_at << "\n";
    text << "Updated: " << state->updated_at << "\n";
    if (owner) {
        text << "Locked by pid " << *owner << "\n";
    }
    text << "\n";

    for (const auto& stage : state->stages) {
        const auto* last = state->last_result(stage);
        text << "  " << std::left << std::setw(20) << stage;
        if (!last) {
            text << "pending";
        } else {
            text << std::setw(20) << core::attempt_outcome_to_string(last->outcome)
                 << "attempts " << state->attempts(stage)
                 << ", " << utils::format_elapsed(last->duration_ms);
            if (!last->succeeded() && last->error) {
                text << "\n  " << std::string(20, ' ') << *last->error;
            }
        }
        text << "\n";
    }

    output_->data(state->to_json(), text.str());
    return core::kExitSucceeded;
}

} // namespace nanoflow::cli::commands
