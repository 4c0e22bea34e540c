#include "orchestrator.h"
#include "errors.h"
#include "utils/file_utils.h"
#include "utils/string_utils.h"
#include "utils/time_utils.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <thread>

namespace nanoflow::core {

namespace {

using Clock = std::chrono::steady_clock;

// Granularity at which the retry backoff notices cancellation
constexpr std::chrono::milliseconds kBackoffTick{100};

std::int64_t elapsed_ms(Clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - since).count();
}

} // anonymous namespace

// PlannedCommand

std::string PlannedCommand::command_line() const {
    std::vector<std::string> parts;
    parts.push_back(utils::shell_quote(executable));
    for (const auto& arg : args) {
        parts.push_back(utils::shell_quote(arg));
    }
    auto line = utils::join(parts, " ");
    if (stdout_path) {
        line += " > " + utils::shell_quote(*stdout_path);
    }
    return line;
}

nlohmann::json PlannedCommand::to_json() const {
    nlohmann::json j;
    j["stage"] = stage;
    j["context"] = context_id;
    j["executable"] = executable;
    j["args"] = args;
    if (stdout_path) {
        j["stdout"] = *stdout_path;
    }
    j["command_line"] = command_line();
    return j;
}

// RunReport

nlohmann::json RunReport::to_json() const {
    nlohmann::json j;
    j["run_id"] = run_id;
    j["status"] = run_status_to_string(status);
    j["exit_code"] = exit_code;
    j["dry_run"] = dry_run;
    j["duration_ms"] = duration_ms;
    j["elapsed"] = utils::format_elapsed(duration_ms);

    j["skipped_stages"] = skipped_stages;
    j["attempts"] = nlohmann::json::array();
    for (const auto& a : attempts) {
        j["attempts"].push_back(a.to_json());
    }

    if (failed_stage) {
        j["failed_stage"] = *failed_stage;
        j["failed_attempts"] = failed_attempts;
    }
    if (error_kind) {
        j["error_kind"] = *error_kind;
    }
    if (error) {
        j["error"] = *error;
    }
    if (!diagnostics.empty()) {
        j["diagnostics"] = diagnostics;
    }
    if (final_artifact) {
        j["final_artifact"] = final_artifact->string();
    }
    if (dry_run) {
        j["commands"] = nlohmann::json::array();
        for (const auto& cmd : planned_commands) {
            j["commands"].push_back(cmd.to_json());
        }
    }
    return j;
}

// Orchestrator

Orchestrator::Orchestrator(const StageRegistry& registry,
                           RuntimeContextResolver& resolver,
                           IProcessRunner& runner,
                           const CheckpointStore& store,
                           std::map<std::string, std::string> tools,
                           RunParameters params,
                           OrchestratorOptions options)
    : registry_(registry)
    , resolver_(resolver)
    , runner_(runner)
    , store_(store)
    , tools_(std::move(tools))
    , params_(std::move(params))
    , options_(std::move(options))
    , validator_(registry) {
}

std::string Orchestrator::executable_for(const std::string& tool) const {
    auto it = tools_.find(tool);
    return it != tools_.end() && !it->second.empty() ? it->second : tool;
}

std::chrono::milliseconds Orchestrator::timeout_for(const std::string& stage) const {
    auto it = options_.stage_timeouts.find(stage);
    return it != options_.stage_timeouts.end() ? it->second : options_.default_timeout;
}

std::filesystem::path Orchestrator::working_dir() const {
    if (options_.working_dir.empty()) {
        return std::filesystem::current_path();
    }
    return options_.working_dir;
}

std::vector<const StageDescriptor*> Orchestrator::ordered_stages() const {
    std::vector<const StageDescriptor*> stages;
    const auto& all = registry_.get_ordered_stages();
    for (size_t idx : registry_.execution_order()) {
        stages.push_back(&all[idx]);
    }
    return stages;
}

std::optional<std::filesystem::path> Orchestrator::final_artifact() const {
    auto stages = ordered_stages();
    if (stages.empty() || stages.back()->outputs.empty()) {
        return std::nullopt;
    }
    auto outputs = registry_.outputs_of(*stages.back());
    for (auto it = outputs.rbegin(); it != outputs.rend(); ++it) {
        if (it->kind == ArtifactKind::File) {
            return it->path;
        }
    }
    return outputs.back().path;
}

void Orchestrator::prepare_outputs(const StageDescriptor& stage) const {
    for (const auto& ref : registry_.outputs_of(stage)) {
        if (utils::remove_path(ref.path) > 0) {
            spdlog::debug("Removed stale output {}", ref.path.string());
        }
        auto parent = ref.path.parent_path();
        if (!utils::ensure_directory(parent)) {
            throw ConfigurationError("Cannot create output directory " + parent.string());
        }
    }
}

std::string Orchestrator::diagnostics_of(const ProcessOutcome& outcome,
                                         const std::string& context_id) const {
    std::vector<std::string> filters;
    if (resolver_.has_context(context_id)) {
        filters = resolver_.context(context_id).stderr_filters;
    }

    auto text = utils::filter_lines(outcome.stderr_tail, filters);
    if (utils::trim(text).empty()) {
        text = outcome.stdout_tail;
    }
    if (outcome.spawn_error) {
        text = *outcome.spawn_error + (text.empty() ? "" : "\n" + text);
    }
    return utils::tail(text, options_.diagnostic_bytes);
}

bool Orchestrator::wait_backoff(const CancellationToken& cancel) const {
    auto until = Clock::now() + options_.backoff;
    while (Clock::now() < until) {
        if (cancel.requested()) {
            return false;
        }
        auto left = until - Clock::now();
        std::this_thread::sleep_for(std::min(left, Clock::duration(kBackoffTick)));
    }
    return !cancel.requested();
}

StageResult Orchestrator::run_attempt(const StageDescriptor& stage, int attempt,
                                      const CancellationToken& cancel,
                                      output::IOutput* output) {
    StageResult result;
    result.stage = stage.name;
    result.ordinal = stage.ordinal;
    result.attempt = attempt;
    result.started_at = utils::utc_timestamp();

    const auto start = Clock::now();
    const auto timeout = timeout_for(stage.name);
    const auto deadline = start + timeout;

    auto finish = [&](AttemptOutcome outcome, std::optional<std::string> error) {
        result.outcome = outcome;
        result.error = std::move(error);
        result.finished_at = utils::utc_timestamp();
        result.duration_ms = elapsed_ms(start);
        return result;
    };

    try {
        prepare_outputs(stage);

        for (const auto& step : stage.steps) {
            auto args = registry_.render(step, params_);
            auto plan = resolver_.resolve(stage.context_id, executable_for(step.tool), working_dir());
            plan.stdout_path = registry_.stdout_path(step);

            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
            if (remaining <= std::chrono::milliseconds::zero()) {
                result.timed_out = true;
                return finish(AttemptOutcome::ProcessFailure,
                              "Stage timed out after " + utils::format_elapsed(timeout.count()) +
                              " before running " + step.tool);
            }

            PlannedCommand cmd{stage.name, stage.context_id, plan.executable_path.string(), args,
                               plan.stdout_path ? std::optional<std::string>(plan.stdout_path->string())
                                                : std::nullopt};
            spdlog::debug("[{}] {}", stage.name, cmd.command_line());
            if (output) {
                output->detail("  $ " + cmd.command_line());
            }

            ProcessOutcome outcome;
            {
                ContextGuard guard(resolver_, stage.context_id);
                outcome = runner_.run(plan, args, remaining, cancel);
            }

            result.exit_code = outcome.exit_code;
            result.timed_out = outcome.timed_out;
            result.diagnostics = diagnostics_of(outcome, stage.context_id);

            if (outcome.canceled) {
                return finish(AttemptOutcome::Canceled, step.tool + " was canceled");
            }
            if (outcome.spawn_error) {
                return finish(AttemptOutcome::ProcessFailure,
                              "Failed to start " + step.tool + ": " + *outcome.spawn_error);
            }
            if (outcome.timed_out) {
                return finish(AttemptOutcome::ProcessFailure,
                              step.tool + " timed out (stage limit " + utils::format_elapsed(timeout.count()) + ")");
            }
            if (outcome.exit_code != 0) {
                return finish(AttemptOutcome::ProcessFailure,
                              step.tool + " exited with code " + std::to_string(outcome.exit_code));
            }
        }
    } catch (const ConfigurationError& e) {
        return finish(AttemptOutcome::ConfigurationError, std::string(e.what()));
    } catch (const std::filesystem::filesystem_error& e) {
        return finish(AttemptOutcome::ConfigurationError,
                      std::string("Cannot prepare outputs: ") + e.what());
    }

    auto validation = validator_.validate(stage);
    result.validation = validation;
    if (!validation.ok()) {
        return finish(AttemptOutcome::ValidationFailure,
                      "Tool exited 0 but outputs are invalid: " + validation.describe());
    }
    return finish(AttemptOutcome::Succeeded, std::nullopt);
}

RunReport Orchestrator::run(const std::string& run_id,
                            const CancellationToken& cancel,
                            std::shared_ptr<output::IOutput> output) {
    if (options_.dry_run) {
        return plan(run_id);
    }

    const auto start = Clock::now();
    auto* out = output.get();

    RunReport report;
    report.run_id = run_id;

    auto conclude = [&](RunStatus status, int exit_code) {
        report.status = status;
        report.exit_code = exit_code;
        report.duration_ms = elapsed_ms(start);
        return report;
    };

    RunState state;
    WriterLock lock;

    try {
        auto stages = ordered_stages();
        std::vector<std::string> names;
        for (const auto* stage : stages) {
            names.push_back(stage->name);
        }

        lock = store_.acquire(run_id);

        auto loaded = store_.load(run_id);
        if (loaded) {
            if (loaded->stages != names) {
                report.error_kind = attempt_outcome_to_string(AttemptOutcome::ConfigurationError);
                report.error = "Checkpoint of run '" + run_id + "' was written for stages [" +
                               utils::join(loaded->stages, ", ") + "], this pipeline has [" +
                               utils::join(names, ", ") + "]";
                spdlog::error("{}", *report.error);
                return conclude(RunStatus::Failed, kExitConfiguration);
            }
            state = std::move(*loaded);
            spdlog::info("Resuming run '{}' (previous status: {})", run_id, run_status_to_string(state.status));
        } else {
            state = RunState::fresh(run_id, names);
            spdlog::info("Starting run '{}'", run_id);
        }

        auto first = resume_point(state, names);
        size_t begin = first.value_or(stages.size());
        for (size_t i = 0; i < begin; ++i) {
            report.skipped_stages.push_back(names[i]);
        }
        if (!report.skipped_stages.empty()) {
            spdlog::info("Skipping completed stages: {}", utils::join(report.skipped_stages, ", "));
            if (out) {
                out->info("Skipping completed stages: " + utils::join(report.skipped_stages, ", "));
            }
        }

        state.status = RunStatus::Running;
        state.resume_point = first ? std::optional<std::string>(names[*first]) : std::nullopt;
        state.updated_at = utils::utc_timestamp();
        store_.save(state);

        for (size_t idx = begin; idx < stages.size(); ++idx) {
            const auto& stage = *stages[idx];
            const auto stage_start = Clock::now();
            int attempts_this_run = 0;

            // Record the stop in the checkpoint and the report
            auto stop = [&](RunStatus status, const StageResult* last) {
                state.status = status;
                state.resume_point = stage.name;
                state.updated_at = utils::utc_timestamp();
                store_.save(state);

                report.failed_stage = stage.name;
                report.failed_attempts = attempts_this_run;
                if (last) {
                    report.error_kind = attempt_outcome_to_string(last->outcome);
                    report.error = last->error;
                    report.diagnostics = last->diagnostics;
                }
                if (out) {
                    out->stage_completed(idx + 1, stages.size(), stage.name, elapsed_ms(stage_start), false,
                                         report.error.value_or(""));
                }
            };

            if (cancel.requested()) {
                spdlog::warn("Run canceled before stage {}", stage.name);
                report.error_kind = attempt_outcome_to_string(AttemptOutcome::Canceled);
                report.error = "Run canceled before stage '" + stage.name + "'";
                stop(RunStatus::PartiallyCompleted, nullptr);
                return conclude(RunStatus::PartiallyCompleted, kExitCanceled);
            }

            if (out) {
                out->stage_started(idx + 1, stages.size(), stage.name);
            }
            spdlog::info("Stage {}/{} {} (context '{}')", idx + 1, stages.size(), stage.name, stage.context_id);

            auto inputs = validator_.validate_inputs(stage);
            if (!inputs.ok()) {
                StageResult missing;
                missing.stage = stage.name;
                missing.ordinal = stage.ordinal;
                missing.attempt = state.attempts(stage.name) + 1;
                missing.started_at = utils::utc_timestamp();
                missing.finished_at = missing.started_at;
                missing.outcome = AttemptOutcome::ConfigurationError;
                missing.error = "Missing input: " + inputs.describe();
                missing.validation = inputs;
                spdlog::error("Stage {}: {}", stage.name, *missing.error);

                state.append(missing);
                report.attempts.push_back(missing);
                auto status = state.any_succeeded() ? RunStatus::PartiallyCompleted : RunStatus::Failed;
                stop(status, &missing);
                return conclude(status, kExitConfiguration);
            }

            while (true) {
                ++attempts_this_run;
                auto result = run_attempt(stage, state.attempts(stage.name) + 1, cancel, out);

                state.append(result);
                report.attempts.push_back(result);

                if (result.succeeded()) {
                    state.resume_point = idx + 1 < stages.size()
                        ? std::optional<std::string>(names[idx + 1]) : std::nullopt;
                    store_.save(state);

                    spdlog::info("Stage {} completed in {}", stage.name, utils::format_elapsed(result.duration_ms));
                    if (out) {
                        out->stage_completed(idx + 1, stages.size(), stage.name, elapsed_ms(stage_start), true, "");
                    }
                    break;
                }

                store_.save(state);

                switch (result.outcome) {
                    case AttemptOutcome::Canceled:
                        spdlog::warn("Stage {} canceled during attempt {}", stage.name, result.attempt);
                        stop(RunStatus::PartiallyCompleted, &result);
                        return conclude(RunStatus::PartiallyCompleted, kExitCanceled);

                    case AttemptOutcome::ConfigurationError: {
                        spdlog::error("Stage {}: configuration error: {}", stage.name, result.error.value_or(""));
                        auto status = state.any_succeeded() ? RunStatus::PartiallyCompleted : RunStatus::Failed;
                        stop(status, &result);
                        return conclude(status, kExitConfiguration);
                    }

                    case AttemptOutcome::ValidationFailure:
                        spdlog::warn("Stage {} attempt {}: silent tool failure: {}", stage.name, result.attempt,
                                     result.error.value_or(""));
                        break;

                    default:
                        spdlog::warn("Stage {} attempt {} failed: {}", stage.name, result.attempt,
                                     result.error.value_or(""));
                        break;
                }

                if (attempts_this_run >= options_.max_attempts) {
                    spdlog::error("Stage {} failed after {} attempt(s)", stage.name, attempts_this_run);
                    stop(RunStatus::Failed, &result);
                    return conclude(RunStatus::Failed, kExitFailed);
                }

                auto backoff_s = std::chrono::duration_cast<std::chrono::seconds>(options_.backoff).count();
                spdlog::info("Retrying stage {} in {}s (attempt {}/{})", stage.name, backoff_s,
                             attempts_this_run + 1, options_.max_attempts);
                if (out) {
                    out->warning(stage.name + " failed: " + result.error.value_or("") + "; retrying in " +
                                 std::to_string(backoff_s) + "s");
                }

                if (!wait_backoff(cancel)) {
                    spdlog::warn("Run canceled while waiting to retry {}", stage.name);
                    stop(RunStatus::PartiallyCompleted, &result);
                    report.error_kind = attempt_outcome_to_string(AttemptOutcome::Canceled);
                    return conclude(RunStatus::PartiallyCompleted, kExitCanceled);
                }
            }
        }

        state.status = RunStatus::Succeeded;
        state.resume_point = std::nullopt;
        state.updated_at = utils::utc_timestamp();
        store_.save(state);

        report.final_artifact = final_artifact();
        spdlog::info("Run '{}' succeeded in {}", run_id, utils::format_elapsed(elapsed_ms(start)));
        return conclude(RunStatus::Succeeded, kExitSucceeded);

    } catch (const PersistenceError& e) {
        // Progress that cannot be recorded must not be acted upon
        spdlog::error("Checkpoint failure: {}", e.what());
        report.error_kind = "persistence_error";
        report.error = e.what();
        return conclude(RunStatus::Failed, kExitFailed);
    } catch (const ConfigurationError& e) {
        spdlog::error("{}", e.what());
        report.error_kind = attempt_outcome_to_string(AttemptOutcome::ConfigurationError);
        report.error = e.what();
        return conclude(RunStatus::Failed, kExitConfiguration);
    }
}

RunReport Orchestrator::plan(const std::string& run_id) const {
    const auto start = Clock::now();
    RunReport report;
    report.run_id = run_id;
    report.dry_run = true;

    try {
        auto stages = ordered_stages();
        std::vector<std::string> names;
        for (const auto* stage : stages) {
            names.push_back(stage->name);
        }

        size_t begin = 0;
        auto state = store_.load(run_id);
        if (state && state->stages == names) {
            begin = resume_point(*state, names).value_or(stages.size());
        }
        for (size_t i = 0; i < begin; ++i) {
            report.skipped_stages.push_back(names[i]);
        }

        auto cwd = working_dir();
        for (size_t idx = begin; idx < stages.size(); ++idx) {
            const auto& stage = *stages[idx];
            for (const auto& step : stage.steps) {
                auto exec = resolver_.describe(stage.context_id, executable_for(step.tool), cwd);
                auto redirect = registry_.stdout_path(step);

                PlannedCommand cmd;
                cmd.stage = stage.name;
                cmd.context_id = stage.context_id;
                cmd.executable = exec.executable_path.string();
                cmd.args = registry_.render(step, params_);
                if (redirect) {
                    cmd.stdout_path = redirect->string();
                }
                report.planned_commands.push_back(std::move(cmd));
            }
        }
        report.status = RunStatus::Pending;
        report.exit_code = kExitSucceeded;
    } catch (const PersistenceError& e) {
        report.status = RunStatus::Failed;
        report.exit_code = kExitFailed;
        report.error_kind = "persistence_error";
        report.error = e.what();
    } catch (const ConfigurationError& e) {
        report.status = RunStatus::Failed;
        report.exit_code = kExitConfiguration;
        report.error_kind = attempt_outcome_to_string(AttemptOutcome::ConfigurationError);
        report.error = e.what();
    }

    report.duration_ms = elapsed_ms(start);
    return report;
}

} // namespace nanoflow::core
