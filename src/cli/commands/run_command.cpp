#include "run_command.h"
#include "cli/config_overrides.h"
#include "core/errors.h"
#include "core/subprocess_runner.h"
#include "utils/file_utils.h"
#include "utils/log_utils.h"
#include "utils/string_utils.h"
#include "utils/time_utils.h"
#include <spdlog/spdlog.h>

namespace nanoflow::cli::commands {

namespace {

std::string indent(const std::string& text, const std::string& prefix) {
    std::string result;
    for (const auto& line : utils::split(text, '\n')) {
        result += prefix + line + "\n";
    }
    if (!result.empty()) {
        result.pop_back();
    }
    return result;
}

} // anonymous namespace

RunCommand::RunCommand(std::shared_ptr<core::output::IOutput> output, const core::CancellationToken& cancel)
    : output_(std::move(output))
    , cancel_(cancel) {
}

int RunCommand::execute(const ParsedArgs& args) {
    core::RunConfig config;
    try {
        config = resolve_run_config(args);
    } catch (const core::ConfigurationError& e) {
        output_->error(e.what());
        return core::kExitConfiguration;
    }

    auto problems = config.validate();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            output_->error(problem);
        }
        return core::kExitConfiguration;
    }

    if (config.log_file && !args.dry_run) {
        try {
            utils::init_logging(log_level(args), config.log_file);
        } catch (const spdlog::spdlog_ex& e) {
            output_->error("Cannot open log file " + config.log_file->string() + ": " + e.what());
            return core::kExitConfiguration;
        }
    }

    auto working_dir = std::filesystem::absolute(config.output_dir);
    try {
        if (!args.dry_run && !utils::ensure_directory(working_dir)) {
            output_->error("Output path is not a directory: " + working_dir.string());
            return core::kExitConfiguration;
        }
    } catch (const std::filesystem::filesystem_error& e) {
        output_->error(std::string("Cannot create output directory: ") + e.what());
        return core::kExitConfiguration;
    }

    try {
        auto registry = core::make_default_registry(config.layout(), config.stage_contexts);
        core::RuntimeContextResolver resolver(config.contexts);

        core::SubprocessOptions runner_options;
        runner_options.tail_bytes = config.diagnostic_bytes;
        core::SubprocessRunner runner(runner_options);

        core::CheckpointStore store(config.effective_checkpoint_dir());

        core::OrchestratorOptions options;
        options.max_attempts = config.max_attempts;
        options.backoff = std::chrono::seconds(config.backoff_s);
        options.default_timeout = std::chrono::seconds(config.stage_timeout_s);
        for (const auto& [stage, seconds] : config.stage_timeouts) {
            options.stage_timeouts[stage] = std::chrono::seconds(seconds);
        }
        options.diagnostic_bytes = config.diagnostic_bytes;
        options.dry_run = args.dry_run;
        options.working_dir = working_dir;

        core::Orchestrator orchestrator(registry, resolver, runner, store,
                                        config.tools, config.parameters(), options);
        auto report = orchestrator.run(config.run_id, cancel_, output_);
        print_report(report);
        return report.exit_code;

    } catch (const core::ConfigurationError& e) {
        output_->error(e.what());
        return core::kExitConfiguration;
    }
}

void RunCommand::print_report(const core::RunReport& report) {
    if (output_->is_json()) {
        output_->data(report.to_json());
        return;
    }

    if (report.dry_run) {
        if (report.exit_code != core::kExitSucceeded) {
            output_->error(report.error.value_or("Dry run failed"));
            return;
        }
        if (!report.skipped_stages.empty()) {
            output_->info("Already complete: " + utils::join(report.skipped_stages, ", "));
        }
        std::string current;
        for (const auto& cmd : report.planned_commands) {
            if (cmd.stage != current) {
                current = cmd.stage;
                output_->info(current + " [" + cmd.context_id + "]");
            }
            output_->info("  " + cmd.command_line());
        }
        return;
    }

    auto elapsed = utils::format_elapsed(report.duration_ms);

    switch (report.status) {
        case core::RunStatus::Succeeded:
            output_->success("Run '" + report.run_id + "' succeeded in " + elapsed);
            if (report.final_artifact) {
                output_->info("  -> " + report.final_artifact->string());
            }
            return;

        case core::RunStatus::PartiallyCompleted:
        case core::RunStatus::Failed: {
            std::string message = "Run '" + report.run_id + "' " + core::run_status_to_string(report.status);
            if (report.failed_stage) {
                message += " at stage '" + *report.failed_stage + "' after " +
                           std::to_string(report.failed_attempts) + " attempt(s)";
            }
            if (report.error) {
                message += ": " + *report.error;
            }
            output_->error(message);

            if (!report.diagnostics.empty()) {
                output_->info("Last output:\n" + indent(utils::trim(report.diagnostics), "  | "));
            }
            if (report.error_kind != std::string("persistence_error")) {
                output_->info("Re-run with --run-id " + report.run_id + " to resume");
            }
            return;
        }

        default:
            output_->info("Run '" + report.run_id + "' " + core::run_status_to_string(report.status));
            return;
    }
}

} // namespace nanoflow::cli::commands
