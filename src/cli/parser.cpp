#include "parser.h"
#include <nanoflow/version.h>
#include <sstream>

namespace nanoflow::cli {

namespace {

constexpr const char* kDescription =
    "nanoflow - nanopore direct-RNA modification pipeline orchestrator";

} // anonymous namespace

utils::VerboseLogLevel log_level(const ParsedArgs& args) {
    if (args.quiet) return utils::VerboseLogLevel::quiet;
    if (args.verbose) return utils::VerboseLogLevel::debug;
    return utils::VerboseLogLevel::none;
}

CliParser::CliParser() = default;

ParsedArgs CliParser::parse(int argc, char** argv) {
    ParsedArgs args;
    parse_exit_code_ = -1;
    parse_exit_message_.clear();

    CLI::App app{kDescription};
    app.set_version_flag("--version", NANOFLOW_VERSION);
    app.set_help_flag("-h,--help", "Show help");
    app.fallthrough();

    setup_main_options(app, args);
    setup_subcommands(app, args);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        if (e.get_exit_code() != 0) {
            throw;
        }
        // Help or version was requested; keep the text CLI11 renders for it
        std::ostringstream out;
        std::ostringstream err;
        parse_exit_code_ = app.exit(e, out, err);
        parse_exit_message_ = out.str();
        args.command = dynamic_cast<const CLI::CallForVersion*>(&e) ? Command::Version : Command::Help;
    }

    if (args.verbose && args.quiet) {
        throw CLI::ValidationError("--verbose and --quiet are mutually exclusive");
    }

    return args;
}

std::string CliParser::help() {
    CLI::App app{kDescription};
    ParsedArgs dummy;
    setup_main_options(app, dummy);
    setup_subcommands(app, dummy);
    return app.help();
}

void CliParser::setup_main_options(CLI::App& app, ParsedArgs& args) {
    app.add_flag("--json", args.json_output, "Output as JSON");
    app.add_flag("--verbose", args.verbose, "Verbose output (debug logging, rendered commands)");
    app.add_flag("--quiet", args.quiet, "Only report warnings and errors");
}

void CliParser::add_config_options(CLI::App& cmd, ParsedArgs& args) {
    cmd.add_option("-c,--config", args.config_file, "Run configuration file (JSON)")
        ->check(CLI::ExistingFile);
    cmd.add_option("--run-id", args.run_id, "Run identifier (checkpoint name)");
    cmd.add_option("-i,--input", args.input, "Raw signal input directory");
    cmd.add_option("-r,--reference", args.reference, "Reference transcriptome FASTA");
    cmd.add_option("-o,--output", args.output, "Output directory root");
    cmd.add_option("--checkpoint-dir", args.checkpoint_dir, "Checkpoint directory (default <output>/.nanoflow)");
    cmd.add_option("-t,--threads", args.threads, "Threads passed to each tool")
        ->check(CLI::PositiveNumber);
    cmd.add_option("--model", args.basecall_model, "Basecalling model");
    cmd.add_option("--modification", args.modification_profile, "Modified-base profile");
    cmd.add_option("--tool", args.tool_overrides, "Tool executable override (key=path)")
        ->expected(1)
        ->take_all();
    cmd.add_option("--stage-context", args.stage_contexts, "Runtime context of a stage (stage=context)")
        ->expected(1)
        ->take_all();
}

void CliParser::setup_subcommands(CLI::App& app, ParsedArgs& args) {
    app.require_subcommand(0, 1);

    // Run command
    auto* run_cmd = app.add_subcommand("run", "Run or resume the pipeline");
    add_config_options(*run_cmd, args);
    run_cmd->add_option("--timeout", args.timeout_s, "Per-stage timeout in seconds")
        ->check(CLI::PositiveNumber);
    run_cmd->add_option("--max-attempts", args.max_attempts, "Attempts per stage before failing")
        ->check(CLI::PositiveNumber);
    run_cmd->add_option("--backoff", args.backoff_s, "Seconds to wait between attempts")
        ->check(CLI::NonNegativeNumber);
    run_cmd->add_option("--log-file", args.log_file, "Append a debug log to this file");
    run_cmd->add_flag("--dry-run", args.dry_run, "Print the commands that would run");
    run_cmd->callback([&args]() { args.command = Command::Run; });

    // Status command
    auto* status_cmd = app.add_subcommand("status", "Show checkpointed progress of a run");
    add_config_options(*status_cmd, args);
    status_cmd->callback([&args]() { args.command = Command::Status; });

    // Stages command
    auto* stages_cmd = app.add_subcommand("stages", "List pipeline stages and their commands");
    add_config_options(*stages_cmd, args);
    stages_cmd->callback([&args]() { args.command = Command::Stages; });
}

} // namespace nanoflow::cli
