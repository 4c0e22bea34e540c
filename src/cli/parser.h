#pragma once

#include "utils/log_utils.h"
#include <CLI/CLI.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace nanoflow::cli {

// Parsed command type
enum class Command {
    Run,           // nanoflow run
    Status,        // nanoflow status
    Stages,        // nanoflow stages
    Help,          // Show help
    Version        // Show version
};

// Parsed arguments structure. Unset optionals leave the config file value alone.
struct ParsedArgs {
    Command command = Command::Help;

    std::optional<std::string> config_file;
    std::optional<std::string> run_id;
    std::optional<std::string> input;
    std::optional<std::string> reference;
    std::optional<std::string> output;
    std::optional<std::string> checkpoint_dir;
    std::optional<std::string> log_file;

    std::optional<int> threads;
    std::optional<std::int64_t> timeout_s;
    std::optional<int> max_attempts;
    std::optional<std::int64_t> backoff_s;
    std::optional<std::string> basecall_model;
    std::optional<std::string> modification_profile;

    std::vector<std::string> tool_overrides;       // key=path
    std::vector<std::string> stage_contexts;       // stage=context

    // Flags
    bool dry_run = false;
    bool json_output = false;
    bool verbose = false;
    bool quiet = false;
};

// Console log verbosity selected by --verbose / --quiet
utils::VerboseLogLevel log_level(const ParsedArgs& args);

class CliParser {
public:
    CliParser();
    ~CliParser() = default;

    // Parse command line arguments. Throws CLI::ParseError on usage errors.
    ParsedArgs parse(int argc, char** argv);

    // Get help text
    std::string help();

    // Set when CLI11 handled --help or --version itself
    int parse_exit_code() const { return parse_exit_code_; }
    const std::string& parse_exit_message() const { return parse_exit_message_; }

private:
    int parse_exit_code_ = -1;
    std::string parse_exit_message_;

    void setup_main_options(CLI::App& app, ParsedArgs& args);
    void setup_subcommands(CLI::App& app, ParsedArgs& args);
    void add_config_options(CLI::App& cmd, ParsedArgs& args);
};

} // namespace nanoflow::cli
