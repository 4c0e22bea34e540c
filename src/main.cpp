#include "cli/parser.h"
#include "cli/commands/run_command.h"
#include "cli/commands/stages_command.h"
#include "cli/commands/status_command.h"
#include "core/cancellation.h"
#include "core/output/output.h"
#include "core/output/console_output.h"
#include "core/output/json_output.h"
#include "utils/log_utils.h"
#include <nanoflow/version.h>
#include <csignal>
#include <iostream>
#include <memory>

using namespace nanoflow;

// Shared with the signal handler; the orchestrator polls it
static core::CancellationToken g_cancel;

extern "C" void signal_handler(int)
{
    g_cancel.request();
}

std::shared_ptr<core::output::IOutput> create_output(const cli::ParsedArgs& args) {
    if (args.json_output) {
        return std::make_shared<core::output::JsonOutput>(
            std::cout, std::cerr, args.verbose, args.quiet);
    }
    return std::make_shared<core::output::ConsoleOutput>(
        std::cout, std::cerr, args.verbose, args.quiet);
}

int main(int argc, char **argv)
{
    try
    {
        cli::CliParser parser;
        cli::ParsedArgs args;

        try
        {
            args = parser.parse(argc, argv);
        }
        catch (const CLI::ParseError &e)
        {
            auto output = create_output(args);
            output->error(e.what());
            output->info("Run 'nanoflow --help' for usage information");
            return 1;
        }

        utils::init_logging(cli::log_level(args));

        auto output = create_output(args);

        switch (args.command)
        {
        case cli::Command::Help:
            if (parser.parse_exit_code() >= 0)
            {
                std::cout << parser.parse_exit_message();
            }
            else
            {
                std::cout << parser.help() << std::endl;
            }
            return 0;

        case cli::Command::Version:
            std::cout << "nanoflow " << NANOFLOW_VERSION << std::endl;
            return 0;

        case cli::Command::Run:
        {
            std::signal(SIGINT, signal_handler);
            std::signal(SIGTERM, signal_handler);

            cli::commands::RunCommand cmd(output, g_cancel);
            return cmd.execute(args);
        }

        case cli::Command::Status:
        {
            cli::commands::StatusCommand cmd(output);
            return cmd.execute(args);
        }

        case cli::Command::Stages:
        {
            cli::commands::StagesCommand cmd(output);
            return cmd.execute(args);
        }

        default:
            std::cout << parser.help() << std::endl;
            return 0;
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
