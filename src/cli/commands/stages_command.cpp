#include "stages_command.h"
#include "cli/config_overrides.h"
#include "core/errors.h"
#include "core/orchestrator.h"
#include "utils/string_utils.h"
#include <sstream>

namespace nanoflow::cli::commands {

StagesCommand::StagesCommand(std::shared_ptr<core::output::IOutput> output)
    : output_(std::move(output)) {
}

int StagesCommand::execute(const ParsedArgs& args) {
    try {
        auto config = resolve_run_config(args);

        // Paths are only illustrative when not configured
        auto layout = config.layout();
        if (layout.signal_dir.empty()) layout.signal_dir = "fast5";
        if (layout.reference.empty()) layout.reference = "reference.fa";
        if (layout.output_root.empty()) layout.output_root = "nanoflow_out";

        auto registry = core::make_default_registry(layout, config.stage_contexts);
        auto params = config.parameters();

        nlohmann::json j = nlohmann::json::array();
        std::ostringstream text;

        for (size_t idx : registry.execution_order()) {
            const auto& stage = registry.get_ordered_stages()[idx];
            auto entry = stage.to_json();
            entry["commands"] = nlohmann::json::array();

            text << (idx + 1) << ". " << stage.name << " [" << stage.context_id << "]\n";
            text << "   in:  " << utils::join(stage.inputs, ", ") << "\n";
            text << "   out: " << utils::join(stage.outputs, ", ") << "\n";

            for (const auto& step : stage.steps) {
                core::PlannedCommand cmd;
                cmd.stage = stage.name;
                cmd.context_id = stage.context_id;
                cmd.executable = config.tool_executable(step.tool);
                cmd.args = registry.render(step, params);
                if (auto redirect = registry.stdout_path(step)) {
                    cmd.stdout_path = redirect->string();
                }
                entry["commands"].push_back(cmd.command_line());
                text << "   $ " << cmd.command_line() << "\n";
            }
            j.push_back(entry);
        }

        auto rendered = text.str();
        if (!rendered.empty()) {
            rendered.pop_back();
        }
        output_->data(j, rendered);
        return core::kExitSucceeded;

    } catch (const core::ConfigurationError& e) {
        output_->error(e.what());
        return core::kExitConfiguration;
    }
}

} // namespace nanoflow::cli::commands
