#include "config_overrides.h"
#include "core/errors.h"
#include "utils/string_utils.h"
#include <spdlog/spdlog.h>

namespace nanoflow::cli {

core::RunConfig resolve_run_config(const ParsedArgs& args) {
    auto config = core::RunConfig::defaults();

    if (args.config_file) {
        config = core::load_run_config(*args.config_file);
    } else {
        auto user_config = core::default_config_path();
        std::error_code ec;
        if (!user_config.empty() && std::filesystem::exists(user_config, ec)) {
            spdlog::debug("Using {}", user_config.string());
            config = core::load_run_config(user_config);
        }
    }

    apply_overrides(config, args);
    return config;
}

void apply_overrides(core::RunConfig& config, const ParsedArgs& args) {
    if (args.run_id) config.run_id = *args.run_id;
    if (args.input) config.input_signal_dir = *args.input;
    if (args.reference) config.reference = *args.reference;
    if (args.output) config.output_dir = *args.output;
    if (args.checkpoint_dir) config.checkpoint_dir = std::filesystem::path(*args.checkpoint_dir);
    if (args.log_file) config.log_file = std::filesystem::path(*args.log_file);

    if (args.threads) config.threads = *args.threads;
    if (args.timeout_s) config.stage_timeout_s = *args.timeout_s;
    if (args.max_attempts) config.max_attempts = *args.max_attempts;
    if (args.backoff_s) config.backoff_s = *args.backoff_s;
    if (args.basecall_model) config.basecall_model = *args.basecall_model;
    if (args.modification_profile) config.modification_profile = *args.modification_profile;

    for (const auto& entry : args.tool_overrides) {
        auto kv = utils::split_key_value(entry);
        if (!kv || kv->second.empty()) {
            throw core::ConfigurationError("Invalid --tool value '" + entry + "', expected key=path");
        }
        config.tools[kv->first] = kv->second;
    }

    for (const auto& entry : args.stage_contexts) {
        auto kv = utils::split_key_value(entry);
        if (!kv || kv->second.empty()) {
            throw core::ConfigurationError("Invalid --stage-context value '" + entry + "', expected stage=context");
        }
        config.stage_contexts[kv->first] = kv->second;
    }
}

} // namespace nanoflow::cli
