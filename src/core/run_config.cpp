#include "run_config.h"
#include "checkpoint_store.h"
#include "errors.h"
#include "utils/file_utils.h"
#include <algorithm>
#include <cstdlib>
#include <set>

#include <pwd.h>
#include <unistd.h>

namespace nanoflow::core {

namespace {

std::filesystem::path get_home_dir() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return std::filesystem::path(home);
    }
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return std::filesystem::path(pw->pw_dir);
    }
    return std::filesystem::path();
}

// Conda/mamba shell-hook chatter that says nothing about the tool itself
const std::vector<std::string> kCondaNoise = {
    "EnvironmentNameNotFound",
    "terminal process group",
    "no job control",
    "shell.bash hook",
};

RuntimeContext default_context(const std::string& id, const std::string& conflicts_with) {
    RuntimeContext ctx;
    ctx.id = id;
    ctx.conflicts_with = {conflicts_with};
    ctx.env["CONDA_AUTO_ACTIVATE_BASE"] = "false";
    ctx.stderr_filters = kCondaNoise;
    return ctx;
}

const std::vector<std::string>& known_stages() {
    static const std::vector<std::string> stages = {
        kStageConvert, kStageBasecall, kStageAlign, kStageRealign, kStageInfer,
    };
    return stages;
}

bool is_known_stage(const std::string& name) {
    const auto& stages = known_stages();
    return std::find(stages.begin(), stages.end(), name) != stages.end();
}

} // anonymous namespace

RunConfig RunConfig::defaults() {
    RunConfig config;
    config.contexts = {
        default_context(kNanoporeContext, kM6anetContext),
        default_context(kM6anetContext, kNanoporeContext),
    };
    return config;
}

RunConfig RunConfig::from_json(const nlohmann::json& j, RunConfig base) {
    if (!j.is_object()) {
        throw ConfigurationError("Run configuration must be a JSON object");
    }

    try {
        RunConfig c = std::move(base);

        if (j.contains("run_id")) c.run_id = j.at("run_id").get<std::string>();
        if (j.contains("input_signal_dir")) c.input_signal_dir = j.at("input_signal_dir").get<std::string>();
        if (j.contains("reference")) c.reference = j.at("reference").get<std::string>();
        if (j.contains("output_dir")) c.output_dir = j.at("output_dir").get<std::string>();

        if (j.contains("threads")) c.threads = j.at("threads").get<int>();
        if (j.contains("stage_timeout_s")) c.stage_timeout_s = j.at("stage_timeout_s").get<std::int64_t>();
        if (j.contains("stage_timeouts")) {
            c.stage_timeouts = j.at("stage_timeouts").get<std::map<std::string, std::int64_t>>();
        }
        if (j.contains("max_attempts")) c.max_attempts = j.at("max_attempts").get<int>();
        if (j.contains("backoff_s")) c.backoff_s = j.at("backoff_s").get<std::int64_t>();
        if (j.contains("diagnostic_bytes")) c.diagnostic_bytes = j.at("diagnostic_bytes").get<size_t>();

        if (j.contains("basecall_model")) c.basecall_model = j.at("basecall_model").get<std::string>();
        if (j.contains("modification_profile")) {
            c.modification_profile = j.at("modification_profile").get<std::string>();
        }

        if (j.contains("checkpoint_dir") && !j.at("checkpoint_dir").is_null()) {
            c.checkpoint_dir = std::filesystem::path(j.at("checkpoint_dir").get<std::string>());
        }
        if (j.contains("log_file") && !j.at("log_file").is_null()) {
            c.log_file = std::filesystem::path(j.at("log_file").get<std::string>());
        }

        if (j.contains("tools")) {
            for (const auto& [key, value] : j.at("tools").get<std::map<std::string, std::string>>()) {
                c.tools[key] = value;
            }
        }

        // A context list replaces the defaults as a whole
        if (j.contains("contexts")) {
            c.contexts.clear();
            for (const auto& ctx : j.at("contexts")) {
                c.contexts.push_back(RuntimeContext::from_json(ctx));
            }
        }

        if (j.contains("stage_contexts")) {
            for (const auto& [stage, ctx] : j.at("stage_contexts").get<std::map<std::string, std::string>>()) {
                c.stage_contexts[stage] = ctx;
            }
        }

        return c;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("Invalid run configuration: ") + e.what());
    }
}

nlohmann::json RunConfig::to_json() const {
    nlohmann::json j;
    j["run_id"] = run_id;
    j["input_signal_dir"] = input_signal_dir.string();
    j["reference"] = reference.string();
    j["output_dir"] = output_dir.string();
    j["threads"] = threads;
    j["stage_timeout_s"] = stage_timeout_s;
    j["stage_timeouts"] = stage_timeouts;
    j["max_attempts"] = max_attempts;
    j["backoff_s"] = backoff_s;
    j["diagnostic_bytes"] = diagnostic_bytes;
    j["basecall_model"] = basecall_model;
    j["modification_profile"] = modification_profile;
    if (checkpoint_dir) {
        j["checkpoint_dir"] = checkpoint_dir->string();
    }
    if (log_file) {
        j["log_file"] = log_file->string();
    }
    j["tools"] = tools;
    j["contexts"] = nlohmann::json::array();
    for (const auto& ctx : contexts) {
        j["contexts"].push_back(ctx.to_json());
    }
    j["stage_contexts"] = stage_contexts;
    return j;
}

std::vector<std::string> RunConfig::validate() const {
    std::vector<std::string> problems;

    if (run_id.empty()) {
        problems.push_back("run_id is required");
    } else if (!CheckpointStore::is_valid_run_id(run_id)) {
        problems.push_back("run_id '" + run_id + "' may only contain letters, digits, '.', '_' and '-'");
    }
    if (input_signal_dir.empty()) problems.push_back("input_signal_dir is required");
    if (reference.empty()) problems.push_back("reference is required");
    if (output_dir.empty()) problems.push_back("output_dir is required");

    if (threads < 1) problems.push_back("threads must be at least 1");
    if (stage_timeout_s < 1) problems.push_back("stage_timeout_s must be positive");
    if (max_attempts < 1) problems.push_back("max_attempts must be at least 1");
    if (backoff_s < 0) problems.push_back("backoff_s must not be negative");
    if (diagnostic_bytes < kMinDiagnosticBytes) {
        problems.push_back("diagnostic_bytes must be at least " + std::to_string(kMinDiagnosticBytes));
    }
    if (basecall_model.empty()) problems.push_back("basecall_model is required");
    if (modification_profile.empty()) problems.push_back("modification_profile is required");

    for (const auto& [stage, seconds] : stage_timeouts) {
        if (!is_known_stage(stage)) {
            problems.push_back("stage_timeouts: unknown stage '" + stage + "'");
        } else if (seconds < 1) {
            problems.push_back("stage_timeouts: timeout of '" + stage + "' must be positive");
        }
    }

    std::set<std::string> context_ids;
    for (const auto& ctx : contexts) {
        if (ctx.id.empty()) {
            problems.push_back("contexts: context with empty id");
        } else if (!context_ids.insert(ctx.id).second) {
            problems.push_back("contexts: duplicate context '" + ctx.id + "'");
        }
    }

    for (const auto& [stage, ctx] : stage_contexts) {
        if (!is_known_stage(stage)) {
            problems.push_back("stage_contexts: unknown stage '" + stage + "'");
        }
        if (!context_ids.count(ctx)) {
            problems.push_back("stage_contexts: unknown context '" + ctx + "' for stage '" + stage + "'");
        }
    }

    for (const auto& [key, exe] : tools) {
        if (exe.empty()) {
            problems.push_back("tools: empty executable for '" + key + "'");
        }
    }

    return problems;
}

std::chrono::milliseconds RunConfig::timeout_for(const std::string& stage) const {
    auto it = stage_timeouts.find(stage);
    auto seconds = it != stage_timeouts.end() ? it->second : stage_timeout_s;
    return std::chrono::seconds(seconds);
}

std::string RunConfig::tool_executable(const std::string& key) const {
    auto it = tools.find(key);
    if (it != tools.end() && !it->second.empty()) {
        return it->second;
    }
    return key;
}

RunParameters RunConfig::parameters() const {
    return {
        {"threads", std::to_string(threads)},
        {"basecall_model", basecall_model},
        {"modification_profile", modification_profile},
    };
}

ArtifactLayout RunConfig::layout() const {
    return ArtifactLayout{input_signal_dir, reference, output_dir};
}

std::filesystem::path RunConfig::effective_checkpoint_dir() const {
    if (checkpoint_dir) {
        return *checkpoint_dir;
    }
    return output_dir / ".nanoflow";
}

RunConfig load_run_config(const std::filesystem::path& path, RunConfig base) {
    auto content = utils::read_file(path);
    if (!content) {
        throw ConfigurationError("Cannot read configuration file: " + path.string());
    }

    auto j = nlohmann::json::parse(*content, nullptr, false);
    if (j.is_discarded()) {
        throw ConfigurationError("Configuration file is not valid JSON: " + path.string());
    }
    return RunConfig::from_json(j, std::move(base));
}

std::filesystem::path default_config_path() {
    auto home = get_home_dir();
    if (home.empty()) {
        return {};
    }
    return home / ".nanoflow" / "config.json";
}

} // namespace nanoflow::core
