#pragma once

#include "runtime_context.h"
#include "stage_registry.h"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace nanoflow::core {

// Minimum diagnostic tail kept per failed attempt
inline constexpr size_t kMinDiagnosticBytes = 1024;

// Settings of one pipeline run, loaded from a JSON file and CLI overrides
struct RunConfig {
    std::string run_id;
    std::filesystem::path input_signal_dir;
    std::filesystem::path reference;
    std::filesystem::path output_dir;

    int threads = 4;
    std::int64_t stage_timeout_s = 24 * 60 * 60;
    std::map<std::string, std::int64_t> stage_timeouts;     // Per-stage override, seconds
    int max_attempts = 3;
    std::int64_t backoff_s = 10;
    size_t diagnostic_bytes = 4096;

    std::string basecall_model = "rna004_130bps_sup@v5.1.0";
    std::string modification_profile = "m6A_DRACH";

    std::optional<std::filesystem::path> checkpoint_dir;
    std::optional<std::filesystem::path> log_file;

    std::map<std::string, std::string> tools;               // Tool key -> executable
    std::vector<RuntimeContext> contexts;
    std::map<std::string, std::string> stage_contexts;      // Stage -> context id

    // Default settings with the nanopore and m6anet contexts
    static RunConfig defaults();

    // Fields present in j override base
    static RunConfig from_json(const nlohmann::json& j, RunConfig base = defaults());
    nlohmann::json to_json() const;

    // Human-readable problems; empty when the config is usable
    std::vector<std::string> validate() const;

    std::chrono::milliseconds timeout_for(const std::string& stage) const;

    // Executable configured for a tool key, the key itself otherwise
    std::string tool_executable(const std::string& key) const;

    RunParameters parameters() const;
    ArtifactLayout layout() const;

    // checkpoint_dir, or <output_dir>/.nanoflow
    std::filesystem::path effective_checkpoint_dir() const;
};

// Read a config file. Throws ConfigurationError on I/O, syntax or type errors.
RunConfig load_run_config(const std::filesystem::path& path, RunConfig base = RunConfig::defaults());

// ~/.nanoflow/config.json, empty if HOME cannot be determined
std::filesystem::path default_config_path();

} // namespace nanoflow::core
