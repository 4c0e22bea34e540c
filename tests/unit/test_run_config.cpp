#include <gtest/gtest.h>
#include "cli/config_overrides.h"
#include "core/errors.h"
#include "core/run_config.h"
#include <algorithm>
#include <fstream>
#include <unistd.h>

using namespace nanoflow;
using namespace nanoflow::core;
namespace fs = std::filesystem;

namespace {

RunConfig complete_config() {
    auto config = RunConfig::defaults();
    config.run_id = "sample1";
    config.input_signal_dir = "/data/fast5";
    config.reference = "/data/transcripts.fa";
    config.output_dir = "/runs/sample1";
    return config;
}

bool mentions(const std::vector<std::string>& problems, const std::string& text) {
    return std::any_of(problems.begin(), problems.end(),
                       [&](const std::string& p) { return p.find(text) != std::string::npos; });
}

} // anonymous namespace

TEST(RunConfigTest, Defaults) {
    auto config = RunConfig::defaults();

    EXPECT_EQ(config.threads, 4);
    EXPECT_EQ(config.max_attempts, 3);
    EXPECT_EQ(config.backoff_s, 10);
    EXPECT_EQ(config.diagnostic_bytes, 4096u);
    EXPECT_EQ(config.basecall_model, "rna004_130bps_sup@v5.1.0");
    EXPECT_EQ(config.modification_profile, "m6A_DRACH");

    ASSERT_EQ(config.contexts.size(), 2u);
    EXPECT_EQ(config.contexts[0].id, "nanopore");
    EXPECT_EQ(config.contexts[0].conflicts_with, std::vector<std::string>{"m6anet"});
    EXPECT_EQ(config.contexts[1].id, "m6anet");
    EXPECT_EQ(config.contexts[1].env.at("CONDA_AUTO_ACTIVATE_BASE"), "false");
    EXPECT_FALSE(config.contexts[1].stderr_filters.empty());
}

TEST(RunConfigTest, CompleteConfigIsValid) {
    EXPECT_TRUE(complete_config().validate().empty());
}

TEST(RunConfigTest, MissingRequiredFields) {
    auto problems = RunConfig::defaults().validate();
    EXPECT_TRUE(mentions(problems, "run_id"));
    EXPECT_TRUE(mentions(problems, "input_signal_dir"));
    EXPECT_TRUE(mentions(problems, "reference"));
    EXPECT_TRUE(mentions(problems, "output_dir"));
}

TEST(RunConfigTest, InvalidValues) {
    auto config = complete_config();
    config.run_id = "../x";
    config.threads = 0;
    config.max_attempts = 0;
    config.backoff_s = -1;
    config.diagnostic_bytes = 100;
    config.stage_timeouts["polish"] = 10;
    config.stage_contexts["basecall"] = "guppy";

    auto problems = config.validate();
    EXPECT_TRUE(mentions(problems, "run_id"));
    EXPECT_TRUE(mentions(problems, "threads"));
    EXPECT_TRUE(mentions(problems, "max_attempts"));
    EXPECT_TRUE(mentions(problems, "backoff_s"));
    EXPECT_TRUE(mentions(problems, "diagnostic_bytes"));
    EXPECT_TRUE(mentions(problems, "unknown stage 'polish'"));
    EXPECT_TRUE(mentions(problems, "unknown context 'guppy'"));
}

TEST(RunConfigTest, FromJsonOverridesFields) {
    nlohmann::json j = {
        {"run_id", "sample2"},
        {"threads", 16},
        {"stage_timeouts", {{"basecall", 7200}}},
        {"tools", {{"dorado", "/opt/dorado/bin/dorado"}}},
        {"stage_contexts", {{"align", "nanopore"}}},
        {"checkpoint_dir", "/var/lib/nanoflow"},
    };

    auto config = RunConfig::from_json(j);

    EXPECT_EQ(config.run_id, "sample2");
    EXPECT_EQ(config.threads, 16);
    EXPECT_EQ(config.max_attempts, 3);
    EXPECT_EQ(config.timeout_for("basecall"), std::chrono::hours(2));
    EXPECT_EQ(config.timeout_for("align"), std::chrono::hours(24));
    EXPECT_EQ(config.tool_executable("dorado"), "/opt/dorado/bin/dorado");
    EXPECT_EQ(config.tool_executable("samtools"), "samtools");
    EXPECT_EQ(config.effective_checkpoint_dir(), fs::path("/var/lib/nanoflow"));
    EXPECT_EQ(config.contexts.size(), 2u);
}

TEST(RunConfigTest, ContextListReplacesDefaults) {
    nlohmann::json j = {
        {"contexts", {{{"id", "all-in-one"}, {"prefix", "/opt/conda/envs/rna"}}}},
    };
    auto config = RunConfig::from_json(j);

    ASSERT_EQ(config.contexts.size(), 1u);
    EXPECT_EQ(config.contexts[0].id, "all-in-one");
    EXPECT_EQ(config.contexts[0].bin_dirs()[0], fs::path("/opt/conda/envs/rna/bin"));
}

TEST(RunConfigTest, FromJsonTypeErrors) {
    EXPECT_THROW(RunConfig::from_json(nlohmann::json::array()), ConfigurationError);
    EXPECT_THROW(RunConfig::from_json({{"threads", "many"}}), ConfigurationError);
    EXPECT_THROW(RunConfig::from_json({{"contexts", {{{"prefix", "/x"}}}}}), ConfigurationError);
}

TEST(RunConfigTest, JsonRoundTrip) {
    auto config = complete_config();
    config.log_file = "/runs/sample1/nanoflow.log";
    config.stage_contexts["infer-modification"] = "m6anet";

    auto restored = RunConfig::from_json(config.to_json(), RunConfig{});

    EXPECT_EQ(restored.run_id, "sample1");
    EXPECT_EQ(restored.reference, fs::path("/data/transcripts.fa"));
    ASSERT_TRUE(restored.log_file.has_value());
    EXPECT_EQ(restored.contexts.size(), 2u);
    EXPECT_EQ(restored.stage_contexts.at("infer-modification"), "m6anet");
}

TEST(RunConfigTest, ParametersAndLayout) {
    auto config = complete_config();
    config.threads = 12;

    auto params = config.parameters();
    EXPECT_EQ(params.at("threads"), "12");
    EXPECT_EQ(params.at("basecall_model"), "rna004_130bps_sup@v5.1.0");

    auto layout = config.layout();
    EXPECT_EQ(layout.output_root, fs::path("/runs/sample1"));
    EXPECT_EQ(config.effective_checkpoint_dir(), fs::path("/runs/sample1/.nanoflow"));
}

TEST(RunConfigTest, LoadFromFile) {
    auto path = fs::temp_directory_path() / ("nanoflow_config_" + std::to_string(getpid()) + ".json");
    std::ofstream(path) << R"({"run_id": "from-file", "backoff_s": 0})";

    auto config = load_run_config(path);
    EXPECT_EQ(config.run_id, "from-file");
    EXPECT_EQ(config.backoff_s, 0);

    std::ofstream(path) << "{not json";
    EXPECT_THROW(load_run_config(path), ConfigurationError);

    fs::remove(path);
    EXPECT_THROW(load_run_config(path), ConfigurationError);
}

TEST(RunConfigTest, CommandLineOverrides) {
    auto config = complete_config();
    cli::ParsedArgs args;
    args.threads = 32;
    args.output = "/scratch/out";
    args.tool_overrides = {"nanopolish=/opt/np/nanopolish"};
    args.stage_contexts = {"infer-modification=m6anet-gpu"};

    cli::apply_overrides(config, args);

    EXPECT_EQ(config.threads, 32);
    EXPECT_EQ(config.output_dir, fs::path("/scratch/out"));
    EXPECT_EQ(config.run_id, "sample1");
    EXPECT_EQ(config.tools.at("nanopolish"), "/opt/np/nanopolish");
    EXPECT_EQ(config.stage_contexts.at("infer-modification"), "m6anet-gpu");
}

TEST(RunConfigTest, MalformedOverrideThrows) {
    auto config = complete_config();
    cli::ParsedArgs args;
    args.tool_overrides = {"dorado"};
    EXPECT_THROW(cli::apply_overrides(config, args), ConfigurationError);

    args.tool_overrides.clear();
    args.stage_contexts = {"basecall="};
    EXPECT_THROW(cli::apply_overrides(config, args), ConfigurationError);
}
