#include <gtest/gtest.h>
#include "core/output/console_output.h"
#include "core/output/json_output.h"
#include <sstream>

using namespace nanoflow::core::output;

TEST(ConsoleOutputTest, MessagesGoToTheRightStream) {
    std::ostringstream out, err;
    ConsoleOutput output(out, err, false, false);

    output.info("Starting run 'sample1'");
    output.warning("retrying");
    output.error("boom");

    EXPECT_EQ(out.str(), "Starting run 'sample1'\n");
    EXPECT_EQ(err.str(), "Warning: retrying\nError: boom\n");
    EXPECT_FALSE(output.is_json());
}

TEST(ConsoleOutputTest, QuietKeepsErrors) {
    std::ostringstream out, err;
    ConsoleOutput output(out, err, false, true);

    output.info("hidden");
    output.success("hidden");
    output.stage_started(1, 5, "convert-format");
    output.error("still shown");

    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(err.str(), "Error: still shown\n");
}

TEST(ConsoleOutputTest, DetailOnlyWhenVerbose) {
    std::ostringstream out, err;
    ConsoleOutput quiet_one(out, err, false, false);
    quiet_one.detail("$ samtools index");
    EXPECT_TRUE(out.str().empty());

    ConsoleOutput verbose(out, err, true, false);
    verbose.detail("$ samtools index");
    EXPECT_EQ(out.str(), "$ samtools index\n");
}

TEST(ConsoleOutputTest, StageProgress) {
    std::ostringstream out, err;
    ConsoleOutput output(out, err, false, false);

    output.stage_started(2, 5, "basecall");
    output.stage_completed(2, 5, "basecall", 61000, true, "");
    output.stage_completed(3, 5, "align", 1000, false, "minimap2 exited with code 1");

    EXPECT_EQ(out.str(), "[2/5] basecall...\n[2/5] basecall done (00:01:01)\n");
    EXPECT_EQ(err.str(), "[3/5] align failed (00:00:01): minimap2 exited with code 1\n");
}

TEST(ConsoleOutputTest, DataPrefersText) {
    std::ostringstream out, err;
    ConsoleOutput output(out, err, false, false);

    output.data({{"run_id", "r1"}}, "Run: r1");
    EXPECT_EQ(out.str(), "Run: r1\n");

    out.str("");
    output.data({{"run_id", "r1"}});
    EXPECT_EQ(nlohmann::json::parse(out.str())["run_id"], "r1");
}

TEST(JsonOutputTest, DataIsSingleDocument) {
    std::ostringstream out, err;
    JsonOutput output(out, err, false, false);

    output.info("not shown");
    output.data({{"status", "succeeded"}}, "ignored text");

    auto j = nlohmann::json::parse(out.str());
    EXPECT_EQ(j["status"], "succeeded");
    EXPECT_TRUE(err.str().empty());
    EXPECT_TRUE(output.is_json());
}

TEST(JsonOutputTest, EventsAreJsonLines) {
    std::ostringstream out, err;
    JsonOutput output(out, err, false, false);

    output.warning("retrying basecall");
    output.stage_completed(2, 5, "basecall", 10, false, "dorado exited with code 1");

    std::istringstream lines(err.str());
    std::string line;

    ASSERT_TRUE(std::getline(lines, line));
    auto warning = nlohmann::json::parse(line);
    EXPECT_EQ(warning["level"], "warning");
    EXPECT_EQ(warning["message"], "retrying basecall");

    ASSERT_TRUE(std::getline(lines, line));
    auto event = nlohmann::json::parse(line);
    EXPECT_EQ(event["event"], "stage_completed");
    EXPECT_EQ(event["success"], false);
    EXPECT_EQ(event["error"], "dorado exited with code 1");
    EXPECT_TRUE(out.str().empty());
}

TEST(JsonOutputTest, SuccessfulStagesOnlyWhenVerbose) {
    std::ostringstream out, err;
    JsonOutput quiet_one(out, err, false, false);
    quiet_one.stage_started(1, 5, "convert-format");
    quiet_one.stage_completed(1, 5, "convert-format", 10, true, "");
    EXPECT_TRUE(err.str().empty());

    JsonOutput verbose(out, err, true, false);
    verbose.stage_started(1, 5, "convert-format");
    EXPECT_NE(err.str().find("stage_started"), std::string::npos);
}
