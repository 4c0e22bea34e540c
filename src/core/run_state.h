#pragma once

#include "artifact_validator.h"
#include "types.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace nanoflow::core {

// One attempt of one stage
struct StageResult {
    std::string stage;
    size_t ordinal = 0;
    int attempt = 1;                        // 1-based
    std::string started_at;                 // ISO 8601 UTC
    std::string finished_at;
    std::int64_t duration_ms = 0;
    std::optional<int> exit_code;           // Last step that ran
    bool timed_out = false;
    AttemptOutcome outcome = AttemptOutcome::Succeeded;
    std::optional<std::string> error;
    std::string diagnostics;                // Bounded stderr/stdout tail
    std::optional<ValidationOutcome> validation;

    bool succeeded() const { return outcome == AttemptOutcome::Succeeded; }

    nlohmann::json to_json() const;
    static StageResult from_json(const nlohmann::json& j);
};

// Durable progress of one pipeline run. The result history is append-only.
struct RunState {
    std::string run_id;
    RunStatus status = RunStatus::Pending;
    std::vector<StageResult> results;
    std::optional<std::string> resume_point;    // Next stage to run
    std::vector<std::string> stages;            // Stage names of the pipeline version
    std::string created_at;
    std::string updated_at;

    // Latest result recorded for a stage
    const StageResult* last_result(const std::string& stage) const;

    // Number of attempts recorded for a stage
    int attempts(const std::string& stage) const;

    // True if the latest result of the stage is a success
    bool stage_succeeded(const std::string& stage) const;

    bool any_succeeded() const;

    void append(StageResult result);

    nlohmann::json to_json() const;
    static RunState from_json(const nlohmann::json& j);

    static RunState fresh(const std::string& run_id, std::vector<std::string> stages);
};

// Index into order of the first stage whose latest result is not a success;
// nullopt when every stage has succeeded. Pure.
std::optional<size_t> resume_point(const RunState& state, const std::vector<std::string>& order);

} // namespace nanoflow::core
