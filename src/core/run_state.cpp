#include "run_state.h"
#include "errors.h"
#include "utils/time_utils.h"

namespace nanoflow::core {

// StageResult

nlohmann::json StageResult::to_json() const {
    nlohmann::json j;
    j["stage"] = stage;
    j["ordinal"] = ordinal;
    j["attempt"] = attempt;
    j["started_at"] = started_at;
    j["finished_at"] = finished_at;
    j["duration_ms"] = duration_ms;
    j["exit_code"] = exit_code ? nlohmann::json(*exit_code) : nlohmann::json(nullptr);
    j["timed_out"] = timed_out;
    j["outcome"] = attempt_outcome_to_string(outcome);
    if (error) {
        j["error"] = *error;
    }
    if (!diagnostics.empty()) {
        j["diagnostics"] = diagnostics;
    }
    if (validation) {
        j["validation"] = validation->to_json();
    }
    return j;
}

StageResult StageResult::from_json(const nlohmann::json& j) {
    StageResult r;
    r.stage = j.at("stage").get<std::string>();
    r.ordinal = j.value("ordinal", size_t{0});
    r.attempt = j.value("attempt", 1);
    r.started_at = j.value("started_at", "");
    r.finished_at = j.value("finished_at", "");
    r.duration_ms = j.value("duration_ms", std::int64_t{0});
    if (j.contains("exit_code") && !j.at("exit_code").is_null()) {
        r.exit_code = j.at("exit_code").get<int>();
    }
    r.timed_out = j.value("timed_out", false);

    auto outcome = attempt_outcome_from_string(j.at("outcome").get<std::string>());
    if (!outcome) {
        throw PersistenceError("Unknown stage outcome: " + j.at("outcome").get<std::string>());
    }
    r.outcome = *outcome;

    if (j.contains("error")) {
        r.error = j.at("error").get<std::string>();
    }
    r.diagnostics = j.value("diagnostics", "");
    if (j.contains("validation")) {
        r.validation = ValidationOutcome::from_json(j.at("validation"));
    }
    return r;
}

// RunState

const StageResult* RunState::last_result(const std::string& stage) const {
    for (auto it = results.rbegin(); it != results.rend(); ++it) {
        if (it->stage == stage) {
            return &*it;
        }
    }
    return nullptr;
}

int RunState::attempts(const std::string& stage) const {
    int count = 0;
    for (const auto& r : results) {
        if (r.stage == stage) {
            ++count;
        }
    }
    return count;
}

bool RunState::stage_succeeded(const std::string& stage) const {
    const auto* last = last_result(stage);
    return last && last->succeeded();
}

bool RunState::any_succeeded() const {
    for (const auto& r : results) {
        if (r.succeeded()) {
            return true;
        }
    }
    return false;
}

void RunState::append(StageResult result) {
    results.push_back(std::move(result));
    updated_at = utils::utc_timestamp();
}

nlohmann::json RunState::to_json() const {
    nlohmann::json j;
    j["run_id"] = run_id;
    j["status"] = run_status_to_string(status);
    j["resume_point"] = resume_point ? nlohmann::json(*resume_point) : nlohmann::json(nullptr);
    j["stages"] = stages;
    j["created_at"] = created_at;
    j["updated_at"] = updated_at;
    j["results"] = nlohmann::json::array();
    for (const auto& r : results) {
        j["results"].push_back(r.to_json());
    }
    return j;
}

RunState RunState::from_json(const nlohmann::json& j) {
    RunState s;
    s.run_id = j.at("run_id").get<std::string>();

    auto status = run_status_from_string(j.at("status").get<std::string>());
    if (!status) {
        throw PersistenceError("Unknown run status: " + j.at("status").get<std::string>());
    }
    s.status = *status;

    if (j.contains("resume_point") && !j.at("resume_point").is_null()) {
        s.resume_point = j.at("resume_point").get<std::string>();
    }
    if (j.contains("stages")) {
        s.stages = j.at("stages").get<std::vector<std::string>>();
    }
    s.created_at = j.value("created_at", "");
    s.updated_at = j.value("updated_at", "");
    if (j.contains("results")) {
        for (const auto& r : j.at("results")) {
            s.results.push_back(StageResult::from_json(r));
        }
    }
    return s;
}

RunState RunState::fresh(const std::string& run_id, std::vector<std::string> stages) {
    RunState s;
    s.run_id = run_id;
    s.status = RunStatus::Pending;
    s.stages = std::move(stages);
    if (!s.stages.empty()) {
        s.resume_point = s.stages.front();
    }
    s.created_at = utils::utc_timestamp();
    s.updated_at = s.created_at;
    return s;
}

std::optional<size_t> resume_point(const RunState& state, const std::vector<std::string>& order) {
    for (size_t i = 0; i < order.size(); ++i) {
        if (!state.stage_succeeded(order[i])) {
            return i;
        }
    }
    return std::nullopt;
}

} // namespace nanoflow::core
