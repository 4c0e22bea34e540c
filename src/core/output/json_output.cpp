#include "json_output.h"

namespace nanoflow::core::output {

JsonOutput::JsonOutput(std::ostream& out, std::ostream& err, bool verbose, bool quiet)
    : out_(out)
    , err_(err)
    , verbose_(verbose)
    , quiet_(quiet) {
}

void JsonOutput::emit(const nlohmann::json& event) {
    err_ << event.dump() << "\n";
}

void JsonOutput::info(const std::string& message) {
    if (!verbose_ || quiet_) return;
    emit({{"level", "info"}, {"message", message}});
}

void JsonOutput::success(const std::string& message) {
    if (!verbose_ || quiet_) return;
    emit({{"level", "success"}, {"message", message}});
}

void JsonOutput::warning(const std::string& message) {
    if (quiet_) return;
    emit({{"level", "warning"}, {"message", message}});
}

void JsonOutput::error(const std::string& message) {
    emit({{"level", "error"}, {"message", message}});
}

void JsonOutput::detail(const std::string& message) {
    if (!verbose_ || quiet_) return;
    emit({{"level", "detail"}, {"message", message}});
}

void JsonOutput::data(const nlohmann::json& j, const std::string&) {
    out_ << j.dump(2) << std::endl;
}

void JsonOutput::stage_started(size_t current, size_t total, const std::string& stage) {
    if (!verbose_) return;
    emit({{"event", "stage_started"}, {"stage", stage}, {"current", current}, {"total", total}});
}

void JsonOutput::stage_completed(size_t current, size_t total, const std::string& stage,
                                 std::int64_t duration_ms, bool success,
                                 const std::string& error) {
    if (!verbose_ && success) return;
    nlohmann::json event = {
        {"event", "stage_completed"},
        {"stage", stage},
        {"current", current},
        {"total", total},
        {"duration_ms", duration_ms},
        {"success", success},
    };
    if (!error.empty()) {
        event["error"] = error;
    }
    emit(event);
}

} // namespace nanoflow::core::output
