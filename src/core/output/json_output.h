#pragma once

#include "output.h"
#include <ostream>

namespace nanoflow::core::output {

// Machine-readable output for --json. stdout carries exactly one JSON
// document per command; messages and progress go to stderr as JSON lines.
class JsonOutput : public IOutput {
public:
    JsonOutput(std::ostream& out, std::ostream& err, bool verbose, bool quiet);

    void info(const std::string& message) override;
    void success(const std::string& message) override;
    void warning(const std::string& message) override;
    void error(const std::string& message) override;
    void detail(const std::string& message) override;
    void data(const nlohmann::json& j, const std::string& text = "") override;

    void stage_started(size_t current, size_t total, const std::string& stage) override;
    void stage_completed(size_t current, size_t total, const std::string& stage,
                         std::int64_t duration_ms, bool success,
                         const std::string& error) override;

    bool is_json() const override { return true; }

private:
    std::ostream& out_;
    std::ostream& err_;
    bool verbose_;
    bool quiet_;

    void emit(const nlohmann::json& event);
};

} // namespace nanoflow::core::output
