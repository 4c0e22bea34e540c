#pragma once

#include "output.h"
#include <ostream>

namespace nanoflow::core::output {

// Human-readable output, colored when writing to a terminal
class ConsoleOutput : public IOutput {
public:
    ConsoleOutput(std::ostream& out, std::ostream& err, bool verbose, bool quiet);

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

    bool is_json() const override { return false; }

    void set_color(bool enabled) { color_ = enabled; }

private:
    std::ostream& out_;
    std::ostream& err_;
    bool verbose_;
    bool quiet_;
    bool color_;

    std::string paint(const std::string& text, const char* code) const;
};

} // namespace nanoflow::core::output
