#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace nanoflow::core::output {

// User-facing output of CLI commands. Diagnostics for operators go through
// spdlog; this interface carries what the user asked for.
class IOutput {
public:
    virtual ~IOutput() = default;

    virtual void info(const std::string& message) = 0;
    virtual void success(const std::string& message) = 0;
    virtual void warning(const std::string& message) = 0;
    virtual void error(const std::string& message) = 0;

    // Shown only with --verbose
    virtual void detail(const std::string& message) = 0;

    // Command result. Text mode prints text when given, JSON mode prints j.
    virtual void data(const nlohmann::json& j, const std::string& text = "") = 0;

    // Stage progress
    virtual void stage_started(size_t current, size_t total, const std::string& stage) = 0;
    virtual void stage_completed(size_t current, size_t total, const std::string& stage,
                                 std::int64_t duration_ms, bool success,
                                 const std::string& error) = 0;

    virtual bool is_json() const = 0;
};

} // namespace nanoflow::core::output
