#include "console_output.h"
#include "utils/time_utils.h"
#include <iostream>
#include <unistd.h>

namespace nanoflow::core::output {

namespace {

constexpr const char* kGreen = "32";
constexpr const char* kYellow = "33";
constexpr const char* kRed = "31";
constexpr const char* kDim = "2";

std::string step_prefix(size_t current, size_t total) {
    return "[" + std::to_string(current) + "/" + std::to_string(total) + "] ";
}

} // anonymous namespace

ConsoleOutput::ConsoleOutput(std::ostream& out, std::ostream& err, bool verbose, bool quiet)
    : out_(out)
    , err_(err)
    , verbose_(verbose)
    , quiet_(quiet)
    , color_(&out == &std::cout && ::isatty(STDOUT_FILENO)) {
}

std::string ConsoleOutput::paint(const std::string& text, const char* code) const {
    if (!color_) {
        return text;
    }
    return std::string("\033[") + code + "m" + text + "\033[0m";
}

void ConsoleOutput::info(const std::string& message) {
    if (quiet_) return;
    out_ << message << "\n";
}

void ConsoleOutput::success(const std::string& message) {
    if (quiet_) return;
    out_ << paint(message, kGreen) << "\n";
}

void ConsoleOutput::warning(const std::string& message) {
    err_ << paint("Warning: ", kYellow) << message << "\n";
}

void ConsoleOutput::error(const std::string& message) {
    err_ << paint("Error: ", kRed) << message << "\n";
}

void ConsoleOutput::detail(const std::string& message) {
    if (!verbose_ || quiet_) return;
    out_ << paint(message, kDim) << "\n";
}

void ConsoleOutput::data(const nlohmann::json& j, const std::string& text) {
    if (text.empty()) {
        out_ << j.dump(2) << "\n";
    } else {
        out_ << text << "\n";
    }
}

void ConsoleOutput::stage_started(size_t current, size_t total, const std::string& stage) {
    if (quiet_) return;
    out_ << paint(step_prefix(current, total), kDim) << stage << "..." << std::endl;
}

void ConsoleOutput::stage_completed(size_t current, size_t total, const std::string& stage,
                                    std::int64_t duration_ms, bool success,
                                    const std::string& error) {
    if (success) {
        if (quiet_) return;
        out_ << paint(step_prefix(current, total), kDim) << stage << " "
             << paint("done", kGreen) << " (" << utils::format_elapsed(duration_ms) << ")" << std::endl;
        return;
    }

    err_ << paint(step_prefix(current, total), kDim) << stage << " "
         << paint("failed", kRed) << " (" << utils::format_elapsed(duration_ms) << ")";
    if (!error.empty()) {
        err_ << ": " << error;
    }
    err_ << std::endl;
}

} // namespace nanoflow::core::output
