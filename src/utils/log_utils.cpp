#include "log_utils.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace nanoflow::utils {

namespace {

constexpr const char* kLoggerName = "nanoflow";

}  // namespace

spdlog::level::level_enum console_log_level(VerboseLogLevel level) {
    switch (level) {
    case VerboseLogLevel::quiet:
        return spdlog::level::err;
    case VerboseLogLevel::none:
        // Progress is already printed through the command output on stdout
        return spdlog::level::warn;
    case VerboseLogLevel::debug:
        return spdlog::level::debug;
    case VerboseLogLevel::trace:
        return spdlog::level::trace;
    }
    return spdlog::level::warn;
}

void init_logging(VerboseLogLevel level, const std::optional<std::filesystem::path>& log_file) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_level(console_log_level(level));
    console->set_pattern("[%H:%M:%S] [%^%l%$] %v");
    sinks.push_back(console);

    if (log_file) {
        auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file->string(), false);
        file->set_level(spdlog::level::debug);
        file->set_pattern("[%Y-%m-%dT%H:%M:%S.%e] [%l] %v");
        sinks.push_back(file);
    }

    // Drop first so re-initialisation (tests, repeated runs) does not clash on the name
    spdlog::drop(kLoggerName);
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::trace);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

}  // namespace nanoflow::utils
