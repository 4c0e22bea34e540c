#pragma once

#include <spdlog/spdlog.h>
#include <filesystem>
#include <optional>

namespace nanoflow::utils {

enum class VerboseLogLevel : int {
    quiet = -1,
    none = 0,
    debug = 1,
    trace = 2,
};

// Level of the stderr sink for a verbosity; the file sink always takes debug
spdlog::level::level_enum console_log_level(VerboseLogLevel level);

// Replace the default logger with a color stderr logger. With log_file set,
// everything from debug upwards is also appended to that file.
// Throws spdlog::spdlog_ex if the file cannot be opened.
void init_logging(VerboseLogLevel level,
                  const std::optional<std::filesystem::path>& log_file = std::nullopt);

}  // namespace nanoflow::utils
