#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace nanoflow::utils {

// ISO 8601 UTC timestamp, e.g. "2026-10-19T08:15:02Z"
std::string utc_timestamp(std::chrono::system_clock::time_point tp = std::chrono::system_clock::now());

// Elapsed time as "HH:MM:SS"
std::string format_elapsed(std::int64_t milliseconds);

} // namespace nanoflow::utils
