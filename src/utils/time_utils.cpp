#include "time_utils.h"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace nanoflow::utils {

std::string utc_timestamp(std::chrono::system_clock::time_point tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string format_elapsed(std::int64_t milliseconds) {
    if (milliseconds < 0) milliseconds = 0;
    std::int64_t seconds = milliseconds / 1000;
    std::int64_t hours = seconds / 3600;
    std::int64_t minutes = (seconds % 3600) / 60;
    seconds %= 60;

    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << hours << ":"
        << std::setw(2) << minutes << ":" << std::setw(2) << seconds;
    return oss.str();
}

} // namespace nanoflow::utils
