#include "infrastructure/TimeUtils.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace contextwallet::infrastructure {

std::string TimeUtils::ToIsoTimestamp(const std::chrono::system_clock::time_point& tp) {
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = {};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string TimeUtils::NowIso() {
    return ToIsoTimestamp(std::chrono::system_clock::now());
}

} // namespace contextwallet::infrastructure
