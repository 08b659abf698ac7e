/**
 * @file TimeUtils.hpp
 * @brief UTC timestamp formatting shared by pack generation and card ingestion.
 */

#pragma once

#include <chrono>
#include <string>

namespace contextwallet::infrastructure {

class TimeUtils {
public:
    /** @brief "YYYY-MM-DDTHH:MM:SSZ" in UTC, second precision. */
    static std::string ToIsoTimestamp(const std::chrono::system_clock::time_point& tp);

    static std::string NowIso();
};

} // namespace contextwallet::infrastructure
