#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>
#include <cstdint>

namespace core {
namespace utils {

    // Exchange open times arrive as epoch milliseconds
    Timestamp fromEpochMillis(std::int64_t millis);
    std::int64_t toEpochMillis(const Timestamp& ts);

    // Formats ts shifted by a fixed UTC offset, e.g. "2024-05-01 09:30:00 (UTC-03:00)".
    // Fixed offsets only; no DST table.
    std::string timestampToString(const Timestamp& ts, int utc_offset_minutes = 0);

    // Rounds to a fixed number of decimals (trigger prices are sent with 6)
    double roundTo(double value, int decimals);

} // namespace utils
} // namespace core
