#include "utils.hpp"
#include <iomanip>    // For std::put_time
#include <sstream>    // For string streams
#include <string>
#include <stdexcept>  // For std::runtime_error
#include <cmath>      // For std::pow, std::round
#include <cstdlib>    // For std::abs
#include <ctime>      // For gmtime_r

namespace core {
namespace utils {

    namespace {
        std::tm toUtcTm(std::time_t tt) {
            std::tm time_tm{};
            if (gmtime_r(&tt, &time_tm) == nullptr) {
                throw std::runtime_error("Failed to get gmtime representation for timestamp.");
            }
            return time_tm;
        }

        std::string formatOffset(int utc_offset_minutes) {
            std::ostringstream oss;
            oss << (utc_offset_minutes < 0 ? '-' : '+')
                << std::setfill('0') << std::setw(2) << std::abs(utc_offset_minutes) / 60 << ':'
                << std::setfill('0') << std::setw(2) << std::abs(utc_offset_minutes) % 60;
            return oss.str();
        }
    } // end anonymous namespace

    Timestamp fromEpochMillis(std::int64_t millis) {
        return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds(millis)));
    }

    std::int64_t toEpochMillis(const Timestamp& ts) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
    }

    std::string timestampToString(const Timestamp& ts, int utc_offset_minutes) {
        // Shift the time point, then print its fields as if they were UTC figures
        auto shifted = ts + std::chrono::minutes(utc_offset_minutes);
        std::tm time_tm = toUtcTm(std::chrono::system_clock::to_time_t(shifted));

        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%d %H:%M:%S")
            << " (UTC" << formatOffset(utc_offset_minutes) << ")";
        return oss.str();
    }

    double roundTo(double value, int decimals) {
        const double factor = std::pow(10.0, decimals);
        return std::round(value * factor) / factor;
    }

} // namespace utils
} // namespace core
