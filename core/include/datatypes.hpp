#pragma once // Use #pragma once for include guards (common practice)

#include <string>
#include <vector>
#include <chrono> // For timestamps

namespace core {

    // Using system_clock for time points (exchange open times are epoch milliseconds)
    using Timestamp = std::chrono::system_clock::time_point;


    struct Candle {
        Timestamp timestamp; // Candle open time
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        double volume = 0.0; // Crypto volumes are fractional

        bool operator<(const Candle& other) const {
            return timestamp < other.timestamp;
        }
    };

    // Direction of a breakout, a latch, or a position
    enum class Side {
        None,
        Long,
        Short
    };

    // An informational alert and a trade entry are distinct events
    enum class SignalKind {
        Alert,
        Entry
    };

    struct SignalEvent {
        SignalKind kind = SignalKind::Alert;
        Side side = Side::None;
        std::string instrument;
        double price = 0.0;    // Close of the last closed candle
        double strength = 0.0; // Strategy-specific magnitude (e.g. % beyond band)
        Timestamp timestamp;

        bool operator==(const SignalEvent& other) const {
            return kind == other.kind && side == other.side && instrument == other.instrument;
        }
    };

    inline Side opposite(Side side) {
        switch (side) {
            case Side::Long:  return Side::Short;
            case Side::Short: return Side::Long;
            default:          return Side::None;
        }
    }

    inline const char* sideToString(Side side) {
        switch (side) {
            case Side::Long:  return "LONG";
            case Side::Short: return "SHORT";
            default:          return "NONE";
        }
    }

    inline const char* signalKindToString(SignalKind kind) {
        return kind == SignalKind::Alert ? "ALERT" : "ENTRY";
    }

    // Basic TimeSeries concept
    template<typename T>
    using TimeSeries = std::vector<T>;

} // namespace core
