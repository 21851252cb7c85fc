#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

#include "datatypes.hpp"

namespace spdlog { class logger; }

namespace data {

// Everything written for one detected signal
struct SignalRecord {
    core::SignalEvent event;
    std::map<std::string, double> indicator_values;
    std::optional<double> stop_loss;     // Target levels, entries only
    std::optional<double> take_profit;
};

// Append-only, one line per signal, one file per calendar day:
//   <directory>/<base_name>_YYYY-MM-DD.log
class SignalJournal {
public:
    SignalJournal(const std::string& directory, const std::string& base_name, int utc_offset_minutes);

    void record(const SignalRecord& record);

    // File currently being written (today's), for attaching to notifications
    std::string currentFile() const;

    // Single journal line, without trailing newline
    static std::string formatLine(const SignalRecord& record, int utc_offset_minutes);

private:
    std::shared_ptr<spdlog::logger> logger_;
    int utc_offset_minutes_;
};

} // namespace data
