#include "signal_journal.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/fmt/fmt.h>

namespace data {

SignalJournal::SignalJournal(const std::string& directory, const std::string& base_name, int utc_offset_minutes)
    : logger_(core::logging::createDailyLogger("signal_journal", directory, base_name)),
      utc_offset_minutes_(utc_offset_minutes)
{
    core::logging::getLogger()->info("Signal journal writing to {}", currentFile());
}

std::string SignalJournal::formatLine(const SignalRecord& record, int utc_offset_minutes) {
    const core::SignalEvent& event = record.event;
    std::string line = fmt::format("{} | {} | {} {} | price={:.8f} | strength={:.4f}",
                                   core::utils::timestampToString(event.timestamp, utc_offset_minutes),
                                   event.instrument,
                                   core::signalKindToString(event.kind),
                                   core::sideToString(event.side),
                                   event.price,
                                   event.strength);
    for (const auto& [name, value] : record.indicator_values) {
        line += fmt::format(" | {}={:.8f}", name, value);
    }
    if (record.stop_loss) {
        line += fmt::format(" | sl={:.8f}", *record.stop_loss);
    }
    if (record.take_profit) {
        line += fmt::format(" | tp={:.8f}", *record.take_profit);
    }
    return line;
}

void SignalJournal::record(const SignalRecord& record) {
    logger_->info(formatLine(record, utc_offset_minutes_));
}

std::string SignalJournal::currentFile() const {
    for (const auto& sink : logger_->sinks()) {
        if (auto daily = std::dynamic_pointer_cast<spdlog::sinks::daily_file_sink_mt>(sink)) {
            return daily->filename();
        }
    }
    return std::string();
}

} // namespace data
