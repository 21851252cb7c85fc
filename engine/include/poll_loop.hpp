#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "config.hpp"
#include "datatypes.hpp"
#include "interfaces.hpp"
#include "signal_detector.hpp"
#include "trade_lifecycle.hpp"
#include "retry.hpp"

namespace data {
    class IMarketDataProvider;
    class INotifier;
    class SignalJournal;
}

namespace supervisor {
    class IConnectivityProbe;
    class Watchdog;
}

namespace engine {

    // Everything remembered about one instrument between cycles
    struct InstrumentState {
        strategy_engine::SignalState signal;
        execution::TradeRecord trade;
        core::Side entry_notified_side = core::Side::None;  // Alert-only instruments: entry already announced in this episode
    };

    // Collaborators of the loop. market_data and notifier are required; the rest may be null.
    struct PollLoopServices {
        data::IMarketDataProvider* market_data = nullptr;
        data::INotifier* notifier = nullptr;
        execution::TradeLifecycleManager* lifecycle = nullptr;  // Null: every instrument is alert-only
        data::SignalJournal* signal_journal = nullptr;
        supervisor::IConnectivityProbe* probe = nullptr;
        supervisor::Watchdog* watchdog = nullptr;
    };

    class PollLoop {
    public:
        using WallClock = std::function<core::Timestamp()>;

        PollLoop(const core::AppConfig& config, PollLoopServices services, std::atomic<bool>& shutdown_requested);

        // Defaults: std::this_thread::sleep_for and system_clock::now
        void setSleeper(supervisor::Sleeper sleeper);
        void setClock(WallClock clock);

        // Cycles until shutdown is requested. Never throws.
        void run();

        // One pass over every instrument. Returns false when the cycle was skipped
        // because the connectivity probe failed (the cooldown has been slept).
        bool runCycle();

        const InstrumentState* stateFor(const std::string& market_symbol) const;
        std::size_t instrumentCount() const { return instruments_.size(); }

        static std::string formatSignalMessage(const core::SignalEvent& event, int utc_offset_minutes);

    private:
        struct Instrument {
            core::InstrumentConfig config;
            std::unique_ptr<strategy_engine::SignalDetector> detector;
            InstrumentState state;
        };

        void processInstrument(Instrument& instrument);
        void handleAlert(const core::SignalEvent& event, const strategy_engine::IndicatorSnapshot& snapshot);
        void handleEntry(Instrument& instrument, const core::SignalEvent& event,
                         const strategy_engine::IndicatorSnapshot& snapshot);
        void notify(const std::string& text, const char* what);

        // Sleeps in slices, returning early once shutdown is requested
        void sleepFor(std::chrono::milliseconds duration);

        bool tradingEnabled(const Instrument& instrument) const;

        core::AppConfig config_;
        PollLoopServices services_;
        std::atomic<bool>& shutdown_requested_;
        supervisor::RetryPolicy retry_policy_;
        supervisor::Sleeper sleeper_;
        WallClock clock_;
        std::vector<Instrument> instruments_;
    };

} // namespace engine
