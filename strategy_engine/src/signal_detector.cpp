#include "signal_detector.hpp"
#include "logging.hpp"
#include <stdexcept>

namespace strategy_engine {

SignalDetector::SignalDetector(std::unique_ptr<IStrategy> strategy, core::DetectorPolicy policy)
    : strategy_(std::move(strategy)), policy_(policy)
{
    if (!strategy_) {
        throw std::invalid_argument("SignalDetector requires a strategy.");
    }
}

std::vector<core::SignalEvent> SignalDetector::detect(const std::string& instrument,
                                                      const IndicatorSnapshot& snapshot,
                                                      SignalState& state,
                                                      bool trade_active) const
{
    auto logger = core::logging::getLogger();
    std::vector<core::SignalEvent> events;

    if (!snapshot.sufficient || !snapshot.current_candle) {
        logger->debug("{}: insufficient history for {}, no signal.", instrument, strategy_->getName());
        return events;
    }

    StrategyEvaluation evaluation = strategy_->evaluate(snapshot);

    if (evaluation.long_holds && evaluation.short_holds) {
        // Tie-break: neither side wins and nothing is remembered
        logger->warn("{}: LONG and SHORT conditions both hold for {}; ignoring this bar.",
                     instrument, strategy_->getName());
        return events;
    }

    if (!evaluation.long_holds && !evaluation.short_holds) {
        if (policy_ == core::DetectorPolicy::Latch && state.latched_side != core::Side::None) {
            logger->debug("{}: back inside neutral territory, latch {} cleared.",
                          instrument, core::sideToString(state.latched_side));
            state.latched_side = core::Side::None;
        }
        return events;
    }

    const core::Side side = evaluation.long_holds ? core::Side::Long : core::Side::Short;

    if (policy_ == core::DetectorPolicy::Dedup && state.last_emitted_signal == side) {
        logger->trace("{}: {} already emitted, suppressed.", instrument, core::sideToString(side));
        return events;
    }

    auto makeEvent = [&](core::SignalKind kind, double strength) {
        core::SignalEvent event;
        event.kind = kind;
        event.side = side;
        event.instrument = instrument;
        event.price = snapshot.current_candle->close;
        event.strength = strength;
        event.timestamp = snapshot.current_candle->timestamp;
        return event;
    };

    std::optional<double> strength = strategy_->strength(snapshot, side);

    // Alert: once per episode under the latch, once per side change under dedup
    if (policy_ == core::DetectorPolicy::Dedup || state.latched_side != side) {
        events.push_back(makeEvent(core::SignalKind::Alert, strength.value_or(0.0)));
        state.latched_side = side;
    }

    // Entry: strength gate plus free slot
    if (strength && *strength >= strategy_->getEntryThreshold()) {
        if (trade_active) {
            logger->debug("{}: {} entry gate met ({:.4f}) but a trade is active.",
                          instrument, core::sideToString(side), *strength);
        } else {
            events.push_back(makeEvent(core::SignalKind::Entry, *strength));
        }
    }

    if (!events.empty()) {
        state.last_emitted_signal = side;
    }
    return events;
}

} // namespace strategy_engine
