#pragma once

#include "interfaces.hpp"
#include "config.hpp"
#include "datatypes.hpp"
#include <memory>
#include <string>
#include <vector>

namespace strategy_engine {

    // Per-instrument detector memory. Created on first observation, mutated by
    // detect(), never destroyed while the process runs.
    struct SignalState {
        core::Side latched_side = core::Side::None;         // Side already alerted in this episode
        core::Side last_emitted_signal = core::Side::None;  // Side of the last alert or entry
    };

    // Turns a snapshot into gated, de-duplicated events.
    //
    // Latch policy: an Alert fires once per breakout episode (the latch clears when
    // neither side holds). An Entry fires whenever the strength meets the entry
    // threshold and no trade is active, independently of the latch.
    // Dedup policy: a side equal to last_emitted_signal suppresses both events.
    //
    // Insufficient data, or both sides holding at once, produce no event and leave
    // the state untouched.
    class SignalDetector {
    public:
        SignalDetector(std::unique_ptr<IStrategy> strategy, core::DetectorPolicy policy);

        // Events are ordered Alert before Entry
        std::vector<core::SignalEvent> detect(const std::string& instrument,
                                              const IndicatorSnapshot& snapshot,
                                              SignalState& state,
                                              bool trade_active) const;

        const IStrategy& getStrategy() const { return *strategy_; }
        core::DetectorPolicy getPolicy() const { return policy_; }

    private:
        std::unique_ptr<IStrategy> strategy_;
        core::DetectorPolicy policy_;
    };

} // namespace strategy_engine
