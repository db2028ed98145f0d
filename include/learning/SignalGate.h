#pragma once

#include "common/Types.h"
#include "learning/BanditStore.h"
#include "learning/LearnerState.h"

#include <string>

namespace tradebrain {
namespace learning {

enum class GateReason {
    EXPLORATION,
    INSUFFICIENT_DATA,
    REGIME_UNDERPERFORMANCE,
    LOSS_STREAK,
    RSI_ZONE_UNDERPERFORMANCE,
    BANDIT_PESSIMISM,
    APPROVED
};

const char* toString(GateReason reason);

struct SignalDecision {
    bool skip = false;
    GateReason code = GateReason::APPROVED;
    std::string reason;
};

struct GateThresholds {
    int window = 50;                    // most recent trades scanned
    int min_trades = 5;                 // (strategy, regime) sample needed to veto at all
    double override_win_rate = 0.25;
    int override_min_trades = 5;
    int loss_streak_override = 4;
    double rsi_zone_win_rate = 0.15;
    double bandit_min_ev = 0.25;
    int bandit_min_trades = 10;
};

// Ordered veto checks on a pending signal; the first match decides.
// The exploration draw is passed in so the gate itself is deterministic.
class SignalGate {
public:
    explicit SignalGate(GateThresholds thresholds = GateThresholds());

    SignalDecision evaluate(const std::string& strategy,
                            const std::string& regime,
                            const IndicatorSnapshot& indicators,
                            const LearnerState& state,
                            const BanditStore& bandit,
                            double exploration_rate,
                            double exploration_draw) const;

    const GateThresholds& thresholds() const { return thresholds_; }

private:
    GateThresholds thresholds_;
};

} // namespace learning
} // namespace tradebrain
