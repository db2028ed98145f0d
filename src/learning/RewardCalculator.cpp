#include "learning/RewardCalculator.h"

#include <cmath>

namespace tradebrain {
namespace learning {

double RewardCalculator::calculate(const TradeOutcome& outcome) {
    return calculate(outcome.profit, outcome.sl_distance, outcome.duration_seconds);
}

double RewardCalculator::calculate(double profit, double sl_distance, double duration_seconds) {
    return breakdown(profit, sl_distance, duration_seconds).reward;
}

RewardBreakdown RewardCalculator::breakdown(double profit, double sl_distance, double duration_seconds) {
    RewardBreakdown out;
    out.r_multiple = (sl_distance > 0.0) ? (profit / sl_distance) : 0.0;
    if (!std::isfinite(out.r_multiple)) {
        out.r_multiple = 0.0;
    }
    out.win_bonus = (profit > 0.0) ? kWinBonus : kLossPenalty;
    out.time_bonus = (duration_seconds < kFastTradeSeconds) ? kFastTradeBonus : 0.0;
    out.reward = roundTo(out.r_multiple + out.win_bonus + out.time_bonus, 4);
    return out;
}

} // namespace learning
} // namespace tradebrain
