#pragma once

#include "common/Types.h"

namespace tradebrain {
namespace learning {

struct RewardBreakdown {
    double r_multiple = 0.0;
    double win_bonus = 0.0;
    double time_bonus = 0.0;
    double reward = 0.0;
};

// Scalar reward of one closed trade:
//   profit / sl_distance (0 when sl_distance <= 0 or either is not finite)
//   +0.2 for a profitable trade, -0.1 otherwise
//   +0.1 when the trade lasted under 30 minutes
// rounded to 4 decimals.
class RewardCalculator {
public:
    static constexpr double kWinBonus = 0.2;
    static constexpr double kLossPenalty = -0.1;
    static constexpr double kFastTradeBonus = 0.1;
    static constexpr double kFastTradeSeconds = 1800.0;

    static double calculate(const TradeOutcome& outcome);
    static double calculate(double profit, double sl_distance, double duration_seconds);
    static RewardBreakdown breakdown(double profit, double sl_distance, double duration_seconds);
};

} // namespace learning
} // namespace tradebrain
