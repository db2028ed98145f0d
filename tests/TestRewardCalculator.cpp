#include "learning/RewardCalculator.h"

#include <cmath>
#include <iostream>

namespace {
bool near(double a, double b) {
    return std::abs(a - b) < 1e-9;
}
}

int main() {
    using tradebrain::learning::RewardCalculator;

    // fast winner: 2R + win bonus + fast bonus
    if (!near(RewardCalculator::calculate(50.0, 25.0, 600.0), 2.3)) {
        std::cerr << "[TEST] fast winner reward mismatch: "
                  << RewardCalculator::calculate(50.0, 25.0, 600.0) << "\n";
        return 1;
    }

    // slow loser: -1R + loss penalty
    if (!near(RewardCalculator::calculate(-25.0, 25.0, 3600.0), -1.1)) {
        std::cerr << "[TEST] slow loser reward mismatch\n";
        return 1;
    }

    // missing stop distance: no R component
    const auto no_sl = RewardCalculator::breakdown(10.0, 0.0, 1800.0);
    if (!near(no_sl.r_multiple, 0.0) || !near(no_sl.time_bonus, 0.0) || !near(no_sl.reward, 0.2)) {
        std::cerr << "[TEST] zero sl_distance should only keep the win bonus\n";
        return 1;
    }
    if (!near(RewardCalculator::calculate(10.0, -5.0, 100.0), 0.3)) {
        std::cerr << "[TEST] negative sl_distance should be treated as missing\n";
        return 1;
    }

    // break-even counts as a loss
    if (!near(RewardCalculator::calculate(0.0, 10.0, 1799.0), 0.0)) {
        std::cerr << "[TEST] break-even fast trade should be -0.1 + 0.1\n";
        return 1;
    }

    // rounded to 4 decimals
    const double rounded = RewardCalculator::calculate(1.0, 3.0, 7200.0);
    if (!near(rounded, 0.5333)) {
        std::cerr << "[TEST] reward should be rounded to 4 decimals, got " << rounded << "\n";
        return 1;
    }

    tradebrain::TradeOutcome outcome;
    outcome.profit = 40.0;
    outcome.sl_distance = 20.0;
    outcome.duration_seconds = 4000.0;
    if (!near(RewardCalculator::calculate(outcome), 2.2)) {
        std::cerr << "[TEST] outcome overload mismatch\n";
        return 1;
    }

    // non-finite inputs contribute no R-multiple
    const double nan_profit = RewardCalculator::calculate(std::nan(""), 10.0, 600.0);
    const double nan_sl = RewardCalculator::calculate(10.0, std::nan(""), 3600.0);
    if (!std::isfinite(nan_profit) || !near(nan_profit, 0.0) || !near(nan_sl, 0.2)) {
        std::cerr << "[TEST] non-finite inputs should give a finite reward, got "
                  << nan_profit << " / " << nan_sl << "\n";
        return 1;
    }

    std::cout << "[TEST] RewardCalculator PASSED\n";
    return 0;
}
