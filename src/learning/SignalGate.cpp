#include "learning/SignalGate.h"
#include "learning/PatternDetector.h"

#include <algorithm>
#include <iterator>

#include <spdlog/fmt/fmt.h>

namespace tradebrain {
namespace learning {

const char* toString(GateReason reason) {
    switch (reason) {
        case GateReason::EXPLORATION: return "EXPLORATION";
        case GateReason::INSUFFICIENT_DATA: return "INSUFFICIENT_DATA";
        case GateReason::REGIME_UNDERPERFORMANCE: return "REGIME_UNDERPERFORMANCE";
        case GateReason::LOSS_STREAK: return "LOSS_STREAK";
        case GateReason::RSI_ZONE_UNDERPERFORMANCE: return "RSI_ZONE_UNDERPERFORMANCE";
        case GateReason::BANDIT_PESSIMISM: return "BANDIT_PESSIMISM";
        case GateReason::APPROVED: return "APPROVED";
    }
    return "APPROVED";
}

SignalGate::SignalGate(GateThresholds thresholds)
    : thresholds_(thresholds) {}

SignalDecision SignalGate::evaluate(const std::string& strategy,
                                    const std::string& regime,
                                    const IndicatorSnapshot& indicators,
                                    const LearnerState& state,
                                    const BanditStore& bandit,
                                    double exploration_rate,
                                    double exploration_draw) const {
    if (exploration_draw < exploration_rate) {
        return {false, GateReason::EXPLORATION,
                "RL exploration: allowing signal despite potential concerns (exploration rate)"};
    }

    const auto& history = state.history;
    const std::size_t window = static_cast<std::size_t>(std::max(0, thresholds_.window));
    const auto begin = (history.size() > window)
        ? std::prev(history.end(), static_cast<std::ptrdiff_t>(window))
        : history.begin();

    int total = 0;
    int wins = 0;
    for (auto it = begin; it != history.end(); ++it) {
        if (it->strategy == strategy && it->regime == regime) {
            total++;
            if (it->won) {
                wins++;
            }
        }
    }

    if (total < thresholds_.min_trades) {
        return {false, GateReason::INSUFFICIENT_DATA, "Insufficient data to override"};
    }

    const double win_rate = safeDiv(wins, total);
    if (win_rate < thresholds_.override_win_rate && total >= thresholds_.override_min_trades) {
        return {true, GateReason::REGIME_UNDERPERFORMANCE, fmt::format(
            "RL override: Strategy {} has {} win rate in {} over {} trades (below {} threshold). Signal skipped.",
            strategy, PatternDetector::formatPercent(win_rate), regime, total,
            PatternDetector::formatPercent(thresholds_.override_win_rate))};
    }
    if (wins == 0 && total >= thresholds_.min_trades) {
        return {true, GateReason::REGIME_UNDERPERFORMANCE, fmt::format(
            "RL override: Strategy {} has 0% win rate in {} over last {} trades. Skipping signal.",
            strategy, regime, total)};
    }

    const auto streaks = PatternDetector::detectStreaks(history);
    const auto streak = streaks.find(strategy);
    if (streak != streaks.end() && streak->second.type == StreakType::LOSS &&
        streak->second.current_streak >= thresholds_.loss_streak_override) {
        return {true, GateReason::LOSS_STREAK, fmt::format(
            "RL override: Strategy {} is on a {}-trade losing streak (threshold: {}). "
            "Signal overridden until streak breaks.",
            strategy, streak->second.current_streak, thresholds_.loss_streak_override)};
    }

    if (indicators.rsi) {
        const std::string zone = PatternDetector::rsiZone(indicators.rsi);
        const auto strat_it = state.rsi_zone_stats.find(strategy);
        if (strat_it != state.rsi_zone_stats.end()) {
            const auto zone_it = strat_it->second.find(zone);
            if (zone_it != strat_it->second.end() && zone_it->second.total() >= thresholds_.min_trades) {
                const double zone_rate = zone_it->second.winRate();
                if (zone_rate <= thresholds_.rsi_zone_win_rate) {
                    return {true, GateReason::RSI_ZONE_UNDERPERFORMANCE, fmt::format(
                        "RL override: Strategy {} has {} win rate in {} RSI zone. Skipping signal.",
                        strategy, PatternDetector::formatPercent(zone_rate), zone)};
                }
            }
        }
    }

    const double best_ev = bandit.bestExpected(strategy, regime).second;
    if (best_ev < thresholds_.bandit_min_ev && total >= thresholds_.bandit_min_trades) {
        return {true, GateReason::BANDIT_PESSIMISM, fmt::format(
            "RL override: Thompson Sampling shows very low expected value ({}) for {} in {}. Signal skipped.",
            PatternDetector::formatPercent(best_ev), strategy, regime)};
    }

    return {false, GateReason::APPROVED, "Signal approved by RL learning engine"};
}

} // namespace learning
} // namespace tradebrain
