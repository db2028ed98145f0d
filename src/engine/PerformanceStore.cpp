#include "engine/PerformanceStore.h"

#include <cmath>

namespace tradebrain {
namespace engine {
namespace {
void accumulateStats(StrategyPerformanceStats& s, const TradeRecord& trade) {
    s.trades++;
    s.net_profit += trade.profit;
    if (trade.won) {
        s.wins++;
    }
    if (trade.profit > 0.0) {
        s.gross_profit += trade.profit;
    } else if (trade.profit < 0.0) {
        s.gross_loss_abs += std::abs(trade.profit);
    }

    const StreakType type = trade.won ? StreakType::WIN : StreakType::LOSS;
    if (s.streak_type == type) {
        s.current_streak++;
    } else {
        s.streak_type = type;
        s.current_streak = 1;
    }
}
}

void PerformanceStore::rebuild(const TradeHistory& history) {
    by_strategy_.clear();
    by_bucket_.clear();

    for (const auto& trade : history) {
        const std::string strategy_name = trade.strategy.empty() ? "unknown" : trade.strategy;
        accumulateStats(by_strategy_[strategy_name], trade);
        accumulateStats(by_bucket_[{strategy_name, trade.regime}], trade);
    }
}

allocation::ExperienceMap PerformanceStore::experience() const {
    allocation::ExperienceMap out;
    for (const auto& entry : by_strategy_) {
        const auto& s = entry.second;
        allocation::ExperienceFacts facts;
        facts.level = 1;
        facts.win_rate = s.winRate();
        facts.total_trades = s.trades;
        facts.total_profit = s.net_profit;
        facts.wins = s.wins;
        facts.losses = s.trades - s.wins;
        facts.current_streak = s.current_streak;
        facts.streak_type = s.streak_type;
        out[entry.first] = facts;
    }
    return out;
}

} // namespace engine
} // namespace tradebrain
