#pragma once

#include "allocation/FitnessAllocator.h"
#include "common/Types.h"

#include <map>
#include <string>
#include <utility>

namespace tradebrain {
namespace engine {

struct StrategyPerformanceStats {
    int trades = 0;
    int wins = 0;
    double gross_profit = 0.0;
    double gross_loss_abs = 0.0;
    double net_profit = 0.0;
    int current_streak = 0;
    StreakType streak_type = StreakType::NONE;

    double winRate() const {
        return (trades > 0) ? (static_cast<double>(wins) / static_cast<double>(trades)) : 0.0;
    }
    double expectancy() const {
        return (trades > 0) ? (net_profit / static_cast<double>(trades)) : 0.0;
    }
    double profitFactor() const {
        return (gross_loss_abs > 1e-12) ? (gross_profit / gross_loss_abs) : 0.0;
    }
};

// (strategy, regime)
using PerformanceBucketKey = std::pair<std::string, std::string>;

// Aggregates a trade log into strategy-level stats and the experience facts the
// allocator consumes when no XP collaborator supplies them. Levels stay at 1.
class PerformanceStore {
public:
    void rebuild(const TradeHistory& history);

    allocation::ExperienceMap experience() const;

    const std::map<std::string, StrategyPerformanceStats>& byStrategy() const {
        return by_strategy_;
    }
    const std::map<PerformanceBucketKey, StrategyPerformanceStats>& byBucket() const {
        return by_bucket_;
    }

private:
    std::map<std::string, StrategyPerformanceStats> by_strategy_;
    std::map<PerformanceBucketKey, StrategyPerformanceStats> by_bucket_;
};

} // namespace engine
} // namespace tradebrain
