#pragma once

#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "learning/ConfidenceEngine.h"

#include <deque>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace tradebrain {
namespace allocation {

// Per-strategy experience as reported by the XP/leveling collaborator.
struct ExperienceFacts {
    int level = 1;                 // 1-10
    double win_rate = 0.0;         // 0-1
    int total_trades = 0;
    double total_profit = 0.0;
    int wins = 0;
    int losses = 0;
    int current_streak = 0;
    StreakType streak_type = StreakType::NONE;
};

using ExperienceMap = std::map<std::string, ExperienceFacts>;
using AllocationMap = std::map<std::string, double>;

struct FitnessBreakdown {
    int level = 1;
    double level_score = 0.0;
    double win_rate = 0.0;
    double win_rate_score = 0.0;
    double profit_factor_score = 0.0;
    double rl_expected = 0.5;
    double rl_score = 0.5;
    int streak_length = 0;
    StreakType streak_type = StreakType::NONE;
    double streak_score = 0.5;
};

struct FitnessScore {
    double score = 0.0;            // composite, 4 decimals
    FitnessBreakdown breakdown;
    int total_trades = 0;
    double total_profit = 0.0;

    nlohmann::json toJson(const engine::AllocationConfig& weights) const;
    static FitnessScore fromJson(const nlohmann::json& j);
};

using FitnessMap = std::map<std::string, FitnessScore>;

struct AllocationChange {
    double from = 0.0;
    double to = 0.0;
    double delta = 0.0;
};

struct RebalanceEvent {
    long long timestamp_ms = 0;
    int rebalance_number = 0;
    AllocationMap allocations;
    std::map<std::string, double> fitness_scores;
    std::map<std::string, AllocationChange> changes;

    nlohmann::json toJson() const;
    static RebalanceEvent fromJson(const nlohmann::json& j);
};

struct RebalanceResult {
    AllocationMap allocations;
    FitnessMap fitness_scores;
    int rebalance_number = 0;
    std::map<std::string, AllocationChange> changes;
    long long timestamp_ms = 0;

    nlohmann::json toJson(const engine::AllocationConfig& weights) const;
};

// Every `rebalance_interval` completed trades: fitness -> bounded target -> smoothed
// allocation. Resulting allocations sum to 100, stay within
// [min_allocation_pct, max_allocation_pct] and move by at most
// max_change_per_rebalance per strategy. Not thread-safe.
class FitnessAllocator {
public:
    explicit FitnessAllocator(engine::AllocationConfig config);

    std::optional<RebalanceResult> onTradeCompleted(const ExperienceMap& experience,
                                                    const learning::AdjustmentMap& adjustments,
                                                    const learning::RlStats& rl_stats,
                                                    const AllocationMap& current);

    FitnessMap calculateFitnessScores(const ExperienceMap& experience,
                                      const learning::AdjustmentMap& adjustments,
                                      const learning::RlStats& rl_stats) const;
    AllocationMap calculateTargetAllocations(const FitnessMap& scores) const;
    AllocationMap applySmoothing(const AllocationMap& current, const AllocationMap& target) const;

    nlohmann::json getStatus() const;
    void setEnabled(bool enabled);
    bool isEnabled() const { return enabled_; }

    int tradesSinceRebalance() const { return trades_since_rebalance_; }
    int totalRebalances() const { return total_rebalances_; }
    const AllocationMap& lastAllocations() const { return last_allocations_; }
    const std::deque<RebalanceEvent>& history() const { return history_; }
    const engine::AllocationConfig& config() const { return config_; }

    // auto_allocation.json payload
    nlohmann::json toJson() const;
    // Throws nlohmann::json::exception on malformed content.
    void restore(const nlohmann::json& payload);
    void reset();

private:
    double defaultShare() const;

    engine::AllocationConfig config_;

    bool enabled_ = true;
    int trades_since_rebalance_ = 0;
    int total_rebalances_ = 0;
    long long last_rebalance_ms_ = 0;
    FitnessMap last_fitness_;
    AllocationMap last_allocations_;
    std::deque<RebalanceEvent> history_;
};

} // namespace allocation
} // namespace tradebrain
