#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tradebrain {
namespace engine {

// Learning / confidence settings
struct LearningConfig {
    std::vector<std::string> strategies{"A", "B", "C", "D", "E"};

    int max_trade_history = 200;
    int max_insights = 100;
    int min_trades_for_adjustment = 5;
    int streak_warning_threshold = 3;
    int confidence_lookback = 20;          // per-strategy trades considered for the base adjustment
    int regime_window = 50;                // trades scanned for in-regime statistics
    int overall_window = 30;               // trades scanned for overall display statistics

    double exploration_rate = 0.10;
    bool exploration_decay_enabled = false;
    int exploration_decay_after_trades = 500;
    double exploration_decay_target = 0.02;
    double exploration_decay_constant = 300.0;

    std::uint64_t rng_seed = 0;            // 0: seeded from std::random_device
};

// Auto-allocation settings
struct AllocationConfig {
    std::vector<std::string> strategies{"A", "B", "C", "D"};

    bool enabled = true;
    int rebalance_interval = 10;
    double max_change_per_rebalance = 5.0;
    double min_allocation_pct = 5.0;
    double max_allocation_pct = 50.0;
    int history_size = 20;

    double weight_level = 0.20;
    double weight_win_rate = 0.30;
    double weight_profit_factor = 0.20;
    double weight_rl_expected = 0.20;
    double weight_streak = 0.10;
};

// Snapshot persistence settings
struct StateConfig {
    std::string dir = "state";
    std::string fallback_dir = "/tmp/tradebrain/state";
    bool async_writes = true;
    bool persist = true;
};

struct EngineConfig {
    LearningConfig learning;
    AllocationConfig allocation;
    StateConfig state;
};

} // namespace engine
} // namespace tradebrain
