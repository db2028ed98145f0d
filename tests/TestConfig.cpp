#include "common/Config.h"
#include <iostream>
#include <cassert>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>

// Simple manual test runner
int main() {
    using namespace tradebrain;

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    // 1. Get Instance
    Config& config = Config::getInstance();

    // 2. Defaults before any load
    {
        const auto learning = config.getLearningConfig();
        assert(learning.strategies.size() == 5);
        assert(learning.max_trade_history == 200);
        assert(std::abs(learning.exploration_rate - 0.10) < 1e-9);

        const auto allocation = config.getAllocationConfig();
        assert(allocation.strategies.size() == 4);
        assert(allocation.rebalance_interval == 10);
        assert(std::abs(allocation.max_change_per_rebalance - 5.0) < 1e-9);
        assert(std::abs(allocation.weight_win_rate - 0.30) < 1e-9);
    }

    // 3. Missing file keeps defaults
    config.load("does/not/exist/config.json");
    assert(config.getLearningConfig().min_trades_for_adjustment == 5);

    // 4. Load from a real file
    const auto dir = std::filesystem::temp_directory_path() / "tradebrain_test_config";
    std::filesystem::create_directories(dir);
    const auto path = dir / "config.json";
    {
        std::ofstream out(path);
        out << R"({
            "logging": {"level": "debug", "dir": "custom_logs"},
            "state": {"dir": "/tmp/tradebrain_state_from_file", "async_writes": false},
            "learning": {
                "strategies": ["a", " b ", "B", "z"],
                "max_trade_history": 150,
                "exploration_rate": 1.7,
                "exploration_decay_enabled": true,
                "rng_seed": 99
            },
            "allocation": {
                "rebalance_interval": 0,
                "max_allocation_pct": 40.0,
                "weights": {"win_rate": 0.5, "streak": 0.0}
            }
        })";
    }

    setenv("TRADEBRAIN_STATE_DIR", "", 1);
    config.load(path.string());

    assert(config.getLogLevel() == "debug");
    assert(config.getLogDir() == "custom_logs");

    const auto learning = config.getLearningConfig();
    std::cout << "Learning strategies: " << learning.strategies.size() << std::endl;
    assert(learning.strategies.size() == 3);
    assert(learning.strategies[0] == "A");
    assert(learning.strategies[1] == "B");
    assert(learning.strategies[2] == "Z");
    assert(learning.max_trade_history == 150);
    assert(std::abs(learning.exploration_rate - 1.0) < 1e-9);   // clamped
    assert(learning.exploration_decay_enabled);
    assert(learning.rng_seed == 99);
    assert(learning.max_insights == 100);                        // untouched key

    const auto allocation = config.getAllocationConfig();
    assert(allocation.rebalance_interval == 1);                  // at least one trade
    assert(std::abs(allocation.max_allocation_pct - 40.0) < 1e-9);
    assert(std::abs(allocation.weight_win_rate - 0.5) < 1e-9);
    assert(std::abs(allocation.weight_streak - 0.0) < 1e-9);
    assert(std::abs(allocation.weight_level - 0.20) < 1e-9);

    const auto state = config.getStateConfig();
    assert(state.dir == "/tmp/tradebrain_state_from_file");
    assert(!state.async_writes);

    // 5. Environment override for the state directory
    setenv("TRADEBRAIN_STATE_DIR", "/tmp/tradebrain_state_from_env", 1);
    config.load(path.string());
    assert(config.getStateConfig().dir == "/tmp/tradebrain_state_from_env");
    unsetenv("TRADEBRAIN_STATE_DIR");

    // 6. Setters used by the replay tool
    config.setRngSeed(5);
    config.setStateDir("elsewhere");
    assert(config.getEngineConfig().learning.rng_seed == 5);
    assert(config.getEngineConfig().state.dir == "elsewhere");

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);

    std::cout << "[TEST] Config Test PASSED!" << std::endl;

    return 0;
}
