#include "engine/LearningEngine.h"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

using namespace tradebrain;

namespace {
class RecordingSink : public core::IAllocationSink {
public:
    bool append(const allocation::RebalanceResult& result) override {
        events.push_back(result.rebalance_number);
        return true;
    }
    std::vector<core::AllocationJournalEntry> readFrom(std::uint64_t) override { return {}; }
    std::uint64_t lastSeq() const override { return events.size(); }

    std::vector<int> events;
};

// Reads engine status from inside the delivery callback.
class StatusReadingSink : public core::IAllocationSink {
public:
    explicit StatusReadingSink(engine::LearningEngine& engine) : engine_(engine) {}

    bool append(const allocation::RebalanceResult& result) override {
        const auto status = engine_.getAllocationStatus();
        seen.push_back(status.value("total_rebalances", -1));
        numbers.push_back(result.rebalance_number);
        return true;
    }
    std::vector<core::AllocationJournalEntry> readFrom(std::uint64_t) override { return {}; }
    std::uint64_t lastSeq() const override { return numbers.size(); }

    std::vector<int> seen;
    std::vector<int> numbers;

private:
    engine::LearningEngine& engine_;
};

TradeOutcome makeOutcome(const std::string& strategy, bool won, long long ticket) {
    TradeOutcome o;
    o.strategy = strategy;
    o.symbol = "EURUSD";
    o.ticket = ticket;
    o.profit = won ? 15.0 : -10.0;
    o.won = won;
    o.sl_distance = 10.0;
    o.duration_seconds = 1800.0;
    return o;
}

engine::EngineConfig makeConfig(const std::filesystem::path& dir) {
    engine::EngineConfig cfg;
    cfg.learning.exploration_rate = 0.0;
    cfg.learning.rng_seed = 11;
    cfg.allocation.rebalance_interval = 10;
    cfg.state.dir = dir.string();
    cfg.state.fallback_dir = dir.string();
    cfg.state.async_writes = true;
    return cfg;
}

const allocation::AllocationMap kEqual{{"A", 25.0}, {"B", 25.0}, {"C", 25.0}, {"D", 25.0}};
const std::vector<std::string> kCodes{"A", "B", "C", "D"};
}

int main() {
    std::cout << "[TEST] Starting LearningEngine Test..." << std::endl;

    const auto dir = std::filesystem::temp_directory_path() / "tradebrain_test_engine";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);

    allocation::AllocationMap saved_allocations;

    // 1. Record, rebalance, persist
    {
        engine::LearningEngine engine(makeConfig(dir), RandomEngine(11));
        assert(engine.persistenceEnabled());
        assert(engine.stateDir() == dir);
        engine.load();
        assert(engine.getTradeCount() == 0);

        auto sink = std::make_shared<RecordingSink>();
        engine.setAllocationSink(sink);

        int rebalances = 0;
        for (int i = 0; i < 12; ++i) {
            const std::string& code = kCodes[static_cast<std::size_t>(i) % kCodes.size()];
            IndicatorSnapshot ind;
            ind.rsi = 40.0 + i;
            engine.recordTrade(makeOutcome(code, code == "A" || i % 3 == 0, 100 + i), "TRENDING_UP", "LONDON", ind);

            const auto result = engine.onTradeCompleted(engine.deriveExperience(), kEqual);
            if (result) {
                rebalances++;
                assert(i == 9);
                double sum = 0.0;
                for (const auto& entry : result->allocations) {
                    sum += entry.second;
                    assert(entry.second >= 5.0 - 1e-9 && entry.second <= 50.0 + 1e-9);
                    assert(std::abs(entry.second - 25.0) <= 5.0 + 1e-9);
                }
                assert(std::abs(sum - 100.0) < 1e-6);
            }
        }
        assert(rebalances == 1);
        assert(sink->events.size() == 1 && sink->events.front() == 1);
        assert(engine.getTradeCount() == 12);

        const auto experience = engine.deriveExperience();
        assert(experience.at("A").total_trades == 3);
        assert(experience.at("A").wins == 3);
        assert(experience.at("A").streak_type == StreakType::WIN);

        saved_allocations = engine.lastAllocations();
        assert(saved_allocations.size() == 4);

        engine.setAutoAllocationEnabled(false);
        assert(!engine.onTradeCompleted(engine.deriveExperience(), saved_allocations));
        assert(engine.getAllocationStatus()["enabled"] == false);

        const auto report = engine.getPerformanceReport();
        assert(report.contains("regime") && report.contains("transition"));
        assert(report["strategy"]["A"]["trades"] == 3);
        assert(report["strategy"]["A"]["profit_factor"] == 0.0);
        assert(report["strategy_regime"]["A|TRENDING_UP"]["streak"] == "win:3");
        assert(!engine.getLearnedInsights(5).empty());

        engine.flush();
    }

    assert(std::filesystem::exists(dir / "memory.json"));
    assert(std::filesystem::exists(dir / "rl_state.json"));
    assert(std::filesystem::exists(dir / "auto_allocation.json"));

    // 2. Restart restores every component
    {
        engine::LearningEngine engine(makeConfig(dir), RandomEngine(11));
        engine.load();
        assert(engine.getTradeCount() == 12);
        assert(engine.getRlStats().total_trades_analyzed == 12);

        const auto status = engine.getAllocationStatus();
        assert(status["enabled"] == false);
        assert(status["total_rebalances"] == 1);

        const auto restored = engine.lastAllocations();
        assert(restored.size() == saved_allocations.size());
        for (const auto& entry : saved_allocations) {
            assert(std::abs(restored.at(entry.first) - entry.second) < 1e-9);
        }
    }

    // 3. Corrupt learner snapshot: learner starts fresh, the others still load
    {
        std::ofstream out(dir / "memory.json", std::ios::trunc);
        out << "{\"trade_history\": [";
    }
    {
        engine::LearningEngine engine(makeConfig(dir), RandomEngine(11));
        engine.load();
        assert(engine.getTradeCount() == 0);
        assert(engine.getRlStats().total_trades_analyzed == 12);
        assert(engine.getAllocationStatus()["total_rebalances"] == 1);

        const auto view = engine.getStrategyConfidenceAdjustments();
        assert(view.size() == 5);
        assert(view.at("A").adjustment == 0.0);
    }

    // 4. Well-formed JSON with wrong field types is treated the same way
    {
        std::ofstream out(dir / "memory.json", std::ios::trunc);
        out << "{\"trade_history\": [1, 2, 3], \"schema_version\": 1}";
    }
    {
        engine::LearningEngine engine(makeConfig(dir), RandomEngine(11));
        engine.load();
        assert(engine.getTradeCount() == 0);
    }

    // 5. Memory-only mode with concurrent callers
    {
        auto cfg = makeConfig(dir);
        cfg.state.persist = false;
        cfg.learning.exploration_rate = 0.2;
        engine::LearningEngine engine(cfg, RandomEngine(3));
        assert(!engine.persistenceEnabled());
        engine.load();

        std::vector<std::thread> workers;
        for (int t = 0; t < 4; ++t) {
            workers.emplace_back([&engine, t]() {
                for (int i = 0; i < 25; ++i) {
                    const std::string code = kCodes[static_cast<std::size_t>(t)];
                    engine.recordTrade(makeOutcome(code, i % 2 == 0, t * 100 + i), "RANGING", "ASIAN", IndicatorSnapshot{});
                    engine.shouldOverrideSignal(code, "RANGING", IndicatorSnapshot{});
                    engine.getStrategyConfidenceAdjustments();
                    engine.getRlStats();
                    engine.getMarketMemory("RANGING");
                }
            });
        }
        for (auto& w : workers) {
            w.join();
        }

        assert(engine.getTradeCount() == 100);
        assert(std::abs(engine.getExplorationRate() - 0.2) < 1e-12);
        assert(engine.getRlStats().total_trades_analyzed == 100);
        for (const auto& entry : engine.getStrategyConfidenceAdjustments()) {
            assert(std::abs(entry.second.adjustment) <= 0.3 + 1e-9);
        }
        engine.flush();
        engine.saveAll();
    }

    // 6. A sink may call back into the engine while a rebalance is delivered
    {
        auto cfg = makeConfig(dir);
        cfg.state.persist = false;
        cfg.allocation.rebalance_interval = 2;
        engine::LearningEngine engine(cfg, RandomEngine(5));
        engine.load();

        auto sink = std::make_shared<StatusReadingSink>(engine);
        engine.setAllocationSink(sink);

        engine.recordTrade(makeOutcome("A", true, 1), "RANGING", "ASIAN", IndicatorSnapshot{});
        assert(!engine.onTradeCompleted(engine.deriveExperience(), kEqual));
        engine.recordTrade(makeOutcome("B", false, 2), "RANGING", "ASIAN", IndicatorSnapshot{});
        const auto result = engine.onTradeCompleted(engine.deriveExperience(), kEqual);
        assert(result);

        assert(sink->numbers.size() == 1 && sink->numbers[0] == result->rebalance_number);
        assert(sink->seen.size() == 1 && sink->seen[0] == 1);
    }

    // 7. Invalid UTF-8 in trade labels does not break snapshot writes
    {
        const auto label_dir = std::filesystem::temp_directory_path() / "tradebrain_test_engine_labels";
        std::filesystem::remove_all(label_dir, ec);

        {
            engine::LearningEngine engine(makeConfig(label_dir), RandomEngine(9));
            engine.load();
            TradeOutcome odd = makeOutcome("A", true, 1);
            odd.symbol = "EUR\xff";
            engine.recordTrade(odd, "RANGING", "ASIAN", IndicatorSnapshot{});
            engine.flush();
        }
        assert(std::filesystem::exists(label_dir / "memory.json"));
        {
            auto cfg = makeConfig(label_dir);
            cfg.state.async_writes = false;
            engine::LearningEngine engine(cfg, RandomEngine(9));
            engine.load();
            assert(engine.getTradeCount() == 1);

            TradeOutcome odd = makeOutcome("B", false, 2);
            odd.symbol = "\xc3\x28USD";
            engine.recordTrade(odd, "RANGING", "ASIAN", IndicatorSnapshot{});
            engine.saveAll();
        }
        {
            engine::LearningEngine engine(makeConfig(label_dir), RandomEngine(9));
            engine.load();
            assert(engine.getTradeCount() == 2);
        }
        std::filesystem::remove_all(label_dir, ec);
    }

    std::filesystem::remove_all(dir, ec);
    std::cout << "[TEST] LearningEngine PASSED" << std::endl;
    return 0;
}
