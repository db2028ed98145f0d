#pragma once

#include "allocation/FitnessAllocator.h"
#include "common/TimeUtils.h"
#include "common/Types.h"
#include "core/contracts/IAllocationSink.h"
#include "core/state/AsyncSnapshotWriter.h"
#include "core/state/JsonStateStore.h"
#include "engine/EngineConfig.h"
#include "learning/ConfidenceEngine.h"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tradebrain {
namespace engine {

// Owns the learner, the bandit and the allocator. Every public call runs under one
// mutex, so a single instance can be shared by the trade-close path and readers.
class LearningEngine {
public:
    explicit LearningEngine(EngineConfig config);
    LearningEngine(EngineConfig config, RandomEngine rng);
    LearningEngine(EngineConfig config, RandomEngine rng, common::Clock clock);
    ~LearningEngine();

    LearningEngine(const LearningEngine&) = delete;
    LearningEngine& operator=(const LearningEngine&) = delete;

    // Restores rl_state.json, memory.json and auto_allocation.json. A component whose
    // snapshot is missing or malformed starts fresh.
    void load();

    // ===== inbound =====
    learning::TradeAnalysis recordTrade(const TradeOutcome& outcome,
                                        const std::string& regime,
                                        const std::string& session,
                                        const IndicatorSnapshot& indicators);

    learning::SignalDecision shouldOverrideSignal(const std::string& strategy,
                                                  const std::string& regime,
                                                  const IndicatorSnapshot& indicators);

    std::optional<allocation::RebalanceResult> onTradeCompleted(
        const allocation::ExperienceMap& experience,
        const allocation::AllocationMap& current_allocations);

    std::optional<allocation::RebalanceResult> onTradeCompleted(
        const allocation::ExperienceMap& experience,
        const learning::AdjustmentMap& adjustments,
        const learning::RlStats& rl_stats,
        const allocation::AllocationMap& current_allocations);

    void notifyRegimeChange(const std::string& from_regime, const std::string& to_regime, long long at_ms = 0);
    void setAutoAllocationEnabled(bool enabled);

    // Receives every RebalanceResult, called after the engine lock is released so the
    // sink may query the engine. May be null.
    void setAllocationSink(std::shared_ptr<core::IAllocationSink> sink);

    // ===== outbound =====
    learning::AdjustmentMap getStrategyConfidenceAdjustments() const;
    learning::RlStats getRlStats() const;
    nlohmann::json getAllocationStatus() const;

    std::vector<std::string> getLearnedInsights(std::size_t limit = 20) const;
    std::string getMarketMemory(const std::string& current_regime) const;
    learning::StreakMap getStreaks() const;
    // regime / session / rsi_zone / hour / dow / transition matrices, plus per-strategy
    // and strategy|regime totals
    nlohmann::json getPerformanceReport() const;

    // Experience facts derived from the recorded history (levels stay at 1).
    allocation::ExperienceMap deriveExperience() const;

    std::size_t getTradeCount() const;
    double getExplorationRate() const;
    allocation::AllocationMap lastAllocations() const;

    // Blocks until queued snapshot writes are on disk.
    void flush();
    // Snapshots all three components.
    void saveAll();

    bool persistenceEnabled() const { return learner_store_ != nullptr; }
    const std::filesystem::path& stateDir() const { return state_dir_; }

private:
    void initStores();
    void persist(core::JsonStateStore* store, nlohmann::json payload);
    void persistLearner();
    void persistBandit();
    void persistAllocator();
    static void deliver(const std::shared_ptr<core::IAllocationSink>& sink,
                        const allocation::RebalanceResult& result);

    std::optional<allocation::RebalanceResult> completeTrade(
        const allocation::ExperienceMap& experience,
        const learning::AdjustmentMap& adjustments,
        const learning::RlStats& rl_stats,
        const allocation::AllocationMap& current_allocations);

    EngineConfig config_;
    mutable std::mutex mutex_;

    std::unique_ptr<learning::ConfidenceEngine> confidence_;
    std::unique_ptr<allocation::FitnessAllocator> allocator_;
    std::shared_ptr<core::IAllocationSink> sink_;

    std::filesystem::path state_dir_;
    std::unique_ptr<core::JsonStateStore> learner_store_;
    std::unique_ptr<core::JsonStateStore> bandit_store_;
    std::unique_ptr<core::JsonStateStore> allocation_store_;
    // Declared after the stores: destroyed first, drained before they go away.
    std::unique_ptr<core::AsyncSnapshotWriter> writer_;
};

} // namespace engine
} // namespace tradebrain
