#pragma once

#include "common/TimeUtils.h"
#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "learning/BanditStore.h"
#include "learning/LearnerState.h"
#include "learning/PatternDetector.h"
#include "learning/SignalGate.h"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace tradebrain {
namespace learning {

struct TradeAnalysis {
    std::string insight;
    double confidence_delta = 0.0;   // template-level delta of this single trade
    std::string strategy;
    double reward = 0.0;
    std::string preset;
};

struct AdjustmentView {
    double adjustment = 0.0;         // [-0.3, +0.3]
    std::string reason;
    std::string rl_preset = "moderate";
    double rl_expected = 0.5;
};

using AdjustmentMap = std::map<std::string, AdjustmentView>;

struct RlStats {
    nlohmann::json distributions = nlohmann::json::object();
    long long total_trades_analyzed = 0;
    double total_reward = 0.0;
    double avg_reward = 0.0;
    double exploration_rate = 0.0;
    AdjustmentMap confidence_adjustments;

    nlohmann::json toJson() const;
};

nlohmann::json adjustmentsToJson(const AdjustmentMap& adjustments);

// Online learner: records closed trades, keeps the bandit up to date and derives
// bounded per-strategy confidence adjustments. Not thread-safe; LearningEngine
// serializes access.
class ConfidenceEngine {
public:
    static constexpr double kMaxAdjustment = 0.3;
    static constexpr long long kTransitionWindowMs = 60LL * 60LL * 1000LL;

    // Display-view penalties for the current UTC hour / weekday and a fresh regime transition.
    static constexpr int kTimeSlotMinTrades = 8;
    static constexpr double kTimeSlotWeakRate = 0.30;
    static constexpr double kTimeSlotPenalty = 0.1;
    static constexpr int kTransitionMinTrades = 5;
    static constexpr double kTransitionWeakRate = 0.35;
    static constexpr double kTransitionPenalty = 0.15;

    explicit ConfidenceEngine(engine::LearningConfig config);
    ConfidenceEngine(engine::LearningConfig config, RandomEngine rng);
    // clock drives trade stamping and the hour / weekday / transition penalties
    ConfidenceEngine(engine::LearningConfig config, RandomEngine rng, common::Clock clock);

    TradeAnalysis analyzeTrade(const TradeOutcome& outcome,
                               const std::string& regime,
                               const std::string& session,
                               const IndicatorSnapshot& indicators);

    // Consumes one uniform draw for the exploration check.
    SignalDecision shouldOverrideSignal(const std::string& strategy,
                                        const std::string& regime,
                                        const IndicatorSnapshot& indicators);

    AdjustmentMap getStrategyConfidenceAdjustments() const;
    RlStats getRlStats() const;

    // at_ms 0: now
    void notifyRegimeChange(const std::string& from_regime, const std::string& to_regime, long long at_ms = 0);

    nlohmann::json getRegimePerformance() const;
    nlohmann::json getSessionPerformance() const;
    nlohmann::json getRsiZonePerformance() const;
    nlohmann::json getHourPerformance() const;
    nlohmann::json getDowPerformance() const;
    nlohmann::json getTransitionPerformance() const;

    std::vector<std::string> getLearnedInsights(std::size_t limit = 20) const;
    std::string getMarketMemory(const std::string& current_regime) const;
    StreakMap getStreaks() const { return PatternDetector::detectStreaks(state_.history); }
    std::size_t getTradeCount() const { return state_.history.size(); }

    double effectiveExplorationRate() const;
    std::vector<std::string> strategies() const;

    const LearnerState& state() const { return state_; }
    const BanditStore& bandit() const { return bandit_; }
    const engine::LearningConfig& config() const { return config_; }

    // memory.json payload
    nlohmann::json learnerSnapshot() const { return state_.toJson(); }
    // rl_state.json payload
    nlohmann::json banditSnapshot() const;

    void restoreLearner(LearnerState state);
    // Throws nlohmann::json::exception on malformed content; the bandit is left empty then.
    void restoreBandit(const nlohmann::json& payload);
    void resetLearner();
    void resetBandit();

private:
    void updateTables(const TradeRecord& record);
    void applyExplorationDecay();
    void recalculateAdjustments();
    std::pair<std::string, double> buildInsight(const TradeRecord& record) const;
    std::string currentRegime() const;
    long long now() const { return common::readClock(clock_); }
    void appendTimePenalties(const std::string& code, double& adj, std::vector<std::string>& reasons) const;

    engine::LearningConfig config_;
    RandomEngine rng_;
    common::Clock clock_;
    SignalGate gate_;

    LearnerState state_;
    BanditStore bandit_;

    long long rl_total_trades_ = 0;
    double rl_total_reward_ = 0.0;
    double rl_exploration_rate_ = 0.10;

    std::optional<std::pair<std::string, std::string>> last_transition_;
    long long last_transition_ms_ = 0;
};

} // namespace learning
} // namespace tradebrain
