#pragma once

#include "common/Types.h"

#include <deque>
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace tradebrain {
namespace learning {

struct OutcomeTally {
    int wins = 0;
    int losses = 0;
    double total_profit = 0.0;

    int total() const { return wins + losses; }
    double winRate() const { return safeDiv(wins, total()); }
    double avgProfit() const { return safeDiv(total_profit, total()); }

    void add(bool won, double profit) {
        if (won) {
            wins++;
        } else {
            losses++;
        }
        total_profit += profit;
    }
};

// strategy -> bucket -> tally
using TallyTable = std::map<std::string, std::map<std::string, OutcomeTally>>;
// strategy -> symbol -> hour (0-23) or weekday (0=Monday) -> tally
using TimeTallyTable = std::map<std::string, std::map<std::string, std::map<int, OutcomeTally>>>;

struct InsightRecord {
    long long timestamp_ms = 0;
    std::string text;
    double confidence = 0.0;
    std::string strategy;
    std::string type = "TRADE_ANALYSIS";
    double reward = 0.0;
};

// Everything the learner persists to memory.json.
// The history is the source of truth; the tables are running aggregates of every
// trade ever recorded and survive history eviction.
struct LearnerState {
    static constexpr int kSchemaVersion = 1;

    TradeHistory history;
    TallyTable regime_stats;
    TallyTable session_stats;
    TallyTable rsi_zone_stats;
    TimeTallyTable hour_stats;
    TimeTallyTable dow_stats;
    TallyTable transition_stats; // "FROM->TO" -> strategy -> tally
    std::deque<InsightRecord> insights;
    std::map<std::string, double> adjustments;
    long long total_trade_count = 0;
    double current_exploration_rate = 0.10;

    void appendTrade(TradeRecord record, std::size_t max_history);
    void appendInsight(InsightRecord insight, std::size_t max_insights);

    nlohmann::json toJson() const;
    // Throws nlohmann::json::exception on malformed content.
    static LearnerState fromJson(const nlohmann::json& data);
};

nlohmann::json tradeRecordToJson(const TradeRecord& record);
TradeRecord tradeRecordFromJson(const nlohmann::json& j);

nlohmann::json tallyToJson(const OutcomeTally& tally);

} // namespace learning
} // namespace tradebrain
