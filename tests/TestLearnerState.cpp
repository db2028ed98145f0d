#include "learning/LearnerState.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace tradebrain;
using namespace tradebrain::learning;

int main() {
    std::cout << "[TEST] Starting LearnerState Test..." << std::endl;

    // 1. History is capped, oldest first out
    LearnerState state;
    for (int i = 0; i < 210; ++i) {
        TradeRecord r;
        r.strategy = (i % 2 == 0) ? "A" : "B";
        r.regime = "RANGING";
        r.session = "LONDON";
        r.ticket = i;
        r.profit = (i % 3 == 0) ? -5.0 : 7.5;
        r.won = r.profit > 0.0;
        r.timestamp_ms = 1700000000000LL + i * 60000LL;
        if (i % 4 == 0) {
            r.indicators.rsi = 28.0;
        }
        state.appendTrade(r, 200);
    }
    assert(state.history.size() == 200);
    assert(state.history.front().ticket == 10);
    assert(state.history.back().ticket == 209);

    for (int i = 0; i < 5; ++i) {
        InsightRecord insight;
        insight.text = "insight " + std::to_string(i);
        insight.reward = 0.1 * i;
        state.appendInsight(insight, 3);
    }
    assert(state.insights.size() == 3);
    assert(state.insights.front().text == "insight 2");

    // 2. Tallies
    state.regime_stats["A"]["RANGING"].add(true, 7.5);
    state.regime_stats["A"]["RANGING"].add(false, -5.0);
    state.hour_stats["A"]["EURUSD"][13].add(true, 2.0);
    state.dow_stats["B"]["EURUSD"][4].add(false, -1.0);
    state.transition_stats["RANGING->TRENDING_UP"]["A"].add(true, 3.0);
    state.adjustments["A"] = 0.15;
    state.adjustments["B"] = -0.3;
    state.total_trade_count = 210;
    state.current_exploration_rate = 0.08;

    const auto& tally = state.regime_stats["A"]["RANGING"];
    assert(tally.total() == 2);
    assert(std::abs(tally.winRate() - 0.5) < 1e-9);
    assert(std::abs(tally.avgProfit() - 1.25) < 1e-9);
    assert(OutcomeTally{}.winRate() == 0.0);

    // 3. memory.json shape and restore
    const auto j = state.toJson();
    assert(j["trade_history"].size() == 200);
    assert(j["trade_history"][2]["rsi"].is_number());   // ticket 12
    assert(j["trade_history"][1]["rsi"].is_null());
    assert(j["hour_stats"]["A"]["EURUSD"].contains("13"));
    assert(j["insights"][0].contains("rl_reward"));

    const auto restored = LearnerState::fromJson(j);
    assert(restored.history.size() == 200);
    assert(restored.history.front().ticket == 10);
    assert(restored.history[2].indicators.rsi.has_value());
    assert(!restored.history.front().indicators.rsi.has_value());
    assert(!restored.history[1].indicators.rsi.has_value());
    assert(!restored.history[1].indicators.atr.has_value());
    assert(restored.regime_stats.at("A").at("RANGING").wins == 1);
    assert(restored.hour_stats.at("A").at("EURUSD").at(13).wins == 1);
    assert(restored.dow_stats.at("B").at("EURUSD").at(4).losses == 1);
    assert(restored.transition_stats.at("RANGING->TRENDING_UP").at("A").total() == 1);
    assert(std::abs(restored.insights.back().reward - 0.4) < 1e-9);
    assert(std::abs(restored.adjustments.at("B") + 0.3) < 1e-9);
    assert(restored.total_trade_count == 210);
    assert(std::abs(restored.current_exploration_rate - 0.08) < 1e-9);

    // 4. Missing keys keep defaults
    const auto sparse = LearnerState::fromJson(nlohmann::json::object());
    assert(sparse.history.empty());
    assert(sparse.total_trade_count == 0);
    assert(std::abs(sparse.current_exploration_rate - 0.10) < 1e-9);

    nlohmann::json legacy_trade = {{"strategy", "C"}, {"profit", 4.0}};
    const auto legacy = tradeRecordFromJson(legacy_trade);
    assert(legacy.won);
    assert(legacy.regime == "UNKNOWN");
    assert(!legacy.indicators.rsi.has_value());

    // 5. Malformed content throws a json exception
    bool threw = false;
    try {
        LearnerState::fromJson(nlohmann::json{{"trade_history", {1, 2, 3}}});
    } catch (const nlohmann::json::exception&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        LearnerState::fromJson(nlohmann::json{{"total_trade_count", "many"}});
    } catch (const nlohmann::json::exception&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[TEST] LearnerState PASSED" << std::endl;
    return 0;
}
