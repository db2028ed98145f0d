#include "learning/LearnerState.h"

namespace tradebrain {
namespace learning {

namespace {
std::optional<double> optionalNumber(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<double>();
}

void putOptional(nlohmann::json& j, const char* key, const std::optional<double>& v) {
    if (v) {
        j[key] = *v;
    } else {
        j[key] = nullptr;
    }
}

OutcomeTally tallyFromJson(const nlohmann::json& j) {
    OutcomeTally t;
    t.wins = j.value("wins", 0);
    t.losses = j.value("losses", 0);
    t.total_profit = j.value("total_profit", 0.0);
    return t;
}

nlohmann::json tableToJson(const TallyTable& table) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [outer, inner] : table) {
        for (const auto& [bucket, tally] : inner) {
            out[outer][bucket] = tallyToJson(tally);
        }
    }
    return out;
}

TallyTable tableFromJson(const nlohmann::json& j) {
    TallyTable table;
    for (auto outer = j.begin(); outer != j.end(); ++outer) {
        for (auto inner = outer.value().begin(); inner != outer.value().end(); ++inner) {
            table[outer.key()][inner.key()] = tallyFromJson(inner.value());
        }
    }
    return table;
}

nlohmann::json timeTableToJson(const TimeTallyTable& table) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [strategy, symbols] : table) {
        for (const auto& [symbol, slots] : symbols) {
            for (const auto& [slot, tally] : slots) {
                out[strategy][symbol][std::to_string(slot)] = tallyToJson(tally);
            }
        }
    }
    return out;
}

TimeTallyTable timeTableFromJson(const nlohmann::json& j) {
    TimeTallyTable table;
    for (auto s = j.begin(); s != j.end(); ++s) {
        for (auto sym = s.value().begin(); sym != s.value().end(); ++sym) {
            for (auto slot = sym.value().begin(); slot != sym.value().end(); ++slot) {
                int key = 0;
                try {
                    key = std::stoi(slot.key());
                } catch (const std::exception&) {
                    continue;
                }
                table[s.key()][sym.key()][key] = tallyFromJson(slot.value());
            }
        }
    }
    return table;
}
}

nlohmann::json tallyToJson(const OutcomeTally& tally) {
    return {
        {"wins", tally.wins},
        {"losses", tally.losses},
        {"total_profit", tally.total_profit}
    };
}

nlohmann::json tradeRecordToJson(const TradeRecord& record) {
    nlohmann::json j;
    j["strategy"] = record.strategy;
    j["symbol"] = record.symbol;
    j["regime"] = record.regime;
    j["session"] = record.session;
    putOptional(j, "rsi", record.indicators.rsi);
    putOptional(j, "adx", record.indicators.adx);
    putOptional(j, "atr", record.indicators.atr);
    j["direction"] = record.direction;
    j["entry_price"] = record.entry_price;
    j["exit_price"] = record.exit_price;
    j["ticket"] = record.ticket;
    j["profit"] = record.profit;
    j["won"] = record.won;
    j["sl_distance"] = record.sl_distance;
    j["duration_seconds"] = record.duration_seconds;
    j["timestamp_ms"] = record.timestamp_ms;
    return j;
}

TradeRecord tradeRecordFromJson(const nlohmann::json& j) {
    TradeRecord r;
    r.strategy = j.value("strategy", std::string("?"));
    r.symbol = j.value("symbol", std::string("UNKNOWN"));
    r.regime = j.value("regime", std::string("UNKNOWN"));
    r.session = j.value("session", std::string("UNKNOWN"));
    r.indicators.rsi = optionalNumber(j, "rsi");
    r.indicators.adx = optionalNumber(j, "adx");
    r.indicators.atr = optionalNumber(j, "atr");
    r.direction = j.value("direction", std::string());
    r.entry_price = j.value("entry_price", 0.0);
    r.exit_price = j.value("exit_price", 0.0);
    r.ticket = j.value("ticket", 0LL);
    r.profit = j.value("profit", 0.0);
    r.won = j.value("won", r.profit > 0.0);
    r.sl_distance = j.value("sl_distance", 1.0);
    r.duration_seconds = j.value("duration_seconds", 3600.0);
    r.timestamp_ms = j.value("timestamp_ms", 0LL);
    return r;
}

void LearnerState::appendTrade(TradeRecord record, std::size_t max_history) {
    history.push_back(std::move(record));
    while (history.size() > max_history) {
        history.pop_front();
    }
}

void LearnerState::appendInsight(InsightRecord insight, std::size_t max_insights) {
    insights.push_back(std::move(insight));
    while (insights.size() > max_insights) {
        insights.pop_front();
    }
}

nlohmann::json LearnerState::toJson() const {
    nlohmann::json j;

    nlohmann::json trades = nlohmann::json::array();
    for (const auto& record : history) {
        trades.push_back(tradeRecordToJson(record));
    }
    j["trade_history"] = std::move(trades);

    j["regime_stats"] = tableToJson(regime_stats);
    j["session_stats"] = tableToJson(session_stats);
    j["rsi_zone_stats"] = tableToJson(rsi_zone_stats);
    j["hour_stats"] = timeTableToJson(hour_stats);
    j["dow_stats"] = timeTableToJson(dow_stats);
    j["transition_stats"] = tableToJson(transition_stats);

    nlohmann::json insight_rows = nlohmann::json::array();
    for (const auto& insight : insights) {
        insight_rows.push_back({
            {"timestamp_ms", insight.timestamp_ms},
            {"text", insight.text},
            {"confidence", insight.confidence},
            {"strategy", insight.strategy},
            {"type", insight.type},
            {"rl_reward", insight.reward}
        });
    }
    j["insights"] = std::move(insight_rows);

    j["confidence_adjustments"] = adjustments;
    j["total_trade_count"] = total_trade_count;
    j["current_exploration_rate"] = current_exploration_rate;
    return j;
}

LearnerState LearnerState::fromJson(const nlohmann::json& data) {
    LearnerState state;

    for (const auto& row : data.value("trade_history", nlohmann::json::array())) {
        state.history.push_back(tradeRecordFromJson(row));
    }

    state.regime_stats = tableFromJson(data.value("regime_stats", nlohmann::json::object()));
    state.session_stats = tableFromJson(data.value("session_stats", nlohmann::json::object()));
    state.rsi_zone_stats = tableFromJson(data.value("rsi_zone_stats", nlohmann::json::object()));
    state.hour_stats = timeTableFromJson(data.value("hour_stats", nlohmann::json::object()));
    state.dow_stats = timeTableFromJson(data.value("dow_stats", nlohmann::json::object()));
    state.transition_stats = tableFromJson(data.value("transition_stats", nlohmann::json::object()));

    for (const auto& row : data.value("insights", nlohmann::json::array())) {
        InsightRecord insight;
        insight.timestamp_ms = row.value("timestamp_ms", 0LL);
        insight.text = row.value("text", std::string());
        insight.confidence = row.value("confidence", 0.0);
        insight.strategy = row.value("strategy", std::string());
        insight.type = row.value("type", std::string("TRADE_ANALYSIS"));
        insight.reward = row.value("rl_reward", 0.0);
        state.insights.push_back(std::move(insight));
    }

    state.adjustments = data.value("confidence_adjustments", std::map<std::string, double>{});
    state.total_trade_count = data.value("total_trade_count", 0LL);
    state.current_exploration_rate = data.value("current_exploration_rate", state.current_exploration_rate);
    return state;
}

} // namespace learning
} // namespace tradebrain
