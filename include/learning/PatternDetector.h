#pragma once

#include "common/Types.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tradebrain {
namespace learning {

struct StreakInfo {
    int current_streak = 0;
    StreakType type = StreakType::NONE;
    int max_win_streak = 0;
    int max_loss_streak = 0;
};

using StreakMap = std::map<std::string, StreakInfo>;

// Stateless pattern recognition over the trade history.
// Buckets need kMinTradesForPattern trades before they produce a sentence.
class PatternDetector {
public:
    static constexpr int kMinTradesForPattern = 5;

    // "oversold" (<30), "overbought" (>70), "neutral", "unknown" when missing
    static std::string rsiZone(const std::optional<double>& rsi);

    static StreakMap detectStreaks(const TradeHistory& history);

    static std::vector<std::string> detectRegimeBias(const TradeHistory& history);
    static std::vector<std::string> detectTimePatterns(const TradeHistory& history);
    static std::vector<std::string> detectIndicatorPatterns(const TradeHistory& history);

    // One paragraph: overall win rate, regime leaders, best session, last indicator readings.
    static std::string generateMarketMemory(const TradeHistory& history, const std::string& current_regime);

    // 0.72 -> "72%"
    static std::string formatPercent(double rate);
};

} // namespace learning
} // namespace tradebrain
