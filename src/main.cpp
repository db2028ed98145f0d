#include "common/Logger.h"
#include "common/Config.h"
#include "core/state/AllocationJournalJsonl.h"
#include "engine/LearningEngine.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace tradebrain;

namespace {

struct ReplayOptions {
    std::string trades_path;
    std::string config_path = "config/config.json";
    std::string state_dir;
    std::optional<std::uint64_t> seed;
    bool json_mode = false;
};

struct ReplayCounters {
    int lines = 0;
    int trades = 0;
    int signals = 0;
    int skipped_signals = 0;
    int regime_changes = 0;
    int rebalances = 0;
    int malformed = 0;
};

void printUsage() {
    std::cout << "Usage: tradebrain_replay <trades.jsonl> [--config <path>] [--state-dir <dir>]"
                 " [--seed <n>] [--json]\n";
    std::cout << "  Each line is a closed trade, or an event with \"type\": \"signal\" | \"regime_change\".\n";
}

std::optional<double> optionalNumber(const nlohmann::json& line, const char* key) {
    const auto it = line.find(key);
    if (it == line.end() || !it->is_number()) {
        return std::nullopt;
    }
    return it->get<double>();
}

IndicatorSnapshot readIndicators(const nlohmann::json& line) {
    IndicatorSnapshot indicators;
    indicators.rsi = optionalNumber(line, "rsi");
    indicators.adx = optionalNumber(line, "adx");
    indicators.atr = optionalNumber(line, "atr");
    return indicators;
}

TradeOutcome readOutcome(const nlohmann::json& line) {
    TradeOutcome outcome;
    outcome.strategy = line.value("strategy", std::string("?"));
    outcome.symbol = line.value("symbol", std::string("UNKNOWN"));
    outcome.direction = line.value("direction", std::string());
    outcome.entry_price = line.value("entry_price", 0.0);
    outcome.exit_price = line.value("exit_price", 0.0);
    outcome.ticket = line.value("ticket", 0LL);
    outcome.profit = line.value("profit", 0.0);
    outcome.won = line.value("won", outcome.profit > 0.0);
    outcome.sl_distance = line.value("sl_distance", 1.0);
    outcome.duration_seconds = line.value("duration_seconds", 3600.0);
    outcome.timestamp_ms = line.value("timestamp_ms", 0LL);
    return outcome;
}

bool parseArgs(int argc, char* argv[], ReplayOptions& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--json") {
            options.json_mode = true;
            continue;
        }
        if (arg == "--config" && i + 1 < argc) {
            options.config_path = argv[++i];
            continue;
        }
        if (arg == "--state-dir" && i + 1 < argc) {
            options.state_dir = argv[++i];
            continue;
        }
        if (arg == "--seed" && i + 1 < argc) {
            try {
                options.seed = std::stoull(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid --seed value. Ignored.\n";
            }
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            return false;
        }
        if (options.trades_path.empty()) {
            options.trades_path = arg;
            continue;
        }
        std::cerr << "Unknown argument: " << arg << "\n";
        return false;
    }
    return !options.trades_path.empty();
}

void replayLine(engine::LearningEngine& engine,
                const nlohmann::json& line,
                ReplayCounters& counters,
                allocation::AllocationMap& current,
                std::string& last_regime) {
    const std::string type = line.value("type", std::string("trade"));
    if (type == "regime_change") {
        const std::string from = line.value("from", std::string("UNKNOWN"));
        const std::string to = line.value("to", std::string("UNKNOWN"));
        engine.notifyRegimeChange(from, to, line.value("timestamp_ms", 0LL));
        last_regime = to;
        counters.regime_changes++;
        return;
    }

    const std::string regime = line.value("regime", std::string("UNKNOWN"));

    if (type == "signal") {
        const auto decision = engine.shouldOverrideSignal(
            line.value("strategy", std::string("?")), regime, readIndicators(line));
        counters.signals++;
        if (decision.skip) {
            counters.skipped_signals++;
        }
        last_regime = regime;
        return;
    }

    const TradeOutcome outcome = readOutcome(line);
    const std::string session = line.value("session", std::string("UNKNOWN"));
    const IndicatorSnapshot indicators = readIndicators(line);

    engine.recordTrade(outcome, regime, session, indicators);
    counters.trades++;
    last_regime = regime;

    const auto result = engine.onTradeCompleted(engine.deriveExperience(), current);
    if (result) {
        current = result->allocations;
        counters.rebalances++;
    }
}

void printTextReport(engine::LearningEngine& engine, const ReplayCounters& counters, const std::string& last_regime) {
    std::cout << "---------------------------------------------\n";
    std::cout << " Replay summary\n";
    std::cout << "---------------------------------------------\n";
    std::cout << "  lines:            " << counters.lines << "\n";
    std::cout << "  trades:           " << counters.trades << "\n";
    std::cout << "  signals:          " << counters.signals << " (skipped " << counters.skipped_signals << ")\n";
    std::cout << "  regime changes:   " << counters.regime_changes << "\n";
    std::cout << "  rebalances:       " << counters.rebalances << "\n";
    std::cout << "  malformed lines:  " << counters.malformed << "\n\n";

    std::cout << std::fixed << std::setprecision(3);
    std::cout << "Confidence adjustments:\n";
    for (const auto& entry : engine.getStrategyConfidenceAdjustments()) {
        std::cout << "  " << entry.first << ": " << std::showpos << entry.second.adjustment << std::noshowpos
                  << "  [" << entry.second.rl_preset << ", ev " << entry.second.rl_expected << "]  "
                  << entry.second.reason << "\n";
    }

    const auto rl = engine.getRlStats();
    std::cout << "\nRL: trades=" << rl.total_trades_analyzed
              << " avg_reward=" << std::setprecision(4) << rl.avg_reward
              << " exploration=" << rl.exploration_rate
              << " (effective " << engine.getExplorationRate() << ")\n";

    std::cout << std::setprecision(1) << "\nAllocations:\n";
    for (const auto& entry : engine.lastAllocations()) {
        std::cout << "  " << entry.first << ": " << entry.second << "%\n";
    }

    std::cout << "\nInsights:\n";
    for (const auto& insight : engine.getLearnedInsights(10)) {
        std::cout << "  - " << insight << "\n";
    }

    if (!last_regime.empty()) {
        std::cout << "\nMarket memory (" << last_regime << "):\n  " << engine.getMarketMemory(last_regime) << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    ReplayOptions options;
    if (!parseArgs(argc, argv, options)) {
        printUsage();
        return 2;
    }

    try {
        Config::getInstance().load(options.config_path);
        auto& config = Config::getInstance();
        if (!options.state_dir.empty()) {
            config.setStateDir(options.state_dir);
        }
        if (options.seed) {
            config.setRngSeed(*options.seed);
        }

        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());

        if (!options.json_mode) {
            std::cout << "\n";
            std::cout << "=============================================\n";
            std::cout << "       tradebrain replay\n";
            std::cout << "=============================================\n\n";
        }

        engine::LearningEngine engine(config.getEngineConfig());
        engine.load();

        if (engine.persistenceEnabled()) {
            engine.setAllocationSink(std::make_shared<core::AllocationJournalJsonl>(
                engine.stateDir() / "allocations.jsonl", config.getAllocationConfig()));
        }

        std::ifstream in(options.trades_path, std::ios::binary);
        if (!in.is_open()) {
            std::cerr << "Cannot open trades file: " << options.trades_path << "\n";
            return 1;
        }

        ReplayCounters counters;
        allocation::AllocationMap current = engine.lastAllocations();
        std::string last_regime;

        std::string row;
        while (std::getline(in, row)) {
            if (row.empty()) {
                continue;
            }
            counters.lines++;

            nlohmann::json line;
            try {
                line = nlohmann::json::parse(row);
            } catch (const nlohmann::json::parse_error& e) {
                counters.malformed++;
                LOG_WARN("Line {}: skipped ({})", counters.lines, e.what());
                continue;
            }
            if (!line.is_object()) {
                counters.malformed++;
                LOG_WARN("Line {}: skipped (not an object)", counters.lines);
                continue;
            }

            try {
                replayLine(engine, line, counters, current, last_regime);
            } catch (const nlohmann::json::type_error& e) {
                counters.malformed++;
                LOG_WARN("Line {}: skipped ({})", counters.lines, e.what());
            }
        }

        engine.flush();

        if (options.json_mode) {
            nlohmann::json out;
            out["lines"] = counters.lines;
            out["trades"] = counters.trades;
            out["signals"] = counters.signals;
            out["skipped_signals"] = counters.skipped_signals;
            out["rebalances"] = counters.rebalances;
            out["malformed"] = counters.malformed;
            out["confidence_adjustments"] = learning::adjustmentsToJson(engine.getStrategyConfidenceAdjustments());
            out["rl_stats"] = engine.getRlStats().toJson();
            out["allocation"] = engine.getAllocationStatus();
            out["insights"] = engine.getLearnedInsights(10);
            std::cout << out.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
        } else {
            printTextReport(engine, counters, last_regime);
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
