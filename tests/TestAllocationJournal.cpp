#include "core/state/AllocationJournalJsonl.h"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace tradebrain;

namespace {
allocation::RebalanceResult makeResult(int number, double a_share) {
    allocation::RebalanceResult result;
    result.rebalance_number = number;
    result.timestamp_ms = 1700000000000LL + number;
    result.allocations = {{"A", a_share}, {"B", 100.0 - a_share}};

    allocation::FitnessScore score;
    score.score = 0.61;
    score.breakdown.level = 3;
    score.breakdown.streak_type = StreakType::WIN;
    score.breakdown.streak_length = 2;
    score.total_trades = 12;
    result.fitness_scores["A"] = score;
    result.fitness_scores["B"].score = 0.23;

    result.changes["A"] = {50.0, a_share, a_share - 50.0};
    result.changes["B"] = {50.0, 100.0 - a_share, 50.0 - a_share};
    return result;
}
}

int main() {
    const auto dir = std::filesystem::temp_directory_path() / "tradebrain_test_journal";
    const auto path = dir / "allocations.jsonl";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);

    engine::AllocationConfig weights;
    weights.strategies = {"A", "B"};

    {
        core::AllocationJournalJsonl journal(path, weights);
        if (journal.lastSeq() != 0) {
            std::cerr << "[TEST] empty journal should start at seq 0\n";
            return 1;
        }
        if (!journal.append(makeResult(1, 55.0)) || !journal.append(makeResult(2, 60.0))) {
            std::cerr << "[TEST] append failed\n";
            return 1;
        }
        if (journal.lastSeq() != 2) {
            std::cerr << "[TEST] lastSeq should be 2, got " << journal.lastSeq() << "\n";
            return 1;
        }

        const auto rows = journal.readFrom(2);
        if (rows.size() != 1 || rows.front().seq != 2) {
            std::cerr << "[TEST] readFrom(2) should return exactly the second entry\n";
            return 1;
        }
        const auto& event = rows.front().event;
        if (event.rebalance_number != 2 || std::fabs(event.allocations.at("A") - 60.0) > 1e-9 ||
            std::fabs(event.fitness_scores.at("A") - 0.61) > 1e-9 ||
            std::fabs(event.changes.at("B").delta + 10.0) > 1e-9) {
            std::cerr << "[TEST] journal entry content mismatch\n";
            return 1;
        }
    }

    // Full fitness breakdown is kept on disk
    {
        std::ifstream in(path);
        std::string first_line;
        std::getline(in, first_line);
        const auto line = nlohmann::json::parse(first_line);
        if (line["fitness_scores"]["A"]["breakdown"]["streak"]["value"] != "win:2" ||
            line["fitness_scores"]["A"]["breakdown"]["xp_level"]["value"] != 3) {
            std::cerr << "[TEST] fitness breakdown missing from journal line\n";
            return 1;
        }
    }

    {
        std::ofstream out(path, std::ios::app);
        out << "{\"seq\": 3, \"allocations\": \n";
    }

    // Reopen: sequence continues after the last valid entry
    core::AllocationJournalJsonl reopened(path, weights);
    if (reopened.lastSeq() != 2) {
        std::cerr << "[TEST] reopened journal should recover seq 2, got " << reopened.lastSeq() << "\n";
        return 1;
    }
    if (reopened.readFrom(1).size() != 2) {
        std::cerr << "[TEST] malformed line should be skipped on read\n";
        return 1;
    }
    if (!reopened.append(makeResult(3, 58.0)) || reopened.lastSeq() != 3) {
        std::cerr << "[TEST] append after reopen should yield seq 3\n";
        return 1;
    }
    const auto tail = reopened.readFrom(3);
    if (tail.size() != 1 || tail.front().event.rebalance_number != 3) {
        std::cerr << "[TEST] readFrom(3) after reopen mismatch\n";
        return 1;
    }

    // Labels with invalid UTF-8 still produce a readable line
    {
        auto odd = makeResult(4, 52.0);
        odd.allocations["X\xff"] = 0.0;
        if (!reopened.append(odd) || reopened.lastSeq() != 4) {
            std::cerr << "[TEST] append with invalid UTF-8 label failed\n";
            return 1;
        }
        const auto rows = reopened.readFrom(4);
        if (rows.size() != 1 || rows.front().event.allocations.count("X\xEF\xBF\xBD") != 1) {
            std::cerr << "[TEST] invalid UTF-8 label not replaced in journal\n";
            return 1;
        }
    }

    std::filesystem::remove_all(dir, ec);
    std::cout << "[TEST] AllocationJournal PASSED\n";
    return 0;
}
