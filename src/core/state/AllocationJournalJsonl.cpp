#include "core/state/AllocationJournalJsonl.h"
#include "common/Logger.h"

#include <algorithm>
#include <fstream>
#include <system_error>

namespace tradebrain {
namespace core {

namespace {
std::uint64_t parseSeq(const nlohmann::json& line) {
    return line.value("seq", static_cast<std::uint64_t>(0));
}

allocation::RebalanceEvent eventFromLine(const nlohmann::json& line) {
    allocation::RebalanceEvent event;
    event.timestamp_ms = line.value("ts_ms", 0LL);
    event.rebalance_number = line.value("rebalance_number", 0);
    event.allocations = line.value("allocations", allocation::AllocationMap{});

    const auto scores = line.value("fitness_scores", nlohmann::json::object());
    for (auto it = scores.begin(); it != scores.end(); ++it) {
        event.fitness_scores[it.key()] = it.value().is_object()
            ? it.value().value("score", 0.0)
            : it.value().get<double>();
    }

    const auto changes = line.value("changes", nlohmann::json::object());
    for (auto it = changes.begin(); it != changes.end(); ++it) {
        allocation::AllocationChange change;
        change.from = it.value().value("from", 0.0);
        change.to = it.value().value("to", 0.0);
        change.delta = it.value().value("delta", 0.0);
        event.changes[it.key()] = change;
    }
    return event;
}
}

AllocationJournalJsonl::AllocationJournalJsonl(std::filesystem::path file_path,
                                               engine::AllocationConfig weights)
    : file_path_(std::move(file_path)),
      weights_(std::move(weights)) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    int malformed = 0;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        try {
            const nlohmann::json line = nlohmann::json::parse(row);
            last_seq_ = (std::max)(last_seq_, parseSeq(line));
        } catch (const nlohmann::json::exception&) {
            malformed++;
        }
    }
    if (malformed > 0) {
        LOG_WARN("Allocation journal {}: skipped {} malformed line(s)", file_path_.string(), malformed);
    }
}

bool AllocationJournalJsonl::append(const allocation::RebalanceResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
    }
    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        LOG_ERROR("Allocation journal not writable: {}", file_path_.string());
        return false;
    }

    const std::uint64_t next_seq = last_seq_ + 1;
    const nlohmann::json body = result.toJson(weights_);

    nlohmann::json line;
    line["seq"] = next_seq;
    line["ts_ms"] = result.timestamp_ms;
    line["rebalance_number"] = result.rebalance_number;
    line["allocations"] = body["allocations"];
    line["fitness_scores"] = body["fitness_scores"];
    line["changes"] = body["changes"];

    out << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    out.flush();
    if (!out) {
        LOG_ERROR("Allocation journal write failed: {}", file_path_.string());
        return false;
    }
    last_seq_ = next_seq;
    return true;
}

std::vector<AllocationJournalEntry> AllocationJournalJsonl::readFrom(std::uint64_t seq_inclusive) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<AllocationJournalEntry> out;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }

        try {
            const nlohmann::json line = nlohmann::json::parse(row);
            const auto seq = parseSeq(line);
            if (seq < seq_inclusive) {
                continue;
            }
            AllocationJournalEntry entry;
            entry.seq = seq;
            entry.event = eventFromLine(line);
            out.push_back(std::move(entry));
        } catch (const nlohmann::json::exception& e) {
            LOG_WARN("Allocation journal: skipping malformed line ({})", e.what());
        }
    }

    return out;
}

std::uint64_t AllocationJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

} // namespace core
} // namespace tradebrain
