#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>

#include "core/contracts/IAllocationSink.h"
#include "engine/EngineConfig.h"

namespace tradebrain {
namespace core {

// Append-only JSONL file, one rebalance per line.
class AllocationJournalJsonl : public IAllocationSink {
public:
    AllocationJournalJsonl(std::filesystem::path file_path, engine::AllocationConfig weights);

    bool append(const allocation::RebalanceResult& result) override;
    std::vector<AllocationJournalEntry> readFrom(std::uint64_t seq_inclusive) override;
    std::uint64_t lastSeq() const override;

    const std::filesystem::path& path() const { return file_path_; }

private:
    std::filesystem::path file_path_;
    engine::AllocationConfig weights_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
};

} // namespace core
} // namespace tradebrain
