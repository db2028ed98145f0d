#pragma once

#include <cstdint>
#include <vector>

#include "allocation/FitnessAllocator.h"

namespace tradebrain {
namespace core {

// One delivered rebalance. seq is the allocation version.
struct AllocationJournalEntry {
    std::uint64_t seq = 0;
    allocation::RebalanceEvent event;
};

class IAllocationSink {
public:
    virtual ~IAllocationSink() = default;

    virtual bool append(const allocation::RebalanceResult& result) = 0;
    virtual std::vector<AllocationJournalEntry> readFrom(std::uint64_t seq_inclusive) = 0;
    virtual std::uint64_t lastSeq() const = 0;
};

} // namespace core
} // namespace tradebrain
