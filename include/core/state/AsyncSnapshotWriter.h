#pragma once

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

#include "core/contracts/IStateStore.h"

namespace tradebrain {
namespace core {

// Background writer for state snapshots. Only the latest pending snapshot per
// store is kept; older ones are replaced before they reach the disk.
// Stores must outlive the writer.
class AsyncSnapshotWriter {
public:
    AsyncSnapshotWriter();
    ~AsyncSnapshotWriter();

    AsyncSnapshotWriter(const AsyncSnapshotWriter&) = delete;
    AsyncSnapshotWriter& operator=(const AsyncSnapshotWriter&) = delete;

    // Returns false once stopped; the snapshot is dropped then.
    bool enqueue(IStateStore* store, StateSnapshot snapshot);

    // Blocks until every snapshot enqueued before the call is written.
    void flush();

    // Drains pending snapshots and joins the worker. Idempotent.
    void stop();

    bool isRunning() const { return running_; }
    long long writtenCount() const { return written_; }
    long long failedCount() const { return failed_; }

private:
    void workerLoop();

    std::atomic<bool> running_{false};
    std::atomic<long long> written_{0};
    std::atomic<long long> failed_{0};

    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::map<IStateStore*, StateSnapshot> pending_;
    bool writing_ = false;
    bool stop_requested_ = false;

    std::thread worker_;
};

} // namespace core
} // namespace tradebrain
