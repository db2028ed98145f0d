#include "core/state/AsyncSnapshotWriter.h"
#include "common/Logger.h"

#include <utility>

namespace tradebrain {
namespace core {

AsyncSnapshotWriter::AsyncSnapshotWriter() {
    running_ = true;
    worker_ = std::thread(&AsyncSnapshotWriter::workerLoop, this);
}

AsyncSnapshotWriter::~AsyncSnapshotWriter() {
    stop();
}

bool AsyncSnapshotWriter::enqueue(IStateStore* store, StateSnapshot snapshot) {
    if (store == nullptr) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_requested_) {
            return false;
        }
        pending_[store] = std::move(snapshot);
    }
    cv_.notify_one();
    return true;
}

void AsyncSnapshotWriter::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return (pending_.empty() && !writing_) || !running_; });
}

void AsyncSnapshotWriter::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    running_ = false;
    idle_cv_.notify_all();
}

void AsyncSnapshotWriter::workerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        cv_.wait(lock, [this] { return stop_requested_ || !pending_.empty(); });
        if (pending_.empty()) {
            // stop requested and nothing left to write
            break;
        }

        std::map<IStateStore*, StateSnapshot> batch;
        batch.swap(pending_);
        writing_ = true;
        lock.unlock();

        for (auto& entry : batch) {
            const auto result = entry.first->save(entry.second);
            if (result.ok()) {
                written_++;
            } else {
                failed_++;
                LOG_ERROR("Snapshot write failed [{}]: {} ({})",
                          entry.first->describe(), toString(result.status), result.message);
            }
        }

        lock.lock();
        writing_ = false;
        if (pending_.empty()) {
            idle_cv_.notify_all();
        }
    }
    writing_ = false;
    idle_cv_.notify_all();
}

} // namespace core
} // namespace tradebrain
