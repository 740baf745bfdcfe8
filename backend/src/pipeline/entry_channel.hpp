#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <utility>

#include "md/depth_entry.hpp"

// Many-producer / one-consumer hand-off for entry batches.
// Producers (one per venue stream) append under the lock; the single consumer
// takes everything pending in one swap, so it always works on a private copy.
class EntryChannel {
public:
    using Clock = std::chrono::steady_clock;

    EntryChannel() = default;
    EntryChannel(const EntryChannel&) = delete;
    EntryChannel& operator=(const EntryChannel&) = delete;

    // Producer: append a batch; ignored after close()
    void push(EntryBatch&& batch) {
        if (batch.empty()) return;
        {
            std::lock_guard<std::mutex> lk(m_);
            if (closed_) return;
            if (pending_.empty()) {
                pending_ = std::move(batch);
            } else {
                pending_.insert(pending_.end(),
                                std::make_move_iterator(batch.begin()),
                                std::make_move_iterator(batch.end()));
            }
            ++pushes_;
        }
        cv_.notify_one();
    }

    // Consumer: take ownership of everything pending
    EntryBatch drain() {
        EntryBatch out;
        std::lock_guard<std::mutex> lk(m_);
        out.swap(pending_);
        return out;
    }

    // Consumer: block until something is pending, wake() is called or the
    // channel closes. Returns false once closed.
    bool wait_pending() {
        std::unique_lock<std::mutex> lk(m_);
        cv_.wait(lk, [this] { return closed_ || woken_ || !pending_.empty(); });
        woken_ = false;
        return !closed_;
    }

    // Consumer: sleep until `deadline` or wake(), regardless of arrivals.
    // Returns false if the channel closed first.
    bool wait_until(Clock::time_point deadline) {
        std::unique_lock<std::mutex> lk(m_);
        cv_.wait_until(lk, deadline, [this] { return closed_ || woken_; });
        woken_ = false;
        return !closed_;
    }

    // Make the current (or next) wait return early without data.
    void wake() {
        {
            std::lock_guard<std::mutex> lk(m_);
            woken_ = true;
        }
        cv_.notify_all();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lk(m_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    std::size_t pending() const {
        std::lock_guard<std::mutex> lk(m_);
        return pending_.size();
    }

    std::size_t pushes() const {
        std::lock_guard<std::mutex> lk(m_);
        return pushes_;
    }

private:
    mutable std::mutex m_;
    std::condition_variable cv_;
    EntryBatch pending_;
    std::size_t pushes_{0};
    bool closed_{false};
    bool woken_{false};
};
