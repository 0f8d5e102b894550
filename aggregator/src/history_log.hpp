#pragma once

#include "types.hpp"
#include <cstddef>
#include <mutex>
#include <vector>

// Fixed-capacity ring of past verdicts. The oldest entry is evicted first.
class HistoryLog {
public:
    static constexpr std::size_t kDefaultCapacity = 50;

    explicit HistoryLog(std::size_t capacity = kDefaultCapacity);

    void append(HistoryEntry entry);

    // Chronological copy (oldest first) taken under the lock
    std::vector<HistoryEntry> snapshot() const;

    // The `limit` most recent entries, still oldest first
    std::vector<HistoryEntry> latest(std::size_t limit) const;

    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::vector<HistoryEntry> ring_;
    std::size_t head_ = 0;    // index of the oldest entry once the ring is full
};
