#include "history_log.hpp"
#include <algorithm>
#include <stdexcept>

HistoryLog::HistoryLog(std::size_t capacity)
    : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("HistoryLog capacity must be > 0");
    }
    ring_.reserve(capacity_);
}

void HistoryLog::append(HistoryEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (ring_.size() < capacity_) {
        ring_.push_back(std::move(entry));
        return;
    }

    ring_[head_] = std::move(entry);
    head_ = (head_ + 1) % capacity_;
}

std::vector<HistoryEntry> HistoryLog::snapshot() const {
    return latest(capacity_);
}

std::vector<HistoryEntry> HistoryLog::latest(std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::size_t count = std::min(limit, ring_.size());
    std::vector<HistoryEntry> out;
    out.reserve(count);

    // head_ is 0 until the ring wraps, so this also covers the partial case
    const std::size_t skip = ring_.size() - count;
    for (std::size_t i = skip; i < ring_.size(); ++i) {
        out.push_back(ring_[(head_ + i) % ring_.size()]);
    }
    return out;
}

std::size_t HistoryLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ring_.size();
}
