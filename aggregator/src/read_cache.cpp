#include "read_cache.hpp"

ReadCache::ReadCache(std::shared_ptr<HistoryLog> history)
    : history_(std::move(history)) {
    if (!history_) {
        throw std::invalid_argument("ReadCache requires a HistoryLog");
    }
}

std::shared_ptr<const CacheState> ReadCache::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::shared_ptr<const CacheState> ReadCache::require() const {
    auto state = get();
    if (!state) {
        throw CacheUnpopulatedError();
    }
    return state;
}

std::vector<HistoryEntry> ReadCache::get_history(std::size_t limit) const {
    return history_->latest(limit);
}

bool ReadCache::is_populated() const {
    return get() != nullptr;
}

void ReadCache::publish(std::shared_ptr<const CacheState> state) {
    if (!state) return;
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = std::move(state);
}
