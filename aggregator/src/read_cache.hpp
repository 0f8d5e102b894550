#pragma once

#include "types.hpp"
#include "history_log.hpp"
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

class CacheUnpopulatedError : public std::runtime_error {
public:
    CacheUnpopulatedError()
        : std::runtime_error("Data not yet available. Please wait for first refresh.") {}
};

// Single source of truth for API handlers. The refresh coordinator is the only
// writer. It publishes a fully built CacheState by swapping one pointer, so
// readers see either the previous state or the new one, never a mix.
class ReadCache {
public:
    explicit ReadCache(std::shared_ptr<HistoryLog> history);

    // nullptr until the first publish
    std::shared_ptr<const CacheState> get() const;

    // Same as get() but throws CacheUnpopulatedError before the first publish
    std::shared_ptr<const CacheState> require() const;

    std::vector<HistoryEntry> get_history(std::size_t limit) const;

    bool is_populated() const;

    void publish(std::shared_ptr<const CacheState> state);

private:
    mutable std::mutex mutex_;   // guards the pointer only, never held while building state
    std::shared_ptr<const CacheState> state_;
    std::shared_ptr<HistoryLog> history_;
};
