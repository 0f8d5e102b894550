#pragma once

#include "types.hpp"
#include "source_client.hpp"
#include "evaluators.hpp"
#include "decision_engine.hpp"
#include "read_cache.hpp"
#include "history_log.hpp"
#include "health.hpp"
#include "odds.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

struct RefreshOptions {
    std::chrono::milliseconds interval{45000};
    std::chrono::milliseconds source_timeout{10000};
    double max_share_price = kDefaultMaxSharePrice;
};

// Single writer of the ReadCache. Each cycle fetches every source
// concurrently, evaluates whatever succeeded, decides, then publishes one
// complete CacheState and appends the verdict to the history.
//
// A source that misses its deadline is recorded as a Timeout for that cycle.
// Its call keeps running in the background and the source is reported as
// Skipped until the call returns, so one client never runs twice at once.
class RefreshCoordinator {
public:
    using Clock = std::function<int64_t()>;

    RefreshCoordinator(std::vector<std::shared_ptr<SourceClient>> sources,
                       const SignalEvaluator& evaluator,
                       const DecisionEngine& engine,
                       std::shared_ptr<ReadCache> cache,
                       std::shared_ptr<HistoryLog> history,
                       std::shared_ptr<HealthMonitor> health,
                       RefreshOptions options = RefreshOptions(),
                       Clock now_ms = nullptr);
    ~RefreshCoordinator();

    RefreshCoordinator(const RefreshCoordinator&) = delete;
    RefreshCoordinator& operator=(const RefreshCoordinator&) = delete;

    // Runs the first cycle immediately, then one per interval
    void start();

    // Waits for the running cycle and for in-flight source calls
    void stop();

    bool is_running() const { return running_; }

    // One cycle on the calling thread. Returns false without doing anything
    // when another cycle is already in progress.
    bool run_cycle();

    uint64_t last_cycle_id() const { return cycle_counter_; }

private:
    std::vector<std::shared_ptr<SourceClient>> sources_;
    SignalEvaluator evaluator_;
    DecisionEngine engine_;
    std::shared_ptr<ReadCache> cache_;
    std::shared_ptr<HistoryLog> history_;
    std::shared_ptr<HealthMonitor> health_;
    RefreshOptions options_;
    Clock now_ms_;

    std::atomic<bool> cycle_in_progress_{false};
    std::atomic<uint64_t> cycle_counter_{0};

    // timed-out calls still running, by source name
    std::mutex pending_mutex_;
    std::map<std::string, std::future<FetchResult>> pending_;

    std::atomic<bool> running_{false};
    std::thread loop_thread_;
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    bool stop_requested_ = false;

    void loop();
    void execute_cycle();
    SnapshotMap fetch_all();
    void wait_for_pending();
};
