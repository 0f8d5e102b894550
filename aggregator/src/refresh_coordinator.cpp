#include "refresh_coordinator.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace {

// Slack on top of the per-source timeout, so that a client which honours the
// timeout itself reports its own error instead of a coordinator Timeout
constexpr std::chrono::milliseconds kDeadlineGrace{250};

struct CycleFlagGuard {
    std::atomic<bool>& flag;
    ~CycleFlagGuard() { flag = false; }
};

} // namespace

RefreshCoordinator::RefreshCoordinator(std::vector<std::shared_ptr<SourceClient>> sources,
                                       const SignalEvaluator& evaluator,
                                       const DecisionEngine& engine,
                                       std::shared_ptr<ReadCache> cache,
                                       std::shared_ptr<HistoryLog> history,
                                       std::shared_ptr<HealthMonitor> health,
                                       RefreshOptions options,
                                       Clock now_ms)
    : sources_(std::move(sources))
    , evaluator_(evaluator)
    , engine_(engine)
    , cache_(std::move(cache))
    , history_(std::move(history))
    , health_(std::move(health))
    , options_(options)
    , now_ms_(now_ms ? std::move(now_ms) : Clock(util::current_timestamp_ms))
{
    if (!cache_ || !history_ || !health_) {
        throw std::invalid_argument("RefreshCoordinator requires cache, history and health");
    }
    if (options_.interval.count() <= 0 || options_.source_timeout.count() <= 0) {
        throw std::invalid_argument("RefreshCoordinator interval and timeout must be > 0");
    }
    for (const auto& source : sources_) {
        if (!source) {
            throw std::invalid_argument("RefreshCoordinator given a null source");
        }
    }
}

RefreshCoordinator::~RefreshCoordinator() {
    stop();
    wait_for_pending();
}

void RefreshCoordinator::start() {
    if (running_) return;

    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_ = false;
    }
    running_ = true;
    health_->set_loop_status("running");

    loop_thread_ = std::thread([this]() { loop(); });

    spdlog::info("Refresh coordinator started: {} sources, every {}ms, timeout {}ms",
                 sources_.size(), options_.interval.count(), options_.source_timeout.count());
}

void RefreshCoordinator::stop() {
    if (!running_) return;

    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_ = true;
    }
    stop_cv_.notify_all();

    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }
    wait_for_pending();

    running_ = false;
    health_->set_loop_status("stopped");
    spdlog::info("Refresh coordinator stopped after {} cycles", cycle_counter_.load());
}

void RefreshCoordinator::loop() {
    using std::chrono::steady_clock;

    auto next = steady_clock::now();

    while (true) {
        {
            std::unique_lock<std::mutex> lock(stop_mutex_);
            if (stop_cv_.wait_until(lock, next, [this]() { return stop_requested_; })) {
                break;
            }
        }

        run_cycle();

        // Ticks that fell due while the cycle ran are dropped, not queued
        const auto now = steady_clock::now();
        next += options_.interval;
        int missed = 0;
        while (next <= now) {
            next += options_.interval;
            ++missed;
        }
        if (missed > 0) {
            spdlog::warn("Refresh cycle overran its interval, skipped {} trigger(s)", missed);
            for (int i = 0; i < missed; ++i) {
                health_->record_cycle_skipped();
            }
        }
    }
}

bool RefreshCoordinator::run_cycle() {
    bool expected = false;
    if (!cycle_in_progress_.compare_exchange_strong(expected, true)) {
        spdlog::warn("Refresh cycle already in progress, skipping trigger");
        health_->record_cycle_skipped();
        return false;
    }
    CycleFlagGuard guard{cycle_in_progress_};

    try {
        execute_cycle();
    } catch (const std::exception& e) {
        spdlog::error("Refresh cycle failed: {}", e.what());
    }
    return true;
}

void RefreshCoordinator::execute_cycle() {
    const uint64_t cycle_id = ++cycle_counter_;
    spdlog::info("Refresh cycle {} starting", cycle_id);

    SnapshotMap snapshots = fetch_all();

    std::size_t ok_count = 0;
    for (const auto& [name, snapshot] : snapshots) {
        if (snapshot.is_ok()) ok_count++;
    }

    const int64_t decided_at = now_ms_();
    Verdict verdict = engine_.decide(evaluator_.evaluate_all(snapshots), decided_at);

    auto state = std::make_shared<CacheState>();
    state->cycle_id = cycle_id;
    state->last_updated_ms = decided_at;

    auto price_it = snapshots.find(source_names::kPrice);
    if (price_it != snapshots.end()) {
        if (const auto* ticker = price_it->second.get<PriceTicker>()) {
            state->btc_price = ticker->last;
        }
    }

    const PredictionMarket* market = nullptr;
    auto market_it = snapshots.find(source_names::kPolymarket);
    if (market_it != snapshots.end()) {
        market = market_it->second.get<PredictionMarket>();
    }
    state->odds = check_odds_value(verdict, market, options_.max_share_price);

    HistoryEntry entry;
    entry.verdict = verdict;
    entry.btc_price = state->btc_price;
    for (const auto& signal : verdict.contributing_signals) {
        entry.signal_directions[signal.source] = signal.direction;
    }

    state->verdict = std::move(verdict);
    state->snapshots = std::move(snapshots);

    const Verdict& published = state->verdict;
    cache_->publish(state);
    history_->append(std::move(entry));
    health_->record_cycle_completed(decided_at);

    if (published.insufficient_data) {
        spdlog::warn("Cycle {}: no sub-signals available, verdict SKIP (insufficient data)", cycle_id);
    } else {
        spdlog::info("Cycle {}: {} confidence={:.3f} score={:+.3f} up={} down={} sources={}/{}",
                     cycle_id, to_string(published.direction), published.confidence,
                     published.normalized_score, published.up_count, published.down_count,
                     ok_count, sources_.size());
    }
}

SnapshotMap RefreshCoordinator::fetch_all() {
    struct InFlight {
        std::shared_ptr<SourceClient> source;
        std::future<FetchResult> future;
    };

    SnapshotMap snapshots;
    std::vector<InFlight> in_flight;
    const auto timeout = options_.source_timeout;

    {
        std::lock_guard<std::mutex> lock(pending_mutex_);

        for (const auto& source : sources_) {
            const std::string& name = source->name();

            auto pending = pending_.find(name);
            if (pending != pending_.end()) {
                if (pending->second.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
                    spdlog::warn("Source {} still busy with an earlier call, skipped this cycle", name);
                    FetchError error{FetchErrorKind::Skipped, "previous call still in flight"};
                    health_->record_source(name, false, error.message);
                    snapshots.emplace(name, SourceSnapshot::failed(name, error, now_ms_()));
                    continue;
                }
                // late result of a call that already counted as a timeout
                pending->second.get();
                pending_.erase(pending);
            }

            auto future = std::async(std::launch::async, [source, timeout]() {
                try {
                    return source->fetch(timeout);
                } catch (const std::exception& e) {
                    return FetchResult::failure(FetchErrorKind::Transport,
                                                std::string("client threw: ") + e.what());
                } catch (...) {
                    return FetchResult::failure(FetchErrorKind::Transport,
                                                "client threw a non-standard exception");
                }
            });
            in_flight.push_back({source, std::move(future)});
        }
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout + kDeadlineGrace;

    for (auto& call : in_flight) {
        const std::string& name = call.source->name();

        if (call.future.wait_until(deadline) != std::future_status::ready) {
            spdlog::warn("Source {} timed out after {}ms", name, timeout.count());
            FetchError error{FetchErrorKind::Timeout,
                             "no response within " + std::to_string(timeout.count()) + "ms"};
            health_->record_source(name, false, error.message);
            snapshots.emplace(name, SourceSnapshot::failed(name, error, now_ms_()));

            std::lock_guard<std::mutex> lock(pending_mutex_);
            pending_[name] = std::move(call.future);
            continue;
        }

        FetchResult result = call.future.get();
        const int64_t at = now_ms_();

        if (result.ok()) {
            health_->record_source(name, true);
            snapshots.emplace(name, SourceSnapshot::ok(name, std::move(*result.payload), at));
        } else {
            spdlog::warn("Source {} failed ({}): {}", name, to_string(result.error.kind),
                         result.error.message);
            health_->record_source(name, false, result.error.message);
            snapshots.emplace(name, SourceSnapshot::failed(name, result.error, at));
        }
    }

    return snapshots;
}

void RefreshCoordinator::wait_for_pending() {
    std::map<std::string, std::future<FetchResult>> pending;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending.swap(pending_);
    }
    for (auto& [name, future] : pending) {
        spdlog::info("Waiting for in-flight call to {}", name);
        future.wait();
    }
}
