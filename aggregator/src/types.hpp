#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Source names, also the keys of CacheState::snapshots
namespace source_names {
    inline const std::string kPrice = "price";
    inline const std::string kOrderBook = "order_book";
    inline const std::string kFunding = "funding";
    inline const std::string kOpenInterest = "open_interest";
    inline const std::string kLongShortRatio = "long_short_ratio";
    inline const std::string kLiquidations = "liquidations";
    inline const std::string kNews = "news";
    inline const std::string kPolymarket = "polymarket";
}

// ---- Source payloads ----

struct PriceTicker {
    double last = 0.0;
};

struct OrderBookWalls {
    double bid_wall_volume = 0.0;
    double ask_wall_volume = 0.0;
    double wall_ratio = 0.0;   // bid / ask, meaningful only when has_ratio
    bool has_ratio = false;    // false when the ask wall is empty
    double mid_price = 0.0;
};

struct FundingPoint {
    double rate = 0.0;
    int64_t time_ms = 0;
};

struct FundingData {
    double current_rate = 0.0;
    int64_t next_funding_time_ms = 0;
    std::vector<FundingPoint> recent;
};

struct OpenInterestData {
    double oi_contracts = 0.0;
    double oi_btc = 0.0;
    int64_t timestamp_ms = 0;
};

struct RatioPoint {
    int64_t timestamp_ms = 0;
    double ratio = 0.0;
};

struct LongShortData {
    double current_ratio = 0.0;
    std::vector<RatioPoint> history;   // newest first
};

struct LiquidationEvent {
    std::string side;   // "long" or "short"
    double price = 0.0;
    double size_btc = 0.0;
    double value_usd = 0.0;
    int64_t time_ms = 0;
};

struct LiquidationData {
    double long_usd = 0.0;
    double short_usd = 0.0;
    int long_count = 0;
    int short_count = 0;
    double total_usd = 0.0;
    std::vector<LiquidationEvent> recent_events;   // newest first, at most 20
};

struct HeadlineSentiment {
    double score = 0.0;
    std::string label;   // "bullish", "bearish", "neutral"
    double polarity = 0.0;
    int bullish_keywords = 0;
    int bearish_keywords = 0;
};

struct Headline {
    std::string title;
    std::string source;
    int64_t published_at = 0;   // unix seconds
    std::string url;
    HeadlineSentiment sentiment;
};

struct NewsSummary {
    std::string overall_sentiment;
    double avg_score = 0.0;
    int bullish_count = 0;
    int bearish_count = 0;
    int neutral_count = 0;
    std::vector<Headline> headlines;
};

struct MarketOutcome {
    std::string label;
    std::string token_id;
    std::optional<double> price;
};

struct PredictionMarket {
    std::string question;
    std::string end_date;
    std::string slug;
    std::vector<MarketOutcome> outcomes;

    const MarketOutcome* find_outcome(const std::string& label) const;
};

using SnapshotPayload = std::variant<
    PriceTicker,
    OrderBookWalls,
    FundingData,
    OpenInterestData,
    LongShortData,
    LiquidationData,
    NewsSummary,
    PredictionMarket
>;

// ---- Fetch outcomes ----

enum class FetchErrorKind {
    Timeout,
    Transport,
    HttpStatus,
    Malformed,
    Skipped
};

std::string to_string(FetchErrorKind kind);

struct FetchError {
    FetchErrorKind kind = FetchErrorKind::Transport;
    std::string message;
};

struct FetchResult {
    std::optional<SnapshotPayload> payload;
    FetchError error;

    bool ok() const { return payload.has_value(); }

    static FetchResult success(SnapshotPayload payload);
    static FetchResult failure(FetchErrorKind kind, std::string message);
};

// One fetch outcome for one source. Immutable once built.
class SourceSnapshot {
public:
    static SourceSnapshot ok(std::string source, SnapshotPayload payload, int64_t fetched_at_ms);
    static SourceSnapshot failed(std::string source, FetchError error, int64_t attempted_at_ms);

    const std::string& source() const { return source_; }
    bool is_ok() const { return payload_.has_value(); }
    int64_t timestamp_ms() const { return timestamp_ms_; }
    const FetchError& error() const { return error_; }
    const SnapshotPayload* payload() const { return payload_ ? &*payload_ : nullptr; }

    // nullptr when the fetch failed or carried another payload type
    template <typename T>
    const T* get() const {
        return payload_ ? std::get_if<T>(&*payload_) : nullptr;
    }

private:
    SourceSnapshot() = default;

    std::string source_;
    std::optional<SnapshotPayload> payload_;
    FetchError error_;
    int64_t timestamp_ms_ = 0;
};

using SnapshotMap = std::map<std::string, SourceSnapshot>;

// ---- Signals and verdicts ----

enum class SignalDirection { Up, Down, Neutral };
enum class VerdictDirection { Up, Down, Skip };

std::string to_string(SignalDirection d);
std::string to_string(VerdictDirection d);

struct SubSignalResult {
    std::string source;
    SignalDirection direction = SignalDirection::Neutral;
    double strength = 0.0;   // [0, 1]
    double weight = 0.0;
    std::string explanation;
};

struct Verdict {
    VerdictDirection direction = VerdictDirection::Skip;
    double confidence = 0.0;
    double weighted_score = 0.0;
    double normalized_score = 0.0;
    double total_available_weight = 0.0;
    std::vector<SubSignalResult> contributing_signals;
    int up_count = 0;
    int down_count = 0;
    int neutral_count = 0;
    bool insufficient_data = false;
    int64_t timestamp_ms = 0;
};

struct OddsValue {
    bool has_value = false;
    std::optional<double> share_price;
    std::optional<double> potential_payout;
    std::string detail;
};

// Everything one refresh cycle publishes; replaced whole, never patched
struct CacheState {
    uint64_t cycle_id = 0;
    Verdict verdict;
    SnapshotMap snapshots;
    std::optional<double> btc_price;
    OddsValue odds;
    int64_t last_updated_ms = 0;
};

struct HistoryEntry {
    Verdict verdict;
    std::optional<double> btc_price;
    std::map<std::string, SignalDirection> signal_directions;
};
