#include "types.hpp"

const MarketOutcome* PredictionMarket::find_outcome(const std::string& label) const {
    for (const auto& outcome : outcomes) {
        if (outcome.label == label) {
            return &outcome;
        }
    }
    return nullptr;
}

std::string to_string(FetchErrorKind kind) {
    switch (kind) {
        case FetchErrorKind::Timeout: return "timeout";
        case FetchErrorKind::Transport: return "transport";
        case FetchErrorKind::HttpStatus: return "http_status";
        case FetchErrorKind::Malformed: return "malformed";
        case FetchErrorKind::Skipped: return "skipped";
    }
    return "unknown";
}

FetchResult FetchResult::success(SnapshotPayload payload) {
    FetchResult result;
    result.payload = std::move(payload);
    return result;
}

FetchResult FetchResult::failure(FetchErrorKind kind, std::string message) {
    FetchResult result;
    result.error = FetchError{kind, std::move(message)};
    return result;
}

SourceSnapshot SourceSnapshot::ok(std::string source, SnapshotPayload payload, int64_t fetched_at_ms) {
    SourceSnapshot snap;
    snap.source_ = std::move(source);
    snap.payload_ = std::move(payload);
    snap.timestamp_ms_ = fetched_at_ms;
    return snap;
}

SourceSnapshot SourceSnapshot::failed(std::string source, FetchError error, int64_t attempted_at_ms) {
    SourceSnapshot snap;
    snap.source_ = std::move(source);
    snap.error_ = std::move(error);
    snap.timestamp_ms_ = attempted_at_ms;
    return snap;
}

std::string to_string(SignalDirection d) {
    switch (d) {
        case SignalDirection::Up: return "UP";
        case SignalDirection::Down: return "DOWN";
        case SignalDirection::Neutral: return "NEUTRAL";
    }
    return "NEUTRAL";
}

std::string to_string(VerdictDirection d) {
    switch (d) {
        case VerdictDirection::Up: return "UP";
        case VerdictDirection::Down: return "DOWN";
        case VerdictDirection::Skip: return "SKIP";
    }
    return "SKIP";
}
