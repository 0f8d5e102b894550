#include "sentiment.hpp"
#include "util.hpp"
#include <cctype>
#include <unordered_map>

namespace sentiment {

namespace {

const std::vector<std::string> kBullishKeywords = {
    "etf approved", "etf approval", "institutional", "adoption",
    "bullish", "rally", "surge", "breakout", "all-time high", "ath",
    "accumulation", "buying", "inflow",
};

const std::vector<std::string> kBearishKeywords = {
    "hack", "hacked", "exploit", "ban", "banned", "crackdown",
    "bearish", "crash", "plunge", "dump", "sell-off", "selloff",
    "liquidation", "outflow", "sec", "lawsuit", "fraud",
};

const std::unordered_map<std::string, double>& lexicon() {
    static const std::unordered_map<std::string, double> words = {
        {"good", 0.7}, {"great", 0.8}, {"best", 1.0}, {"better", 0.5},
        {"strong", 0.43}, {"stronger", 0.5}, {"positive", 0.23}, {"optimistic", 0.5},
        {"gain", 0.4}, {"gains", 0.4}, {"high", 0.16}, {"higher", 0.25},
        {"record", 0.3}, {"success", 0.3}, {"successful", 0.75}, {"win", 0.8},
        {"boost", 0.3}, {"rise", 0.2}, {"rising", 0.2}, {"up", 0.1},
        {"bullish", 0.5}, {"new", 0.14}, {"huge", 0.4}, {"massive", 0.2},
        {"approve", 0.3}, {"approved", 0.3}, {"confident", 0.5}, {"recover", 0.3},
        {"recovery", 0.3}, {"safe", 0.5}, {"easy", 0.43}, {"happy", 0.8},
        {"bad", -0.7}, {"worse", -0.4}, {"worst", -1.0}, {"weak", -0.38},
        {"weaker", -0.4}, {"negative", -0.3}, {"fear", -0.4}, {"fears", -0.4},
        {"loss", -0.4}, {"losses", -0.4}, {"low", -0.1}, {"lower", -0.1},
        {"fall", -0.3}, {"falls", -0.3}, {"falling", -0.3}, {"drop", -0.3},
        {"drops", -0.3}, {"down", -0.16}, {"bearish", -0.5}, {"risk", -0.2},
        {"risky", -0.5}, {"crisis", -0.6}, {"panic", -0.6}, {"fail", -0.5},
        {"failed", -0.5}, {"failure", -0.5}, {"illegal", -0.5}, {"terrible", -1.0},
        {"uncertain", -0.3}, {"volatile", -0.2}, {"concern", -0.2}, {"warning", -0.3},
    };
    return words;
}

bool is_negation(const std::string& word) {
    return word == "not" || word == "no" || word == "never" || word == "n't";
}

std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '\'' || c == '-') {
            current.push_back(static_cast<char>(std::tolower(uc)));
        } else if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        words.push_back(std::move(current));
    }
    return words;
}

int count_hits(const std::string& text, const std::vector<std::string>& keywords) {
    const std::string lowered = util::to_lower(text);
    int hits = 0;
    for (const auto& kw : keywords) {
        if (lowered.find(kw) != std::string::npos) hits++;
    }
    return hits;
}

} // namespace

double title_polarity(const std::string& title) {
    const auto words = tokenize(title);
    const auto& lex = lexicon();

    double sum = 0.0;
    int matched = 0;
    for (std::size_t i = 0; i < words.size(); ++i) {
        auto it = lex.find(words[i]);
        if (it == lex.end()) continue;

        double p = it->second;
        if (i > 0 && is_negation(words[i - 1])) {
            p *= -0.5;
        }
        sum += p;
        matched++;
    }

    if (matched == 0) return 0.0;
    return util::clamp(sum / matched, -1.0, 1.0);
}

int count_bullish_keywords(const std::string& text) {
    return count_hits(text, kBullishKeywords);
}

int count_bearish_keywords(const std::string& text) {
    return count_hits(text, kBearishKeywords);
}

std::string label_for(double score) {
    if (score > kLabelThreshold) return "bullish";
    if (score < -kLabelThreshold) return "bearish";
    return "neutral";
}

HeadlineSentiment score_headline(const std::string& title, const std::string& body) {
    const std::string text = title + " " + body.substr(0, kBodyPrefix);

    HeadlineSentiment s;
    s.polarity = title_polarity(title);
    s.bullish_keywords = count_bullish_keywords(text);
    s.bearish_keywords = count_bearish_keywords(text);

    const double combined = s.polarity + (s.bullish_keywords - s.bearish_keywords) * kKeywordBoost;
    s.score = util::round_to(util::clamp(combined, -1.0, 1.0), 3);
    s.label = label_for(s.score);
    s.polarity = util::round_to(s.polarity, 3);
    return s;
}

NewsSummary summarize(std::vector<Headline> headlines) {
    NewsSummary summary;
    summary.overall_sentiment = "neutral";
    if (headlines.empty()) {
        return summary;
    }

    double total = 0.0;
    for (const auto& h : headlines) {
        total += h.sentiment.score;
        if (h.sentiment.label == "bullish") summary.bullish_count++;
        else if (h.sentiment.label == "bearish") summary.bearish_count++;
        else summary.neutral_count++;
    }

    const double avg = total / static_cast<double>(headlines.size());
    summary.overall_sentiment = label_for(avg);
    summary.avg_score = util::round_to(avg, 3);
    summary.headlines = std::move(headlines);
    return summary;
}

} // namespace sentiment
