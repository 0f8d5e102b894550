#pragma once

#include "types.hpp"
#include <string>
#include <vector>

namespace sentiment {

constexpr double kKeywordBoost = 0.2;
constexpr double kLabelThreshold = 0.1;
constexpr std::size_t kBodyPrefix = 200;

// Lexicon polarity of the title, averaged over the opinion words it
// contains, in [-1, 1]. A preceding "not", "no" or "never" flips and
// halves the word's polarity.
double title_polarity(const std::string& title);

// Counts keyword hits in the title plus the first 200 characters of the body
int count_bullish_keywords(const std::string& text);
int count_bearish_keywords(const std::string& text);

std::string label_for(double score);

// score = clamp(polarity + 0.2 * (bullish_hits - bearish_hits), -1, 1), rounded to 3 places
HeadlineSentiment score_headline(const std::string& title, const std::string& body);

// Averages headline scores and counts labels. Empty input yields a neutral summary.
NewsSummary summarize(std::vector<Headline> headlines);

} // namespace sentiment
