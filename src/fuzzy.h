#pragma once
#include <QString>
#include <optional>

namespace ndoc {

// Score weights (fzf/skim family).
constexpr int kScoreMatch          = 16;
constexpr int kScoreGapStart       = -3;
constexpr int kScoreGapExtension   = -1;
constexpr int kBonusBoundary       = kScoreMatch / 2;
constexpr int kBonusNonWord        = kScoreMatch / 2;
constexpr int kBonusCamel123       = kBonusBoundary + kScoreGapExtension;
constexpr int kBonusConsecutive    = -(kScoreGapStart + kScoreGapExtension);
constexpr int kBonusFirstCharMultiplier = 2;

// Case-sensitive subsequence match of pattern against text.
// Returns std::nullopt unless every pattern character occurs in text in order.
// Higher is better: contiguous runs and hits at word boundaries
// (start, after '_' or punctuation, camelCase humps, digits) score more.
// An empty pattern matches anything with score 0.
std::optional<int> fuzzyMatch(const QString& text, const QString& pattern);

} // namespace ndoc
