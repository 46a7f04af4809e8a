#include "fuzzy.h"
#include <QVector>
#include <algorithm>
#include <climits>

namespace ndoc {

enum class CharClass { NonWord, Lower, Upper, Number };

static CharClass classOf(QChar c) {
    if (c.isUpper()) return CharClass::Upper;
    if (c.isDigit()) return CharClass::Number;
    if (c.isLetter()) return CharClass::Lower;  // lowercase and caseless letters
    return CharClass::NonWord;
}

static int bonusFor(CharClass prev, CharClass cur) {
    if (prev == CharClass::NonWord && cur != CharClass::NonWord)
        return kBonusBoundary;
    if ((prev == CharClass::Lower && cur == CharClass::Upper) ||
        (prev != CharClass::Number && cur == CharClass::Number))
        return kBonusCamel123;
    if (cur == CharClass::NonWord)
        return kBonusNonWord;
    return 0;
}

static constexpr int kNone = INT_MIN / 2;

std::optional<int> fuzzyMatch(const QString& text, const QString& pattern) {
    const int n = pattern.size();
    const int m = text.size();
    if (n == 0) return 0;
    if (n > m) return std::nullopt;

    // Narrow the window to [first, last]: leftmost start of a greedy forward
    // match and rightmost end of a greedy backward match.
    int first = -1, pi = 0;
    for (int j = 0; j < m && pi < n; j++) {
        if (text[j] == pattern[pi]) {
            if (pi == 0) first = j;
            pi++;
        }
    }
    if (pi < n) return std::nullopt;

    int last = m - 1;
    pi = n - 1;
    for (int j = m - 1; j >= first; j--) {
        if (text[j] == pattern[pi]) {
            if (pi == n - 1) last = j;
            if (--pi < 0) break;
        }
    }

    QVector<int> bonus(m, 0);
    CharClass prev = first > 0 ? classOf(text[first - 1]) : CharClass::NonWord;
    for (int j = first; j <= last; j++) {
        CharClass cur = classOf(text[j]);
        bonus[j] = bonusFor(prev, cur);
        prev = cur;
    }

    // prevH[j]: best score with the previous pattern char matched at j.
    // prevRun[j]: bonus of the first char of the consecutive run ending at j.
    QVector<int> prevH(m, kNone), prevRun(m, 0);
    QVector<int> curH(m, kNone),  curRun(m, 0);

    for (int j = first; j <= last; j++) {
        if (text[j] == pattern[0]) {
            prevH[j] = kScoreMatch + bonus[j] * kBonusFirstCharMultiplier;
            prevRun[j] = bonus[j];
        }
    }

    for (int i = 1; i < n; i++) {
        const QChar pc = pattern[i];
        int gap = kNone;  // best prevH[k] + gap penalty for k <= j - 2
        std::fill(curH.begin(), curH.end(), kNone);

        for (int j = first + 1; j <= last; j++) {
            if (j - 2 >= first) {
                int extended = gap == kNone ? kNone : gap + kScoreGapExtension;
                int opened   = prevH[j - 2] == kNone ? kNone : prevH[j - 2] + kScoreGapStart;
                gap = std::max(extended, opened);
            }
            if (text[j] != pc) continue;

            int best = kNone, run = 0;
            if (prevH[j - 1] != kNone) {
                int b = std::max({bonus[j], kBonusConsecutive, prevRun[j - 1]});
                best = prevH[j - 1] + kScoreMatch + b;
                run = (bonus[j] >= kBonusBoundary && bonus[j] > prevRun[j - 1])
                    ? bonus[j] : prevRun[j - 1];
            }
            if (gap != kNone) {
                int cand = gap + kScoreMatch + bonus[j];
                if (cand > best) {
                    best = cand;
                    run = bonus[j];
                }
            }
            curH[j] = best;
            curRun[j] = run;
        }
        std::swap(prevH, curH);
        std::swap(prevRun, curRun);
    }

    int result = kNone;
    for (int j = first; j <= last; j++)
        result = std::max(result, prevH[j]);
    if (result == kNone) return std::nullopt;
    return result;
}

} // namespace ndoc
