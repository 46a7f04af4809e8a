#pragma once
#include "core.h"
#include <QVector>
#include <optional>

namespace ndoc {

// Bonus added to a name hit so it always outranks a secondary-text hit.
constexpr int kNameMatchBonus = 1000;

// Interactive result lists are cut off after this many entries.
constexpr int kRankLimit = 50;

struct ScoredEntry {
    int index = -1;  // position in the catalog
    int score = 0;
};

// Relevance of one entry: name score + kNameMatchBonus if the name matches,
// otherwise the best score over the kind's secondary text (define value,
// function description, struct/union field names, enum member names).
// Typedefs have no secondary text. Case-sensitive.
std::optional<int> entryScore(const Entry& entry, const QString& query);

// Same cascade with entry text and query lowercased, and no name bonus.
std::optional<int> entryScoreCaseInsensitive(const Entry& entry, const QString& query);

// Best name match for a one-shot lookup. Case-sensitive pass first; the
// lowercase pass only runs when the first finds nothing. Ties go to the
// entry that comes first in the catalog.
std::optional<ScoredEntry> resolveBest(const Catalog& catalog, const QString& query);

// Ranked name matches for live filtering. An empty query lists every entry
// by name (score 0). Otherwise the case-sensitive match set is used if it is
// non-empty, else the lowercase one. Sorted by score descending, catalog
// order among equals, truncated to limit.
QVector<ScoredEntry> rankEntries(const Catalog& catalog, const QString& query,
                                 int limit = kRankLimit);

} // namespace ndoc
