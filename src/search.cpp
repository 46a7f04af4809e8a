#include "search.h"
#include "fuzzy.h"
#include <QDebug>
#include <algorithm>

namespace ndoc {

// Text searched when the name itself does not match.
static QStringList secondaryTexts(const Entry& entry) {
    return std::visit(overloaded {
        [](const FunctionDecl& f) { return QStringList{f.description}; },
        [](const TypedefDecl&)    { return QStringList{}; },
        [](const DefineDecl& d)   { return QStringList{d.value}; },
        [](const StructDecl& s) {
            QStringList names;
            for (const auto& f : s.fields) names << f.name;
            return names;
        },
        [](const UnionDecl& u) {
            QStringList names;
            for (const auto& f : u.fields) names << f.name;
            return names;
        },
        [](const EnumDecl& en) {
            QStringList names;
            for (const auto& m : en.members) names << m.name;
            return names;
        },
    }, entry.decl);
}

static std::optional<int> bestOf(std::optional<int> a, std::optional<int> b) {
    if (!a) return b;
    if (!b) return a;
    return std::max(*a, *b);
}

std::optional<int> entryScore(const Entry& entry, const QString& query) {
    if (auto s = fuzzyMatch(entry.name(), query))
        return *s + kNameMatchBonus;

    std::optional<int> best;
    for (const auto& text : secondaryTexts(entry))
        best = bestOf(best, fuzzyMatch(text, query));
    return best;
}

std::optional<int> entryScoreCaseInsensitive(const Entry& entry, const QString& query) {
    const QString q = query.toLower();
    if (auto s = fuzzyMatch(entry.name().toLower(), q))
        return s;

    std::optional<int> best;
    for (const auto& text : secondaryTexts(entry))
        best = bestOf(best, fuzzyMatch(text.toLower(), q));
    return best;
}

// ── Catalog-wide name search ──

static std::optional<ScoredEntry> bestNameMatch(const Catalog& catalog, const QString& query,
                                                bool lowercase) {
    const QString q = lowercase ? query.toLower() : query;
    std::optional<ScoredEntry> best;
    for (int i = 0; i < catalog.size(); i++) {
        const QString& name = catalog[i].name();
        auto s = fuzzyMatch(lowercase ? name.toLower() : name, q);
        if (s && (!best || *s > best->score))
            best = ScoredEntry{i, *s};
    }
    return best;
}

static QVector<ScoredEntry> allNameMatches(const Catalog& catalog, const QString& query,
                                           bool lowercase) {
    const QString q = lowercase ? query.toLower() : query;
    QVector<ScoredEntry> hits;
    for (int i = 0; i < catalog.size(); i++) {
        const QString& name = catalog[i].name();
        if (auto s = fuzzyMatch(lowercase ? name.toLower() : name, q))
            hits.append(ScoredEntry{i, *s});
    }
    return hits;
}

std::optional<ScoredEntry> resolveBest(const Catalog& catalog, const QString& query) {
    auto found = bestNameMatch(catalog, query, false);
    if (!found) {
        qDebug() << "[Search] No case-sensitive match for" << query << "- retrying lowercase";
        found = bestNameMatch(catalog, query, true);
    }
    return found;
}

QVector<ScoredEntry> rankEntries(const Catalog& catalog, const QString& query, int limit) {
    QVector<ScoredEntry> scored;

    if (query.isEmpty()) {
        scored.reserve(catalog.size());
        for (int i = 0; i < catalog.size(); i++)
            scored.append(ScoredEntry{i, 0});
        std::stable_sort(scored.begin(), scored.end(),
                         [&catalog](const ScoredEntry& a, const ScoredEntry& b) {
                             return catalog[a.index].name() < catalog[b.index].name();
                         });
    } else {
        scored = allNameMatches(catalog, query, false);
        if (scored.isEmpty())
            scored = allNameMatches(catalog, query, true);
        std::stable_sort(scored.begin(), scored.end(),
                         [](const ScoredEntry& a, const ScoredEntry& b) {
                             return a.score > b.score;
                         });
    }

    if (limit >= 0 && scored.size() > limit)
        scored.resize(limit);
    return scored;
}

} // namespace ndoc
