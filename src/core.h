#pragma once
#include <QString>
#include <QStringList>
#include <QVector>
#include <QtGlobal>
#include <memory>
#include <optional>
#include <variant>

namespace ndoc {

// ── Category ──

enum class Category { Nt, Win32 };

// Accepts the spellings found in catalog files ("NT", "Nt", "NT Native API",
// "Win32", "Win32 API"), case-insensitively. Sets *ok to false on anything else.
Category categoryFromString(const QString& text, bool* ok = nullptr);
QString  categoryToString(Category c);

// ── Declaration kinds ──

struct StructField {
    QString name;
    QString type;
};

struct EnumMember {
    QString name;
    std::optional<quint64> init;
};

struct FunctionDecl {
    QString     name;
    QString     returnType;
    QStringList parameters;  // one type text per parameter, declaration order
    QString     description;
};

struct TypedefDecl {
    QString     name;
    QStringList tokens;      // aliased type expression, e.g. {"struct", "_FOO"}
};

struct DefineDecl {
    QString name;
    QString value;
};

struct StructDecl {
    QString              name;
    QVector<StructField> fields;
};

struct UnionDecl {
    QString              name;
    QVector<StructField> fields;
};

struct EnumDecl {
    QString             name;
    QVector<EnumMember> members;
};

using Declaration = std::variant<FunctionDecl, TypedefDecl, DefineDecl,
                                 StructDecl, UnionDecl, EnumDecl>;

// Helper for std::visit with one lambda per alternative.
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// ── Entry ──

struct Entry {
    Category    category = Category::Nt;
    Declaration decl;

    const QString& name() const;
    const char*    kindName() const;

    template <class T> bool is() const { return std::holds_alternative<T>(decl); }
    template <class T> const T* as() const { return std::get_if<T>(&decl); }
};

// The catalog is loaded once and never mutated afterwards.
using Catalog       = QVector<Entry>;
using CatalogHandle = std::shared_ptr<const Catalog>;

inline CatalogHandle makeCatalogHandle(Catalog catalog) {
    return std::make_shared<const Catalog>(std::move(catalog));
}

} // namespace ndoc
