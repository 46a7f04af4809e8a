#include "core.h"

namespace ndoc {

static const struct { const char* text; Category category; } kCategoryAliases[] = {
    { "nt",             Category::Nt },
    { "nt native api",  Category::Nt },
    { "win32",          Category::Win32 },
    { "win32 api",      Category::Win32 },
};

Category categoryFromString(const QString& text, bool* ok) {
    const QString key = text.trimmed().toLower();
    for (const auto& a : kCategoryAliases) {
        if (key == QLatin1String(a.text)) {
            if (ok) *ok = true;
            return a.category;
        }
    }
    if (ok) *ok = false;
    return Category::Nt;
}

QString categoryToString(Category c) {
    switch (c) {
    case Category::Nt:    return QStringLiteral("Nt");
    case Category::Win32: return QStringLiteral("Win32");
    }
    return {};
}

const QString& Entry::name() const {
    return std::visit([](const auto& d) -> const QString& { return d.name; }, decl);
}

const char* Entry::kindName() const {
    return std::visit(overloaded {
        [](const FunctionDecl&) { return "Function"; },
        [](const TypedefDecl&)  { return "Typedef"; },
        [](const DefineDecl&)   { return "Define"; },
        [](const StructDecl&)   { return "Struct"; },
        [](const UnionDecl&)    { return "Union"; },
        [](const EnumDecl&)     { return "Enum"; },
    }, decl);
}

} // namespace ndoc
