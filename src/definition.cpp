#include "definition.h"

namespace ndoc {

// ── Line builders shared by raw and pretty output ──

static QString functionSignature(const FunctionDecl& f) {
    return f.returnType + QLatin1Char(' ') + f.name
         + QLatin1Char('(') + f.parameters.join(QStringLiteral(", ")) + QStringLiteral(");");
}

static QString defineLine(const DefineDecl& d) {
    return QStringLiteral("#define ") + d.name + QLatin1Char(' ') + d.value;
}

static QString typedefLine(const TypedefDecl& t) {
    return QStringLiteral("typedef ") + t.tokens.join(QStringLiteral(" "))
         + QLatin1Char(' ') + t.name + QLatin1Char(';');
}

static void appendFieldLines(QString& out, const QVector<StructField>& fields) {
    for (const auto& f : fields)
        out += QStringLiteral("    ") + f.type + QLatin1Char(' ') + f.name + QStringLiteral(";\n");
}

QString structAlias(const StructDecl& s, const Catalog& catalog) {
    for (const auto& e : catalog) {
        const auto* td = e.as<TypedefDecl>();
        if (!td) continue;
        for (const auto& tok : td->tokens) {
            if (tok == s.name || tok.endsWith(s.name))
                return td->name;
        }
    }
    return s.name.startsWith(QLatin1Char('_')) ? s.name.mid(1) : s.name;
}

QString rawDefinition(const Entry& entry, const Catalog& catalog) {
    return std::visit(overloaded {
        [](const FunctionDecl& f) { return functionSignature(f); },
        [](const DefineDecl& d)   { return defineLine(d); },
        [](const TypedefDecl& t)  { return typedefLine(t); },
        [&catalog](const StructDecl& s) {
            const QString alias = structAlias(s, catalog);
            QString out = QStringLiteral("typedef struct _") + s.name + QStringLiteral(" {\n");
            appendFieldLines(out, s.fields);
            out += QStringLiteral("} ") + alias + QStringLiteral(", *P") + alias + QLatin1Char(';');
            return out;
        },
        // Unions are emitted bare; no typedef alias is looked up for them.
        [](const UnionDecl& u) {
            QString out = QStringLiteral("union ") + u.name + QStringLiteral(" {\n");
            appendFieldLines(out, u.fields);
            out += QStringLiteral("};");
            return out;
        },
        [](const EnumDecl& en) {
            QString out = QStringLiteral("enum {\n");
            for (const auto& m : en.members) {
                if (m.init)
                    out += QStringLiteral("    ") + m.name + QStringLiteral(" = ")
                         + QString::number(*m.init) + QStringLiteral(",\n");
                else
                    out += QStringLiteral("    ") + m.name + QStringLiteral(",\n");
            }
            out += QStringLiteral("};");
            return out;
        },
    }, entry.decl);
}

QString prettyDefinition(const Entry& entry, const Catalog& catalog) {
    QString out = QStringLiteral("Category: ") + categoryToString(entry.category)
                + QStringLiteral("\n\n");

    auto title = [&out, &entry](const QString& name) {
        out += QString::fromLatin1(entry.kindName()) + QStringLiteral(" `") + name + QStringLiteral("`\n");
    };

    std::visit(overloaded {
        [&](const FunctionDecl& f) {
            title(f.name);
            out += QStringLiteral("Signature: ") + functionSignature(f) + QStringLiteral("\n\n");
            out += QStringLiteral("Description:\n") + f.description + QLatin1Char('\n');
        },
        [&](const DefineDecl& d) {
            title(d.name);
            out += QStringLiteral("\n") + defineLine(d) + QLatin1Char('\n');
        },
        [&](const TypedefDecl& t) {
            title(t.name);
            out += QStringLiteral("\n") + typedefLine(t) + QLatin1Char('\n');
        },
        [&](const StructDecl& s) {
            title(s.name);
            out += QStringLiteral("\n") + rawDefinition(entry, catalog) + QLatin1Char('\n');
        },
        [&](const UnionDecl& u) {
            title(u.name);
            out += QStringLiteral("\n") + rawDefinition(entry, catalog) + QLatin1Char('\n');
        },
        [&](const EnumDecl&) {
            out += QString::fromLatin1(entry.kindName()) + QStringLiteral("\n\n")
                 + rawDefinition(entry, catalog) + QLatin1Char('\n');
        },
    }, entry.decl);

    return out;
}

} // namespace ndoc
