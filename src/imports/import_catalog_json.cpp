#include "import_catalog_json.h"
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QVariant>
#include <QDebug>
#include <cmath>

namespace ndoc {

// ── Field readers ──
// Each returns false and fills *why when the value has the wrong shape.

static bool readName(const QJsonObject& obj, QString* out, QString* why) {
    const QJsonValue v = obj.value(QStringLiteral("name"));
    if (!v.isString() || v.toString().isEmpty()) {
        *why = QStringLiteral("missing \"name\"");
        return false;
    }
    *out = v.toString();
    return true;
}

static bool readStringList(const QJsonObject& obj, const QString& key,
                           QStringList* out, QString* why) {
    const QJsonValue v = obj.value(key);
    if (v.isUndefined() || v.isNull()) return true;
    if (!v.isArray()) {
        *why = QStringLiteral("\"%1\" is not an array").arg(key);
        return false;
    }
    for (const QJsonValue& item : v.toArray()) {
        if (!item.isString()) {
            *why = QStringLiteral("\"%1\" contains a non-string item").arg(key);
            return false;
        }
        out->append(item.toString());
    }
    return true;
}

static bool readStructFields(const QJsonObject& obj, QVector<StructField>* out, QString* why) {
    const QJsonValue v = obj.value(QStringLiteral("fields"));
    if (v.isUndefined() || v.isNull()) return true;
    if (!v.isArray()) {
        *why = QStringLiteral("\"fields\" is not an array");
        return false;
    }
    for (const QJsonValue& item : v.toArray()) {
        const QJsonObject f = item.toObject();
        if (!f.value(QStringLiteral("name")).isString()) {
            *why = QStringLiteral("field without a name");
            return false;
        }
        out->append(StructField{f.value(QStringLiteral("name")).toString(),
                                f.value(QStringLiteral("type")).toString()});
    }
    return true;
}

// Largest integer a JSON double holds exactly.
static constexpr double kMaxExactJsonInteger = 9007199254740991.0;  // 2^53 - 1

static bool readEnumInit(const QJsonValue& v, std::optional<quint64>* out, QString* why) {
    if (v.isUndefined() || v.isNull()) {
        out->reset();
        return true;
    }
    if (v.isDouble()) {
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
        // Qt 6 keeps integer literals that fit in 64 bits exact
        const QVariant exact = v.toVariant();
        if (exact.typeId() == QMetaType::LongLong) {
            const qint64 n = exact.toLongLong();
            if (n < 0) {
                *why = QStringLiteral("negative value");
                return false;
            }
            *out = quint64(n);
            return true;
        }
#endif
        const double d = v.toDouble();
        if (d < 0) {
            *why = QStringLiteral("negative value");
            return false;
        }
        if (std::floor(d) != d) {
            *why = QStringLiteral("not an integer");
            return false;
        }
        if (d > kMaxExactJsonInteger) {
            *why = QStringLiteral("too large for a JSON number, write it as a string");
            return false;
        }
        *out = static_cast<quint64>(d);
        return true;
    }
    if (v.isString()) {
        // "0x80000000" style initializers that do not survive a double
        bool ok = false;
        quint64 n = v.toString().toULongLong(&ok, 0);
        if (!ok) {
            *why = QStringLiteral("not an unsigned 64-bit integer");
            return false;
        }
        *out = n;
        return true;
    }
    *why = QStringLiteral("not a number or string");
    return false;
}

static bool readEnumMembers(const QJsonObject& obj, QVector<EnumMember>* out, QString* why) {
    const QJsonValue v = obj.value(QStringLiteral("fields"));
    if (v.isUndefined() || v.isNull()) return true;
    if (!v.isArray()) {
        *why = QStringLiteral("\"fields\" is not an array");
        return false;
    }
    for (const QJsonValue& item : v.toArray()) {
        const QJsonObject f = item.toObject();
        EnumMember m;
        m.name = f.value(QStringLiteral("name")).toString();
        if (m.name.isEmpty()) {
            *why = QStringLiteral("enum member without a name");
            return false;
        }
        QString initWhy;
        if (!readEnumInit(f.value(QStringLiteral("init")), &m.init, &initWhy)) {
            *why = QStringLiteral("enum member %1 has an invalid \"init\" (%2)").arg(m.name, initWhy);
            return false;
        }
        out->append(m);
    }
    return true;
}

// ── Record parser ──

static bool parseEntry(const QJsonObject& obj, Entry* entry, QString* why) {
    const QJsonValue cat = obj.value(QStringLiteral("category"));
    bool ok = false;
    entry->category = categoryFromString(cat.toString(), &ok);
    if (!ok) {
        *why = QStringLiteral("unknown category \"%1\"").arg(cat.toString());
        return false;
    }

    const QString type = obj.value(QStringLiteral("type")).toString();
    QString name;
    if (!readName(obj, &name, why)) return false;

    if (type == QStringLiteral("Function")) {
        FunctionDecl f;
        f.name = name;
        f.returnType = obj.value(QStringLiteral("return_type")).toString();
        f.description = obj.value(QStringLiteral("description")).toString();
        if (!readStringList(obj, QStringLiteral("parameters"), &f.parameters, why)) return false;
        entry->decl = std::move(f);
    } else if (type == QStringLiteral("Typedef")) {
        TypedefDecl t;
        t.name = name;
        if (!readStringList(obj, QStringLiteral("typedef"), &t.tokens, why)) return false;
        entry->decl = std::move(t);
    } else if (type == QStringLiteral("Define")) {
        DefineDecl d;
        d.name = name;
        d.value = obj.value(QStringLiteral("value")).toString();
        entry->decl = std::move(d);
    } else if (type == QStringLiteral("Struct")) {
        StructDecl s;
        s.name = name;
        if (!readStructFields(obj, &s.fields, why)) return false;
        entry->decl = std::move(s);
    } else if (type == QStringLiteral("Union")) {
        UnionDecl u;
        u.name = name;
        if (!readStructFields(obj, &u.fields, why)) return false;
        entry->decl = std::move(u);
    } else if (type == QStringLiteral("Enum")) {
        EnumDecl e;
        e.name = name;
        if (!readEnumMembers(obj, &e.members, why)) return false;
        entry->decl = std::move(e);
    } else {
        *why = type.isEmpty() ? QStringLiteral("missing \"type\"")
                              : QStringLiteral("unknown type \"%1\"").arg(type);
        return false;
    }
    return true;
}

Catalog parseCatalogJson(const QByteArray& json, QString* errorMsg) {
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        qDebug() << "[Catalog] JSON parse error at offset" << parseError.offset
                 << ":" << parseError.errorString();
        if (errorMsg)
            *errorMsg = QStringLiteral("JSON parse error at offset %1: %2")
                .arg(parseError.offset)
                .arg(parseError.errorString());
        return {};
    }
    if (!doc.isArray()) {
        if (errorMsg) *errorMsg = QStringLiteral("Catalog root is not an array");
        return {};
    }

    const QJsonArray records = doc.array();
    Catalog catalog;
    catalog.reserve(records.size());

    for (int i = 0; i < records.size(); i++) {
        if (!records[i].isObject()) {
            if (errorMsg) *errorMsg = QStringLiteral("Entry %1: not an object").arg(i);
            return {};
        }
        Entry entry;
        QString why;
        if (!parseEntry(records[i].toObject(), &entry, &why)) {
            qDebug() << "[Catalog] ERROR: entry" << i << why;
            if (errorMsg) *errorMsg = QStringLiteral("Entry %1: %2").arg(QString::number(i), why);
            return {};
        }
        catalog.append(std::move(entry));
    }

    if (catalog.isEmpty()) {
        qDebug() << "[Catalog] ERROR: No entries found";
        if (errorMsg) *errorMsg = QStringLiteral("No entries found in catalog");
        return {};
    }

    qDebug() << "[Catalog] Parsed" << catalog.size() << "entries";
    return catalog;
}

Catalog importCatalogJson(const QString& filePath, QString* errorMsg) {
    qDebug() << "[Catalog] Opening file:" << filePath;

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        qDebug() << "[Catalog] ERROR: Cannot open file";
        if (errorMsg) *errorMsg = QStringLiteral("Cannot open file: ") + filePath;
        return {};
    }

    return parseCatalogJson(file.readAll(), errorMsg);
}

} // namespace ndoc
