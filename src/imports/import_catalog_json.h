#pragma once
#include "core.h"
#include <QByteArray>

namespace ndoc {

// Default catalog compiled into the binary (resources/catalog.qrc).
inline const QString kBuiltinCatalogPath = QStringLiteral(":/catalog/ntdocs.json");

// Parse a JSON catalog: an array of objects, each with "category", "type"
// (Function, Typedef, Define, Struct, Union, Enum) and the kind's fields.
// Stops at the first malformed record.
// Returns an empty Catalog on failure; populates errorMsg if non-null.
Catalog parseCatalogJson(const QByteArray& json, QString* errorMsg = nullptr);

// Read and parse a catalog file (or resource path).
Catalog importCatalogJson(const QString& filePath, QString* errorMsg = nullptr);

} // namespace ndoc
