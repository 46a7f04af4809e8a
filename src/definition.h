#pragma once
#include "core.h"
#include <QString>

namespace ndoc {

// Reconstruct a terse C declaration for one entry. The catalog is only
// consulted for structs, to find the typedef that names them.
QString rawDefinition(const Entry& entry, const Catalog& catalog);

// Multi-line rendering for display: category header, kind title, then the
// signature/description or the full raw definition.
QString prettyDefinition(const Entry& entry, const Catalog& catalog);

// Alias a struct is exposed under: name of the first typedef (catalog order)
// with a token equal to, or ending with, the struct name. Falls back to the
// struct name with one leading underscore removed.
QString structAlias(const StructDecl& s, const Catalog& catalog);

} // namespace ndoc
