#pragma once

#include <QStringList>

namespace ndoc {

// True when the arguments (program name excluded) ask for a lookup, a
// listing, help or the version. Only the interactive browser needs a GUI.
bool runsHeadless(const QStringList& args);

} // namespace ndoc
