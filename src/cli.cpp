#include "cli.h"

namespace ndoc {

bool runsHeadless(const QStringList& args) {
    static const QStringList headlessFlags = {
        "--list", "-h", "--help", "--help-all", "-v", "--version",
    };
    for (int i = 0; i < args.size(); i++) {
        const QString& arg = args[i];
        if (arg == QLatin1String("--catalog") || arg == QLatin1String("-c")) {
            i++;  // skip the file argument
            continue;
        }
        if (headlessFlags.contains(arg) || !arg.startsWith(QLatin1Char('-')))
            return true;
    }
    return false;
}

} // namespace ndoc
