#include "core.h"
#include "cli.h"
#include "definition.h"
#include "search.h"
#include "browserdialog.h"
#include "imports/import_catalog_json.h"

#include <QApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>
#include <QScopedPointer>
#include <QTextStream>

using namespace ndoc;

static QCoreApplication* createApplication(int& argc, char* argv[]) {
    QStringList args;
    for (int i = 1; i < argc; i++)
        args.append(QString::fromLocal8Bit(argv[i]));
    if (runsHeadless(args))
        return new QCoreApplication(argc, argv);
    return new QApplication(argc, argv);
}

int main(int argc, char* argv[]) {
    QScopedPointer<QCoreApplication> app(createApplication(argc, argv));
    QCoreApplication::setApplicationName(QStringLiteral("ndoc"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription("Fuzzy lookup of NT native and Win32 API declarations.");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption rawOption(QStringList{"r", "raw"},
        "Print the raw C definition instead of the annotated one.");
    QCommandLineOption listOption("list", "Print every entry name and exit.");
    QCommandLineOption catalogOption(QStringList{"c", "catalog"},
        "Load the catalog from <file> instead of the built-in one.", "file");
    QCommandLineOption verboseOption("verbose", "Write debug logging to stderr.");
    parser.addOption(rawOption);
    parser.addOption(listOption);
    parser.addOption(catalogOption);
    parser.addOption(verboseOption);
    parser.addPositionalArgument("name",
        "Entry to look up. Without it the interactive browser opens.", "[name]");
    parser.process(*app);

    if (!parser.isSet(verboseOption))
        QLoggingCategory::setFilterRules(QStringLiteral("default.debug=false"));

    QTextStream out(stdout);
    QTextStream err(stderr);

    const QString catalogPath = parser.isSet(catalogOption)
        ? parser.value(catalogOption) : kBuiltinCatalogPath;
    QString error;
    Catalog loaded = importCatalogJson(catalogPath, &error);
    if (loaded.isEmpty()) {
        err << "Error: cannot load catalog " << catalogPath << ": " << error << '\n';
        return 2;
    }
    const CatalogHandle catalog = makeCatalogHandle(std::move(loaded));

    if (parser.isSet(listOption)) {
        for (const auto& e : *catalog)
            out << e.name() << '\n';
        return 0;
    }

    const QStringList names = parser.positionalArguments();
    if (!names.isEmpty()) {
        const QString query = names.last();
        auto found = resolveBest(*catalog, query);
        if (!found) {
            err << "Error: no entry matching `" << query << "` found.\n";
            return 1;
        }
        const Entry& entry = (*catalog)[found->index];
        if (parser.isSet(rawOption))
            out << rawDefinition(entry, *catalog) << '\n';
        else
            out << prettyDefinition(entry, *catalog) << '\n';
        return 0;
    }

    BrowserDialog browser(catalog);
    browser.exec();
    return 0;
}
