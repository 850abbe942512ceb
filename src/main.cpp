#include "formula/FormulaParser.h"
#include "formula/RandomProvider.h"
#include "services/FormulaJsonLoader.h"
#include "services/FormulaLoader.h"
#include "services/FormulaRunner.h"
#include "utils/ConfigLoader.h"
#include "utils/FileLogger.h"
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QTextStream>

namespace {

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

// --config wins; otherwise the first existing candidate next to the binary
QString resolveConfigPath(const QString &explicitPath)
{
    if (!explicitPath.isEmpty())
        return explicitPath;

    QString appDir = QCoreApplication::applicationDirPath();
    QStringList candidates;
    candidates << QDir::current().filePath("configs/formula_console.ini");
    candidates << QDir(appDir).filePath("configs/formula_console.ini");
    candidates << QDir(appDir).filePath("../configs/formula_console.ini");

    for (const QString &path : candidates) {
        if (QFileInfo::exists(path))
            return path;
    }
    return QString();
}

RandomProviderPtr makeRandomProvider(const ConfigLoader &config)
{
    const QString mode = config.getRandomMode();
    if (mode == "seeded")
        return std::make_shared<SeededRandomProvider>(config.getRandomSeed());
    if (mode == "fixed")
        return std::make_shared<FixedRandomProvider>(config.getRandomFixedValue());
    if (mode != "default")
        qWarning() << "[Console] Unknown random mode" << mode << "- using default";
    return DefaultRandomProvider::shared();
}

// name=value pairs from the positional arguments
bool parseBindings(const QStringList &args, FormulaBindings *bindings)
{
    for (const QString &arg : args) {
        int eq = arg.indexOf('=');
        if (eq <= 0) {
            err() << "Invalid binding '" << arg << "' (expected name=value)\n";
            return false;
        }
        bool ok = false;
        double value = arg.mid(eq + 1).trimmed().toDouble(&ok);
        if (!ok) {
            err() << "Invalid number in binding '" << arg << "'\n";
            return false;
        }
        bindings->insert(arg.left(eq).trimmed(), value);
    }
    return true;
}

QString formatValue(double value)
{
    return QString::number(value, 'g', 15);
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("formula_console");
    app.setApplicationVersion("1.0.0");

    QCommandLineParser cli;
    cli.setApplicationDescription("Load, list, export and evaluate formulas.");
    cli.addHelpOption();
    cli.addVersionOption();

    QCommandLineOption configOpt("config", "INI configuration file.", "file");
    QCommandLineOption libraryOpt("library", "JSON formula library to load.", "file");
    QCommandLineOption listOpt("list", "List the loaded formulas.");
    QCommandLineOption exportOpt("export", "Write the loaded formulas to a JSON file.", "file");
    QCommandLineOption evalOpt("eval", "Evaluate the formula registered under <id>.", "id");
    QCommandLineOption exprOpt("expr", "Evaluate an ad-hoc expression.", "text");
    cli.addOption(configOpt);
    cli.addOption(libraryOpt);
    cli.addOption(listOpt);
    cli.addOption(exportOpt);
    cli.addOption(evalOpt);
    cli.addOption(exprOpt);
    cli.addPositionalArgument("bindings", "Input values for --eval / --expr.", "[name=value...]");
    cli.process(app);

    // Configuration
    ConfigLoader config;
    QString configPath = resolveConfigPath(cli.value(configOpt));
    if (!configPath.isEmpty() && !config.load(configPath)) {
        err() << "Cannot read config file " << configPath << "\n";
        return 1;
    }

    // Logging
    setupFileLogging(config.getLogDir(), "formula_console", config.getDebugLogging());
    qInfo() << "[Console] Started; config:" << (configPath.isEmpty() ? QString("<none>") : configPath);

    RandomProviderPtr random = makeRandomProvider(config);
    FormulaLoader loader(random);
    FormulaRunner runner(&loader);
    FormulaJsonLoader jsonLoader(&loader);
    runner.setUseInputPooling(config.getUseInputPooling());

    bool failed = false;
    QObject::connect(&loader, &FormulaLoader::errorOccurred, [&failed](const QString &msg) {
        err() << msg << "\n";
        failed = true;
    });
    QObject::connect(&runner, &FormulaRunner::errorOccurred, [&failed](const QString &msg) {
        err() << msg << "\n";
        failed = true;
    });
    QObject::connect(&jsonLoader, &FormulaJsonLoader::errorOccurred, [&failed](const QString &msg) {
        err() << msg << "\n";
        failed = true;
    });

    FormulaBindings bindings;
    if (!parseBindings(cli.positionalArguments(), &bindings)) {
        cleanupFileLogging();
        return 1;
    }

    // Library
    QString libraryPath = cli.isSet(libraryOpt) ? cli.value(libraryOpt) : config.getLibraryPath();
    if (!libraryPath.isEmpty()) {
        int count = jsonLoader.loadFromFile(libraryPath);
        qInfo() << "[Console] Loaded" << count << "formulas from" << libraryPath;
    }

    if (cli.isSet(listOpt)) {
        for (const QString &id : loader.formulaIds()) {
            QStringList inputs = loader.requiredInputs(id).values();
            inputs.sort();
            out() << id << ": " << loader.formulaExpression(id);
            if (!inputs.isEmpty())
                out() << "    [inputs: " << inputs.join(", ") << "]";
            out() << "\n";
        }
    }

    if (cli.isSet(exportOpt)) {
        if (jsonLoader.exportToFile(cli.value(exportOpt)))
            qInfo() << "[Console] Exported" << loader.formulaCount() << "formulas to" << cli.value(exportOpt);
    }

    if (cli.isSet(evalOpt)) {
        QString id = cli.value(evalOpt);
        double value = 0.0;
        if (!loader.hasFormula(id)) {
            err() << "Formula '" << id << "' not found\n";
            failed = true;
        } else {
            // Only an error raised by this evaluation suppresses the result
            bool earlierFailure = failed;
            failed = false;
            // Pair inputs go through the runner's pool when pooling is enabled
            FormulaInputPairs pairs;
            for (auto it = bindings.constBegin(); it != bindings.constEnd(); ++it)
                pairs.append(qMakePair(it.key(), it.value()));
            value = runner.evaluate(id, pairs);
            if (!failed)
                out() << id << " = " << formatValue(value) << "\n";
            failed = failed || earlierFailure;
        }
    }

    if (cli.isSet(exprOpt)) {
        FormulaParser parser(random);
        ParseError perr;
        FormulaPtr formula = parser.parse(cli.value(exprOpt), &perr);
        if (!formula) {
            err() << perr.toString() << "\n";
            failed = true;
        } else {
            EvalError eerr;
            double value = formula->evaluate(bindings, &eerr);
            if (eerr.isError()) {
                err() << eerr.message << "\n";
                failed = true;
            } else {
                out() << formatValue(value) << "\n";
            }
        }
    }

    out().flush();
    err().flush();
    cleanupFileLogging();
    return failed ? 1 : 0;
}
