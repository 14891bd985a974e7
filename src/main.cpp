#include "engine/ParserEngine.h"
#include "formula/FormulaOrchestrator.h"
#include "formula/FormulaSetParser.h"
#include "utils/ConfigLoader.h"
#include "utils/FileLogger.h"
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QJsonDocument>
#include <QTextStream>

namespace {

enum ExitCode { ExitOk = 0, ExitEvaluationFailed = 1, ExitUsage = 2 };

// "--var gpa=3.5" style bindings: numbers become doubles, true/false become
// booleans, anything else stays a string
bool parseBinding(const QString &binding, QString *name, QVariant *value)
{
    int eq = binding.indexOf('=');
    if (eq <= 0)
        return false;

    *name = binding.left(eq).trimmed();
    QString raw = binding.mid(eq + 1).trimmed();

    bool ok = false;
    double number = raw.toDouble(&ok);
    if (ok)
        *value = number;
    else if (raw.compare("true", Qt::CaseInsensitive) == 0)
        *value = true;
    else if (raw.compare("false", Qt::CaseInsensitive) == 0)
        *value = false;
    else
        *value = raw;
    return !name->isEmpty();
}

void printJson(const QJsonObject &json)
{
    QTextStream out(stdout);
    out << QJsonDocument(json).toJson(QJsonDocument::Indented);
    out.flush();
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("formula_cli");
    app.setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Evaluates a scoring formula or a JSON formula set");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption("config", "Engine configuration (INI, [ENGINE] section).", "file");
    QCommandLineOption varOption("var", "Binds a variable, e.g. --var gpa=3.5 (repeatable).", "name=value");
    QCommandLineOption setOption("formula-set", "Runs a JSON formula set instead of an expression.", "file");
    QCommandLineOption logOption("log", "Also appends log lines to this file.", "file");
    QCommandLineOption debugOption("debug", "Enables debug logging.");
    parser.addOption(configOption);
    parser.addOption(varOption);
    parser.addOption(setOption);
    parser.addOption(logOption);
    parser.addOption(debugOption);
    parser.addPositionalArgument("expression", "Formula to evaluate.", "[expression]");
    parser.process(app);

    installFormulaLogging(parser.value(logOption), parser.isSet(debugOption));

    // ── Configuration ──
    EngineConfig config;
    if (parser.isSet(configOption)) {
        ConfigLoader loader;
        if (!loader.load(parser.value(configOption))) {
            qCritical().noquote() << "Cannot load configuration:" << loader.lastError();
            shutdownFormulaLogging();
            return ExitUsage;
        }
        config = EngineConfig::fromLoader(loader);
        if (!loader.invalidValues().isEmpty())
            qWarning().noquote() << "Ignoring unparsable settings:"
                                 << loader.invalidValues().join(", ");
    }

    FormulaError error;
    std::shared_ptr<const ParserEngine> engine = ParserEngine::create(config, &error);
    if (!engine) {
        qCritical().noquote() << "Engine initialisation failed:" << error.toString();
        shutdownFormulaLogging();
        return ExitUsage;
    }

    // ── Variables ──
    QVariantMap variables;
    for (const QString &binding : parser.values(varOption)) {
        QString name;
        QVariant value;
        if (!parseBinding(binding, &name, &value)) {
            qCritical().noquote() << "Malformed --var binding:" << binding;
            shutdownFormulaLogging();
            return ExitUsage;
        }
        variables.insert(name, value);
    }

    int exitCode = ExitOk;

    if (parser.isSet(setOption)) {
        QString errorMsg;
        FormulaSet set = FormulaSetParser::loadFile(parser.value(setOption), errorMsg);
        if (!errorMsg.isEmpty()) {
            qCritical().noquote() << errorMsg;
            shutdownFormulaLogging();
            return ExitUsage;
        }

        FormulaOrchestrator orchestrator(engine);
        FormulaExecution execution = orchestrator.execute(set, variables);
        printJson(execution.toJson());
        if (execution.status() == FormulaExecution::Status::Failed)
            exitCode = ExitEvaluationFailed;
    } else {
        const QStringList args = parser.positionalArguments();
        if (args.isEmpty()) {
            qCritical().noquote() << "Nothing to evaluate: pass an expression or --formula-set";
            parser.showHelp(ExitUsage);
        }

        EvaluationResult result = engine->evaluate(args.join(' '), variables);
        printJson(result.toJson());
        if (!result.success)
            exitCode = ExitEvaluationFailed;
    }

    shutdownFormulaLogging();
    return exitCode;
}
