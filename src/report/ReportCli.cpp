#include "report/ReportCli.hpp"

#include <iostream>
#include <optional>

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <nlohmann/json.hpp>

#include "classifier/boot_classifier.hpp"
#include "classifier/check_catalog.hpp"
#include "classifier/transcript_loader.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "report/ReportRenderer.hpp"

namespace bootverdict {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  bootverdict-report analyze [--arch amd64|arm64|riscv64|all] [--log-dir DIR]\n"
        "                             [--checks PATH] [--format text|markdown|json]\n"
        "                             [--report PATH] [--no-color]\n"
        "  bootverdict-report checks [--checks PATH] [--format text|json]\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("text");
    }
    return value.toLower();
}

const QStringList &valuedOptions()
{
    static const QStringList options = {
        QStringLiteral("--arch"), QStringLiteral("--log-dir"), QStringLiteral("--checks"),
        QStringLiteral("--format"), QStringLiteral("--report")
    };
    return options;
}

// An option followed by nothing or by another known option is a usage error.
// Other values are taken verbatim, even when they start with "--".
bool hasDanglingOption(const QStringList &args)
{
    for (const QString &key : valuedOptions()) {
        const int idx = args.indexOf(key);
        if (idx < 0) {
            continue;
        }
        if (idx + 1 >= args.size() || valuedOptions().contains(args.at(idx + 1))) {
            return true;
        }
    }
    return false;
}

std::optional<std::vector<Target>> parseTargets(const QString &value)
{
    const QString arch = value.isEmpty() ? QStringLiteral("amd64") : value.toLower();
    if (arch == QStringLiteral("all")) {
        return allTargets();
    }
    const auto target = parseTargetString(arch.toStdString());
    if (!target.has_value()) {
        return std::nullopt;
    }
    return std::vector<Target>{*target};
}

bool writeTextFile(const QString &path, const std::string &content)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    const QByteArray data = QByteArray::fromStdString(content);
    return file.write(data) == data.size();
}

int exitCodeFor(const OutcomeSummary &summary)
{
    if (summary.failed > 0) {
        return kExitChecksFailed;
    }
    if (summary.indeterminate > 0) {
        return kExitIndeterminate;
    }
    return kExitAllPassed;
}

} // namespace

ReportCli::ReportCli()
    : m_config(loadConfigFromEnvironment())
{
}

ReportCli::ReportCli(const AppConfig &config)
    : m_config(config)
{
}

const AppConfig &ReportCli::config() const
{
    return m_config;
}

int ReportCli::run(int argc, char *argv[])
{
    // CLI entry: parse the subcommand and delegate to the handler.
    QStringList rawArgs;
    rawArgs.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        rawArgs.push_back(QString::fromLocal8Bit(argv[i]));
    }
    const QStringList args = applyGlobalFlags(rawArgs, m_config);

    logging::LogOptions logOptions;
    logOptions.processName = QStringLiteral("bootverdict-report");
    logOptions.traceEnabled = m_config.traceEnabled;
    logging::initLogging(logOptions);

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return kExitUsageError;
    }

    const QString command = args.at(1);
    logging::logCommandStart(command, static_cast<int>(args.size()));

    if (hasDanglingOption(args)) {
        std::cerr << usageText().toStdString();
        return kExitUsageError;
    }

    if (command == QStringLiteral("analyze")) {
        return runAnalyze(args);
    }
    if (command == QStringLiteral("checks")) {
        return runChecks(args);
    }

    std::cerr << usageText().toStdString();
    return kExitUsageError;
}

bool ReportCli::loadCatalog(CheckCatalog &catalog) const
{
    if (m_config.checksPath.isEmpty()) {
        catalog = defaultCheckCatalog();
        return true;
    }

    QString error;
    const auto loaded = loadCheckCatalog(m_config.checksPath, &error);
    if (!loaded.has_value()) {
        logging::logCatalogRejected(m_config.checksPath, error);
        std::cerr << error.toStdString() << std::endl;
        return false;
    }
    catalog = *loaded;
    return true;
}

std::vector<TargetOutcome> ReportCli::analyzeTargets(const std::vector<Target> &targets,
                                                     const CheckCatalog &catalog) const
{
    std::vector<TargetOutcome> outcomes;
    outcomes.reserve(targets.size());

    for (const Target target : targets) {
        logging::CorrelationScope scope(target);

        const QString path = transcriptPathFor(m_config.transcriptDir, target);
        const auto transcript = loadTranscript(path, target);
        TargetOutcome outcome =
            BootClassifier::classifyTarget(target, transcript, catalog, path.toStdString());

        if (transcript.has_value() && logging::isTraceEnabled()) {
            for (const auto &check : outcome.verdict->checks) {
                const QString evidence = firstLineMatching(
                    *transcript, QString::fromStdString(check.matchedPattern));
                logging::logCheckEvaluated(target, check, evidence);
            }
        }
        logging::logVerdict(outcome);

        outcomes.push_back(std::move(outcome));
    }

    return outcomes;
}

QString ReportCli::resolveReportPath(const QString &value) const
{
    const QFileInfo info(value);
    if (info.isDir()) {
        const QString stamp =
            QDateTime::currentDateTime().toString(QStringLiteral("yyyyMMdd-HHmmss"));
        return QDir(value).filePath(QStringLiteral("test-report-%1.md").arg(stamp));
    }
    return value;
}

int ReportCli::runAnalyze(const QStringList &args)
{
    const QString logDir = getArgValue(args, QStringLiteral("--log-dir"));
    if (!logDir.isEmpty()) {
        m_config.transcriptDir = logDir;
    }
    const QString checksPath = getArgValue(args, QStringLiteral("--checks"));
    if (!checksPath.isEmpty()) {
        m_config.checksPath = checksPath;
    }
    const QString reportPath = getArgValue(args, QStringLiteral("--report"));
    if (!reportPath.isEmpty()) {
        m_config.reportPath = reportPath;
    }

    const QString archValue = getArgValue(args, QStringLiteral("--arch"));
    const auto targets = parseTargets(archValue);
    if (!targets.has_value()) {
        std::cerr << "Unknown architecture: " << archValue.toStdString()
                  << ". Use amd64, arm64, riscv64 or all." << std::endl;
        return kExitUsageError;
    }

    const QString format = getFormat(args);
    if (format != QStringLiteral("text") && format != QStringLiteral("markdown")
        && format != QStringLiteral("json")) {
        std::cerr << "Invalid format. Use text, markdown or json." << std::endl;
        return kExitUsageError;
    }

    CheckCatalog catalog;
    if (!loadCatalog(catalog)) {
        return kExitUsageError;
    }

    const std::vector<TargetOutcome> outcomes = analyzeTargets(*targets, catalog);
    const OutcomeSummary summary = summarize(outcomes);
    const ReportMeta meta = currentReportMeta();
    const ReportRenderer renderer(catalog);

    if (format == QStringLiteral("json")) {
        std::cout << renderer.renderJson(outcomes, meta).dump(2) << std::endl;
    } else if (format == QStringLiteral("markdown")) {
        std::cout << renderer.renderMarkdown(outcomes, meta);
    } else {
        std::cout << renderer.renderConsole(outcomes, m_config.colorEnabled);
    }

    if (!m_config.reportPath.isEmpty()) {
        const QString path = resolveReportPath(m_config.reportPath);
        if (!writeTextFile(path, renderer.renderMarkdown(outcomes, meta))) {
            std::cerr << "Failed to write test report: " << path.toStdString() << std::endl;
            return kExitUsageError;
        }
        logging::logReportWritten(path);
        std::cerr << "Test report created: " << path.toStdString() << std::endl;
    }

    logging::logRunSummary(summary, format);

    return exitCodeFor(summary);
}

int ReportCli::runChecks(const QStringList &args)
{
    const QString checksPath = getArgValue(args, QStringLiteral("--checks"));
    if (!checksPath.isEmpty()) {
        m_config.checksPath = checksPath;
    }

    const QString format = getFormat(args);
    if (format != QStringLiteral("text") && format != QStringLiteral("json")) {
        std::cerr << "Invalid format. Use text or json." << std::endl;
        return kExitUsageError;
    }

    CheckCatalog catalog;
    if (!loadCatalog(catalog)) {
        return kExitUsageError;
    }

    if (format == QStringLiteral("json")) {
        nlohmann::json payload;
        payload["checks"] = catalog;
        std::cout << payload.dump(2) << std::endl;
        return kExitAllPassed;
    }

    for (const auto &check : catalog) {
        std::cout << toCheckKey(check.id) << " (" << check.label << ", "
                  << (check.polarity == CheckPolarity::RequireAbsent ? "must be absent"
                                                                     : "must be present")
                  << "):";
        for (const auto &pattern : check.patterns) {
            std::cout << " \"" << pattern << "\"";
        }
        std::cout << "\n";
    }
    return kExitAllPassed;
}

} // namespace bootverdict
