#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <unistd.h>

#include <cstdio>
#include <mutex>

#include "common/json_utils.hpp"

namespace bootverdict::logging {

namespace {

std::mutex g_logMutex;
LogOptions g_options;
QString g_who;

thread_local QString t_corrId;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

QString processName()
{
    if (!g_options.processName.isEmpty()) {
        return g_options.processName;
    }
    if (QCoreApplication::instance() && !QCoreApplication::applicationName().isEmpty()) {
        return QCoreApplication::applicationName();
    }
    return QStringLiteral("bootverdict");
}

QString hostAndUser()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname)) != 0) {
        hostname[0] = '\0';
    }
    return QStringLiteral("host:%1,uid:%2")
        .arg(QString::fromUtf8(hostname))
        .arg(static_cast<int>(getuid()));
}

void appendLine(const QString &path, const QByteArray &line, qint64 maxBytes)
{
    QDir().mkpath(logsDirPath());

    const QFileInfo info(path);
    if (maxBytes > 0 && info.exists() && info.size() >= maxBytes) {
        const QString rotated = path + QStringLiteral(".1");
        QFile::remove(rotated);
        QFile::rename(path, rotated);
    }

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        fprintf(stderr, "%s\n", line.constData());
        return;
    }
    file.write(line);
    file.write("\n");
}

nlohmann::json checkContext(Target target, const CheckResult &check)
{
    return nlohmann::json{
        {"target", target},
        {"check", check.id},
        {"passed", check.passed},
        {"pattern", check.matchedPattern}
    };
}

} // namespace

void initLogging(const LogOptions &options)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_options = options;
    g_who = hostAndUser();
}

bool isTraceEnabled()
{
    return g_options.traceEnabled;
}

QString logsDirPath()
{
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/bootverdict/logs");
    }
    return home + QStringLiteral("/.local/share/bootverdict/logs");
}

QString mainLogPath()
{
    return QDir(logsDirPath()).filePath(processName() + QStringLiteral(".log"));
}

QString traceLogPath()
{
    return QDir(logsDirPath()).filePath(processName() + QStringLiteral("-trace.log"));
}

QString currentCorrelationId()
{
    return t_corrId;
}

CorrelationScope::CorrelationScope(Target target)
    : m_prev(t_corrId)
{
    t_corrId = QStringLiteral("analyze-%1").arg(QString::fromStdString(toTargetString(target)));
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

void logEvent(LogLevel level,
              const QString &component,
              const QString &event,
              const nlohmann::json &context)
{
    if (level == LogLevel::Debug && !g_options.traceEnabled) {
        return;
    }

    const nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"process", processName().toStdString()},
        {"thread", QStringLiteral("0x%1")
                       .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16)
                       .toStdString()},
        {"who", g_who.isEmpty() ? hostAndUser().toStdString() : g_who.toStdString()},
        {"corr", t_corrId.toStdString()},
        {"component", component.toStdString()},
        {"event", event.toStdString()},
        {"context", context}
    };
    // Transcript-derived strings may not be valid UTF-8.
    const QByteArray line = QByteArray::fromStdString(
        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    std::lock_guard<std::mutex> lock(g_logMutex);
    appendLine(mainLogPath(), line, g_options.maxLogSizeBytes);
    if (g_options.traceEnabled) {
        appendLine(traceLogPath(), line, g_options.maxLogSizeBytes);
    }
}

void logCommandStart(const QString &command, int argCount)
{
    logEvent(LogLevel::Info, QStringLiteral("ReportCli"), QStringLiteral("command_start"),
             nlohmann::json{{"command", command.toStdString()}, {"args", argCount}});
}

void logCatalogRejected(const QString &path, const QString &error)
{
    logEvent(LogLevel::Error, QStringLiteral("CheckCatalog"), QStringLiteral("catalog_rejected"),
             nlohmann::json{{"path", path.toStdString()}, {"error", error.toStdString()}});
}

void logTranscriptMissing(const TargetOutcome &outcome)
{
    logEvent(LogLevel::Warn, QStringLiteral("BootClassifier"), QStringLiteral("transcript_missing"),
             nlohmann::json{{"target", outcome.target},
                            {"outcome", toOutcomeString(outcome.kind)},
                            {"path", outcome.transcriptPath},
                            {"reason", outcome.reason}});
}

void logCheckEvaluated(Target target, const CheckResult &check, const QString &evidenceLine)
{
    nlohmann::json context = checkContext(target, check);
    if (!evidenceLine.isEmpty()) {
        context["line"] = evidenceLine.toStdString();
    }
    logEvent(LogLevel::Debug, QStringLiteral("BootClassifier"), QStringLiteral("check_evaluated"),
             context);
}

void logVerdict(const TargetOutcome &outcome)
{
    if (!outcome.verdict.has_value()) {
        logTranscriptMissing(outcome);
        return;
    }

    nlohmann::json failed = nlohmann::json::array();
    for (const auto &check : outcome.verdict->checks) {
        if (!check.passed) {
            failed.push_back(check.id);
        }
    }
    logEvent(outcome.passed() ? LogLevel::Info : LogLevel::Warn,
             QStringLiteral("BootClassifier"),
             QStringLiteral("transcript_classified"),
             nlohmann::json{{"target", outcome.target},
                            {"outcome", toOutcomeString(outcome.kind)},
                            {"passed", outcome.verdict->passedCount()},
                            {"total", outcome.verdict->totalCount()},
                            {"failedChecks", failed},
                            {"errorMarkersSeen", outcome.errorMarkersSeen}});
}

void logReportWritten(const QString &path)
{
    logEvent(LogLevel::Info, QStringLiteral("ReportRenderer"), QStringLiteral("report_written"),
             nlohmann::json{{"out", path.toStdString()}});
}

void logRunSummary(const OutcomeSummary &summary, const QString &format)
{
    logEvent(summary.failed > 0 || summary.indeterminate > 0 ? LogLevel::Warn : LogLevel::Info,
             QStringLiteral("ReportCli"),
             QStringLiteral("analysis_complete"),
             nlohmann::json{{"summary", summary}, {"format", format.toStdString()}});
}

} // namespace bootverdict::logging
