#pragma once

#include <QString>
#include <QtGlobal>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace bootverdict::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

constexpr qint64 kDefaultMaxLogSizeBytes = 5 * 1024 * 1024;

struct LogOptions {
    QString processName;
    // DEBUG events and <process>-trace.log are only written when set.
    bool traceEnabled = false;
    // <process>.log is moved to <process>.log.1 once it reaches this size.
    qint64 maxLogSizeBytes = kDefaultMaxLogSizeBytes;
};

// Initialize logging for the current process. Call early in main().
void initLogging(const LogOptions &options);

bool isTraceEnabled();

QString logsDirPath();
QString mainLogPath();
QString traceLogPath();

QString currentCorrelationId();

// Tags every event logged on this thread while alive with "analyze-<arch>".
class CorrelationScope {
public:
    explicit CorrelationScope(Target target);
    ~CorrelationScope();

private:
    QString m_prev;
};

// One JSON line: ts, level, process, thread, who, corr, component, event, context.
void logEvent(LogLevel level,
              const QString &component,
              const QString &event,
              const nlohmann::json &context = nlohmann::json::object());

void logCommandStart(const QString &command, int argCount);
void logCatalogRejected(const QString &path, const QString &error);
void logTranscriptMissing(const TargetOutcome &outcome);
void logCheckEvaluated(Target target, const CheckResult &check, const QString &evidenceLine);
// INFO for a passing verdict, WARN for a failing one.
void logVerdict(const TargetOutcome &outcome);
void logReportWritten(const QString &path);
void logRunSummary(const OutcomeSummary &summary, const QString &format);

} // namespace bootverdict::logging
