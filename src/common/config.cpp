#include "common/config.hpp"

#include <QtGlobal>

namespace bootverdict {

AppConfig loadConfigFromEnvironment()
{
    AppConfig config;

    const QString transcriptDir = qEnvironmentVariable("BOOTVERDICT_TRANSCRIPT_DIR");
    if (!transcriptDir.isEmpty()) {
        config.transcriptDir = transcriptDir;
    }
    config.checksPath = qEnvironmentVariable("BOOTVERDICT_CHECKS");
    config.reportPath = qEnvironmentVariable("BOOTVERDICT_REPORT");

    // NO_COLOR disables color whenever it is present, whatever its value.
    if (qEnvironmentVariableIsSet("NO_COLOR")
        || qEnvironmentVariableIntValue("BOOTVERDICT_NO_COLOR") == 1) {
        config.colorEnabled = false;
    }
    config.traceEnabled = qEnvironmentVariableIntValue("BOOTVERDICT_TRACE") == 1;

    return config;
}

QStringList applyGlobalFlags(const QStringList &args, AppConfig &config)
{
    QStringList remaining;
    remaining.reserve(args.size());
    for (const QString &arg : args) {
        if (arg == QStringLiteral("--trace")) {
            config.traceEnabled = true;
        } else if (arg == QStringLiteral("--no-color")) {
            config.colorEnabled = false;
        } else {
            remaining.push_back(arg);
        }
    }
    return remaining;
}

} // namespace bootverdict
