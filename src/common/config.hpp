#pragma once

#include <QString>
#include <QStringList>

namespace bootverdict {

struct AppConfig {
    // Directory holding qemu-<arch>-boot.log transcripts.
    QString transcriptDir = QStringLiteral("/tmp");
    // Optional JSON file overriding check patterns.
    QString checksPath;
    // Optional Markdown report destination (file or directory).
    QString reportPath;
    bool colorEnabled = true;
    bool traceEnabled = false;
};

// Reads BOOTVERDICT_* (and NO_COLOR) from the environment. Command-line
// flags are applied on top by the caller.
AppConfig loadConfigFromEnvironment();

// Applies --trace and --no-color to config and returns args without them, so
// they may appear anywhere on the command line.
QStringList applyGlobalFlags(const QStringList &args, AppConfig &config);

} // namespace bootverdict
