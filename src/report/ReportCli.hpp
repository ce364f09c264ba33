#pragma once

#include <vector>

#include <QString>
#include <QStringList>

#include "common/config.hpp"
#include "common/models.hpp"

namespace bootverdict {

constexpr int kExitAllPassed = 0;
constexpr int kExitChecksFailed = 1;
constexpr int kExitUsageError = 2;
constexpr int kExitIndeterminate = 3;

class ReportCli
{
public:
    ReportCli();
    explicit ReportCli(const AppConfig &config);

    // CLI dispatcher for boot transcript analysis. --trace and --no-color are
    // accepted anywhere; logging is initialized from the resulting config.
    // returns exit code
    int run(int argc, char *argv[]);

    // Configuration after the last run() applied its flags.
    const AppConfig &config() const;

private:
    int runAnalyze(const QStringList &args);
    int runChecks(const QStringList &args);

    // Every target is analyzed; a missing transcript never stops the run.
    std::vector<TargetOutcome> analyzeTargets(const std::vector<Target> &targets,
                                              const CheckCatalog &catalog) const;

    bool loadCatalog(CheckCatalog &catalog) const;
    QString resolveReportPath(const QString &value) const;

    AppConfig m_config;
};

} // namespace bootverdict
