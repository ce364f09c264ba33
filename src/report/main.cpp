#include <QCoreApplication>

#include "report/ReportCli.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("bootverdict-report"));

    // Environment first; ReportCli applies the command-line flags on top.
    bootverdict::ReportCli cli(bootverdict::loadConfigFromEnvironment());
    return cli.run(argc, argv);
}
