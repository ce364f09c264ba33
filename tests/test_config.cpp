#include <QtTest/QtTest>

#include "common/config.hpp"

class ConfigTests : public QObject
{
    Q_OBJECT
private slots:
    void init();
    void cleanup();
    void testDefaults();
    void testEnvironmentOverrides();
    void testNoColorConvention();
    void testGlobalFlagsStripped();

private:
    void clearEnvironment();
};

void ConfigTests::clearEnvironment()
{
    qunsetenv("BOOTVERDICT_TRANSCRIPT_DIR");
    qunsetenv("BOOTVERDICT_CHECKS");
    qunsetenv("BOOTVERDICT_REPORT");
    qunsetenv("BOOTVERDICT_NO_COLOR");
    qunsetenv("BOOTVERDICT_TRACE");
    qunsetenv("NO_COLOR");
}

void ConfigTests::init()
{
    clearEnvironment();
}

void ConfigTests::cleanup()
{
    clearEnvironment();
}

void ConfigTests::testDefaults()
{
    const auto config = bootverdict::loadConfigFromEnvironment();
    QCOMPARE(config.transcriptDir, QStringLiteral("/tmp"));
    QVERIFY(config.checksPath.isEmpty());
    QVERIFY(config.reportPath.isEmpty());
    QVERIFY(config.colorEnabled);
    QVERIFY(!config.traceEnabled);
}

void ConfigTests::testEnvironmentOverrides()
{
    qputenv("BOOTVERDICT_TRANSCRIPT_DIR", "/var/lib/rustica/qemu");
    qputenv("BOOTVERDICT_CHECKS", "/etc/bootverdict/checks.json");
    qputenv("BOOTVERDICT_REPORT", "/srv/reports");
    qputenv("BOOTVERDICT_TRACE", "1");
    qputenv("BOOTVERDICT_NO_COLOR", "1");

    const auto config = bootverdict::loadConfigFromEnvironment();
    QCOMPARE(config.transcriptDir, QStringLiteral("/var/lib/rustica/qemu"));
    QCOMPARE(config.checksPath, QStringLiteral("/etc/bootverdict/checks.json"));
    QCOMPARE(config.reportPath, QStringLiteral("/srv/reports"));
    QVERIFY(config.traceEnabled);
    QVERIFY(!config.colorEnabled);
}

void ConfigTests::testNoColorConvention()
{
    qputenv("NO_COLOR", "");
    QVERIFY(!bootverdict::loadConfigFromEnvironment().colorEnabled);
}

void ConfigTests::testGlobalFlagsStripped()
{
    bootverdict::AppConfig config;
    const QStringList args = bootverdict::applyGlobalFlags(
        {"bootverdict-report", "analyze", "--trace", "--arch", "arm64", "--no-color"}, config);

    QCOMPARE(args, QStringList({"bootverdict-report", "analyze", "--arch", "arm64"}));
    QVERIFY(config.traceEnabled);
    QVERIFY(!config.colorEnabled);

    bootverdict::AppConfig untouched;
    const QStringList plain = bootverdict::applyGlobalFlags({"bootverdict-report", "checks"},
                                                            untouched);
    QCOMPARE(plain.size(), static_cast<qsizetype>(2));
    QVERIFY(!untouched.traceEnabled);
    QVERIFY(untouched.colorEnabled);
}

QTEST_MAIN(ConfigTests)
#include "test_config.moc"
