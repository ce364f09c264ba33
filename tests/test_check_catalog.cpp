#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include "classifier/boot_classifier.hpp"
#include "classifier/check_catalog.hpp"

class CheckCatalogTests : public QObject
{
    Q_OBJECT
private slots:
    void testDefaultCatalog();
    void testOverrideReplacesPatterns();
    void testUnknownCheckRejected();
    void testEmptyPatternsRejected();
    void testInvalidJsonRejected();
    void testMissingFileRejected();

private:
    QTemporaryDir m_tempDir;

    QString writeCatalog(const QString &name, const QByteArray &content);
};

QString CheckCatalogTests::writeCatalog(const QString &name, const QByteArray &content)
{
    const QString path = m_tempDir.path() + "/" + name;
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return {};
    }
    file.write(content);
    return path;
}

void CheckCatalogTests::testDefaultCatalog()
{
    const auto catalog = bootverdict::defaultCheckCatalog();
    QCOMPARE(catalog.size(), static_cast<size_t>(5));

    size_t absentCount = 0;
    for (const auto &check : catalog) {
        QVERIFY(!check.patterns.empty());
        QVERIFY(!check.passMessage.empty());
        QVERIFY(!check.failMessage.empty());
        if (check.polarity == bootverdict::CheckPolarity::RequireAbsent) {
            ++absentCount;
            QCOMPARE(check.id, bootverdict::CheckId::NoPanic);
        }
    }
    QCOMPARE(absentCount, static_cast<size_t>(1));

    const auto *shell = bootverdict::findCheck(catalog, bootverdict::CheckId::ReachedShell);
    QVERIFY(shell != nullptr);
    QCOMPARE(shell->patterns.size(), static_cast<size_t>(3));
}

void CheckCatalogTests::testOverrideReplacesPatterns()
{
    QVERIFY(m_tempDir.isValid());
    const QString path = writeCatalog(
        "strict.json",
        R"({"checks": {"installer_started": {"patterns": ["Rustica OS Installer"]},
                       "no_panic": {"patterns": ["Kernel panic - not syncing"]}}})");
    QVERIFY(!path.isEmpty());

    QString error;
    const auto catalog = bootverdict::loadCheckCatalog(path, &error);
    QVERIFY2(catalog.has_value(), qPrintable(error));
    QCOMPARE(catalog->size(), static_cast<size_t>(5));

    const auto *installer =
        bootverdict::findCheck(*catalog, bootverdict::CheckId::InstallerStarted);
    QVERIFY(installer != nullptr);
    QCOMPARE(installer->patterns.size(), static_cast<size_t>(1));

    const auto *panic = bootverdict::findCheck(*catalog, bootverdict::CheckId::NoPanic);
    QVERIFY(panic != nullptr);
    QCOMPARE(panic->polarity, bootverdict::CheckPolarity::RequireAbsent);

    bootverdict::Transcript transcript;
    transcript.text = "Starting installer.service\ndebug: panic handler registered\n";
    const auto verdict = bootverdict::BootClassifier::classify(transcript, *catalog);
    for (const auto &check : verdict.checks) {
        if (check.id == bootverdict::CheckId::InstallerStarted) {
            QVERIFY(!check.passed);
        }
        if (check.id == bootverdict::CheckId::NoPanic) {
            QVERIFY(check.passed);
        }
    }
}

void CheckCatalogTests::testUnknownCheckRejected()
{
    QVERIFY(m_tempDir.isValid());
    const QString path = writeCatalog(
        "unknown.json", R"({"checks": {"network_up": {"patterns": ["eth0: link up"]}}})");

    QString error;
    QVERIFY(!bootverdict::loadCheckCatalog(path, &error).has_value());
    QVERIFY(error.contains("network_up"));
}

void CheckCatalogTests::testEmptyPatternsRejected()
{
    QVERIFY(m_tempDir.isValid());
    const QString path = writeCatalog(
        "empty.json", R"({"checks": {"kernel_loaded": {"patterns": []}}})");

    QString error;
    QVERIFY(!bootverdict::loadCheckCatalog(path, &error).has_value());
    QVERIFY(!error.isEmpty());

    const QString blank = writeCatalog(
        "blank.json", R"({"checks": {"kernel_loaded": {"patterns": [""]}}})");
    QVERIFY(!bootverdict::loadCheckCatalog(blank, &error).has_value());
}

void CheckCatalogTests::testInvalidJsonRejected()
{
    QVERIFY(m_tempDir.isValid());
    const QString path = writeCatalog("broken.json", "{\"checks\": ");

    QString error;
    QVERIFY(!bootverdict::loadCheckCatalog(path, &error).has_value());
    QVERIFY(error.startsWith("Invalid check catalog JSON"));

    const QString noChecks = writeCatalog("nochecks.json", R"({"patterns": []})");
    QVERIFY(!bootverdict::loadCheckCatalog(noChecks, &error).has_value());
}

void CheckCatalogTests::testMissingFileRejected()
{
    QString error;
    QVERIFY(!bootverdict::loadCheckCatalog("/nonexistent/bootverdict/checks.json", &error)
                 .has_value());
    QVERIFY(error.startsWith("Cannot open check catalog"));

    // A null error pointer is allowed.
    QVERIFY(!bootverdict::loadCheckCatalog("/nonexistent/bootverdict/checks.json", nullptr)
                 .has_value());
}

QTEST_MAIN(CheckCatalogTests)
#include "test_check_catalog.moc"
