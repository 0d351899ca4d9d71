/**
 * @file test_settings.cpp
 * @brief Unit tests for Settings
 *
 * Settings are redirected into a temporary directory before the
 * singleton is first touched, so the user's configuration is never read
 * or written.
 */

#include <QtTest/QtTest>
#include <QTemporaryDir>
#include "settings.h"

class TestSettings : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();

    void testDefaults();
    void testSetPaths();
    void testSetNumbers();
    void testSetSchedules();
    void testSetDebugLogging();
    void testRejectsBadValues_data();
    void testRejectsBadValues();
    void testEveryKeyReadable();
    void testStoredScheduleFallback();

private:
    QTemporaryDir *m_configDir;
};

void TestSettings::initTestCase()
{
    m_configDir = new QTemporaryDir();
    QVERIFY(m_configDir->isValid());
    QSettings::setPath(QSettings::NativeFormat, QSettings::UserScope, m_configDir->path());
}

void TestSettings::cleanupTestCase()
{
    delete m_configDir;
    m_configDir = nullptr;
}

void TestSettings::testDefaults()
{
    Settings &settings = Settings::instance();

    const RetryPolicy policy = settings.retryPolicy();
    QCOMPARE(policy.maxAttempts, 3);
    QCOMPARE(policy.connectBackoffMs, QList<int>({1000, 2000, 4000}));
    QCOMPARE(policy.verifyAttempts, 3);
    QCOMPARE(policy.verifyBackoffMs, QList<int>({500, 1000, 2000}));
    QCOMPARE(settings.batteryPollIntervalMs(), 30000);
    QVERIFY(!settings.debugLogging());
    QVERIFY(settings.deviceDirectory().isEmpty());
    QVERIFY(settings.storageDirectory().endsWith("Recordings"));
}

void TestSettings::testSetPaths()
{
    Settings &settings = Settings::instance();
    const QString storage = QDir(m_configDir->path()).filePath("store/../Recordings");

    QVERIFY(settings.setFromString("storage/directory", storage));
    QCOMPARE(settings.storageDirectory(), QDir(m_configDir->path()).filePath("Recordings"));

    QVERIFY(settings.setFromString("device/directory", "/media/recorder"));
    QCOMPARE(settings.deviceDirectory(), QString("/media/recorder"));
    QCOMPARE(settings.valueAsString("device/directory"), QString("/media/recorder"));

    QVERIFY(settings.setFromString("storage/catalogPath", "/tmp/catalog.json"));
    QCOMPARE(settings.catalogPath(), QString("/tmp/catalog.json"));
}

void TestSettings::testSetNumbers()
{
    Settings &settings = Settings::instance();

    QVERIFY(settings.setFromString("connection/maxRetryAttempts", "5"));
    QVERIFY(settings.setFromString("connection/verifyAttempts", " 2 "));
    QVERIFY(settings.setFromString("battery/pollIntervalMs", "60000"));

    QCOMPARE(settings.maxRetryAttempts(), 5);
    QCOMPARE(settings.verifyAttempts(), 2);
    QCOMPARE(settings.batteryPollIntervalMs(), 60000);
    QCOMPARE(settings.retryPolicy().maxAttempts, 5);
}

void TestSettings::testSetSchedules()
{
    Settings &settings = Settings::instance();

    QVERIFY(settings.setFromString("connection/backoffMs", "100, 200,400"));
    QCOMPARE(settings.connectBackoffMs(), QList<int>({100, 200, 400}));
    QCOMPARE(settings.valueAsString("connection/backoffMs"), QString("100,200,400"));

    QVERIFY(settings.setFromString("connection/verifyBackoffMs", "50"));
    QCOMPARE(settings.retryPolicy().verifyBackoffMs, QList<int>({50}));
}

void TestSettings::testSetDebugLogging()
{
    Settings &settings = Settings::instance();

    QVERIFY(settings.setFromString("advanced/debugLogging", "on"));
    QVERIFY(settings.debugLogging());
    QCOMPARE(settings.valueAsString("advanced/debugLogging"), QString("true"));

    QVERIFY(settings.setFromString("advanced/debugLogging", "FALSE"));
    QVERIFY(!settings.debugLogging());
}

void TestSettings::testRejectsBadValues_data()
{
    QTest::addColumn<QString>("key");
    QTest::addColumn<QString>("value");
    QTest::addColumn<QString>("message");

    QTest::newRow("unknown key") << "storage/colour" << "blue" << "Unknown setting";
    QTest::newRow("empty path") << "storage/directory" << " " << "needs a path";
    QTest::newRow("not a number") << "connection/maxRetryAttempts" << "many" << "needs a number";
    QTest::newRow("zero attempts") << "connection/verifyAttempts" << "0" << "at least 1";
    QTest::newRow("poll too fast") << "battery/pollIntervalMs" << "10" << "at least 1000";
    QTest::newRow("bad schedule") << "connection/backoffMs" << "1000,soon" << "comma separated";
    QTest::newRow("negative delay") << "connection/verifyBackoffMs" << "-5" << "comma separated";
    QTest::newRow("bad flag") << "advanced/debugLogging" << "maybe" << "true or false";
}

void TestSettings::testRejectsBadValues()
{
    QFETCH(QString, key);
    QFETCH(QString, value);
    QFETCH(QString, message);

    Settings &settings = Settings::instance();
    const QString before = settings.valueAsString(key);

    QString error;
    QVERIFY(!settings.setFromString(key, value, &error));
    QVERIFY2(error.contains(message), qPrintable(error));
    QCOMPARE(settings.valueAsString(key), before);
}

void TestSettings::testEveryKeyReadable()
{
    Settings &settings = Settings::instance();
    for (const QString &key : Settings::keys()) {
        QVERIFY2(!settings.valueAsString(key).isEmpty() || key == "device/directory",
                 qPrintable(key));
    }
    QVERIFY(settings.valueAsString("nope").isEmpty());
}

void TestSettings::testStoredScheduleFallback()
{
    // Hand-edited config with garbage falls back to the built-in schedule
    Settings &settings = Settings::instance();
    {
        QSettings raw("QDockSync", "QDockSync");
        raw.setValue("connection/backoffMs", "fast");
        raw.sync();
    }
    settings.sync();

    QCOMPARE(settings.connectBackoffMs(), RetryPolicy().connectBackoffMs);
}

QTEST_MAIN(TestSettings)
#include "test_settings.moc"
