/**
 * @file test_transportserializer.cpp
 * @brief Unit tests for TransportSerializer
 *
 * Tests that every device operation runs on the transport's worker
 * thread one at a time, and that a missing session is reported rather
 * than thrown.
 */

#include <QtTest/QtTest>
#include <QSemaphore>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QThread>
#include <atomic>
#include "device/transportserializer.h"
#include "device/localdevicedriver.h"
#include "fakes/fakedevicedriver.h"

class TestTransportSerializer : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // ========== Connection Tests ==========
    void testNotConnectedErrors();
    void testConnectOpensOnWorkerThread();
    void testConnectReturnsCachedSession();
    void testConnectFailurePreservesError();
    void testDisconnectIdempotent();
    void testConnectionLostDropsSession();

    // ========== Serialization Tests ==========
    void testBatteryWaitsForDownload();
    void testConcurrentCallersNeverOverlap();

    // ========== Download Tests ==========
    void testDownloadToFile();
    void testDownloadCancelled();
    void testDownloadFailure();

    // ========== Keep-alive Tests ==========
    void testKeepAliveRunsOnWorker();

private:
    TransportSerializer *createTransport();

    QTemporaryDir *m_tempDir;
    QSharedPointer<FakeDeviceBackend> m_backend;
    FakeDeviceDriver *m_lastDriver;
};

void TestTransportSerializer::init()
{
    m_tempDir = new QTemporaryDir();
    QVERIFY(m_tempDir->isValid());
    m_backend.reset(new FakeDeviceBackend);
    m_lastDriver = nullptr;
}

void TestTransportSerializer::cleanup()
{
    delete m_tempDir;
    m_tempDir = nullptr;
    m_backend.reset();
}

TransportSerializer *TestTransportSerializer::createTransport()
{
    QSharedPointer<FakeDeviceBackend> backend = m_backend;
    return new TransportSerializer([this, backend]() -> DeviceDriver * {
        m_lastDriver = new FakeDeviceDriver(backend);
        return m_lastDriver;
    });
}

// ========== Connection Tests ==========

void TestTransportSerializer::testNotConnectedErrors()
{
    QScopedPointer<TransportSerializer> transport(createTransport());
    QVERIFY(!transport->isConnected());
    QVERIFY(!transport->session().isValid());

    const TransportResult<QList<RemoteFileEntry>> list = transport->listFiles();
    QCOMPARE(list.error, TransportError::NotConnected);
    QCOMPARE(list.errorMessage, QString("Device not connected"));

    QCOMPARE(transport->getBatteryStatus().error, TransportError::NotConnected);
    QCOMPARE(transport->getStorageInfo().error, TransportError::NotConnected);
    QCOMPARE(transport->deleteFile("x.hda").error, TransportError::NotConnected);

    const QString dest = QDir(m_tempDir->path()).filePath("x.hda");
    QCOMPARE(transport->downloadFile("x.hda", 10, dest).error, TransportError::NotConnected);
    QVERIFY(!QFile::exists(dest));

    // Nothing reached a driver
    QCOMPARE(m_backend->openCount(), 0);
    QVERIFY(m_backend->events().isEmpty());
}

void TestTransportSerializer::testConnectOpensOnWorkerThread()
{
    QScopedPointer<TransportSerializer> transport(createTransport());
    QSignalSpy connectedSpy(transport.data(), &TransportSerializer::connected);

    const TransportResult<DeviceSession> result = transport->connectDevice();
    QVERIFY(result.ok());
    QCOMPARE(result.value.serialNumber, QString("HD1-FAKE-0001"));
    QCOMPARE(result.value.model, DeviceModel::P1);

    QVERIFY(transport->isConnected());
    QCOMPARE(transport->session().serialNumber, QString("HD1-FAKE-0001"));
    QCOMPARE(m_backend->openThread(), transport->workerThread());
    QVERIFY(m_backend->openThread() != QThread::currentThread());
    QCOMPARE(m_lastDriver->thread(), transport->workerThread());
    QCOMPARE(connectedSpy.count(), 1);
}

void TestTransportSerializer::testConnectReturnsCachedSession()
{
    QScopedPointer<TransportSerializer> transport(createTransport());

    QVERIFY(transport->connectDevice().ok());
    QVERIFY(transport->connectDevice().ok());
    QCOMPARE(m_backend->openCount(), 1);
}

void TestTransportSerializer::testConnectFailurePreservesError()
{
    m_backend->failOpenCount = 1;
    m_backend->openError = "Device busy: claimed by another process";

    QScopedPointer<TransportSerializer> transport(createTransport());
    QSignalSpy errorSpy(transport.data(), &TransportSerializer::errorOccurred);

    const TransportResult<DeviceSession> result = transport->connectDevice();
    QCOMPARE(result.error, TransportError::NotConnected);
    QCOMPARE(result.errorMessage, QString("Device busy: claimed by another process"));
    QVERIFY(!transport->isConnected());
    QCOMPARE(errorSpy.count(), 1);

    // The next attempt gets a fresh driver
    QVERIFY(transport->connectDevice().ok());
    QCOMPARE(m_backend->openCount(), 2);
}

void TestTransportSerializer::testDisconnectIdempotent()
{
    QScopedPointer<TransportSerializer> transport(createTransport());
    QSignalSpy disconnectedSpy(transport.data(), &TransportSerializer::disconnected);

    transport->disconnectDevice();
    QCOMPARE(disconnectedSpy.count(), 0);

    QVERIFY(transport->connectDevice().ok());
    transport->disconnectDevice();
    transport->disconnectDevice();

    QCOMPARE(disconnectedSpy.count(), 1);
    QVERIFY(!transport->isConnected());
    QVERIFY(!transport->session().isValid());
    QCOMPARE(transport->listFiles().error, TransportError::NotConnected);
}

void TestTransportSerializer::testConnectionLostDropsSession()
{
    QScopedPointer<TransportSerializer> transport(createTransport());
    QVERIFY(transport->connectDevice().ok());

    FakeDeviceDriver *driver = m_lastDriver;
    QVERIFY(QMetaObject::invokeMethod(driver, [driver]() {
        driver->simulateConnectionLost();
    }, Qt::BlockingQueuedConnection));

    QTRY_VERIFY(!transport->isConnected());
    QCOMPARE(transport->getBatteryStatus().error, TransportError::NotConnected);
}

// ========== Serialization Tests ==========

void TestTransportSerializer::testBatteryWaitsForDownload()
{
    m_backend->addFile("long.hda", QByteArray(5000, 'a'));
    m_backend->chunkSize = 100;
    m_backend->chunkDelayMs = 2;

    QSemaphore downloadStarted;
    m_backend->onDownloadStarted = [&downloadStarted](const QString &) {
        downloadStarted.release();
    };

    QScopedPointer<TransportSerializer> transport(createTransport());
    QVERIFY(transport->connectDevice().ok());

    const QString dest = QDir(m_tempDir->path()).filePath("long.hda");
    TransportStatus downloadResult;
    QThread *downloader = QThread::create([&]() {
        downloadResult = transport->downloadFile("long.hda", 5000, dest);
    });
    downloader->start();

    QVERIFY(downloadStarted.tryAcquire(1, 5000));
    const TransportResult<BatteryStatus> battery = transport->getBatteryStatus();
    QVERIFY(battery.ok());
    QCOMPARE(battery.value.percentage, 80);

    QVERIFY(downloader->wait(5000));
    delete downloader;
    QVERIFY(downloadResult.ok());

    const QStringList expected = {
        "begin:download:long.hda", "end:download:long.hda",
        "begin:battery", "end:battery"
    };
    QCOMPARE(m_backend->events(), expected);
    QCOMPARE(m_backend->maxInFlight(), 1);
}

void TestTransportSerializer::testConcurrentCallersNeverOverlap()
{
    m_backend->addFile("a.hda", QByteArray(2000, 'a'));
    m_backend->chunkSize = 500;
    m_backend->chunkDelayMs = 1;

    QScopedPointer<TransportSerializer> transport(createTransport());
    QVERIFY(transport->connectDevice().ok());

    std::atomic<int> failures{0};
    QList<QThread *> callers;
    for (int i = 0; i < 4; ++i) {
        const QString dest = QDir(m_tempDir->path()).filePath(QString("a_%1.hda").arg(i));
        callers.append(QThread::create([&transport, &failures, dest]() {
            for (int n = 0; n < 3; ++n) {
                if (!transport->getStorageInfo().ok()) ++failures;
                if (!transport->listFiles().ok()) ++failures;
                if (!transport->downloadFile("a.hda", 2000, dest).ok()) ++failures;
            }
        }));
    }
    for (QThread *caller : callers) {
        caller->start();
    }
    for (QThread *caller : callers) {
        QVERIFY(caller->wait(10000));
    }
    qDeleteAll(callers);

    QCOMPARE(failures.load(), 0);
    QCOMPARE(m_backend->maxInFlight(), 1);
    QCOMPARE(m_backend->events().size(), 4 * 3 * 3 * 2);
}

// ========== Download Tests ==========

void TestTransportSerializer::testDownloadToFile()
{
    QByteArray data;
    for (int i = 0; i < 10000; ++i) {
        data.append(char('a' + i % 26));
    }
    m_backend->addFile("rec.hda", data);
    m_backend->chunkSize = 3000;

    QScopedPointer<TransportSerializer> transport(createTransport());
    QVERIFY(transport->connectDevice().ok());

    const QString dest = QDir(m_tempDir->path()).filePath("rec.hda");
    {
        // Pre-existing content is truncated
        QFile stale(dest);
        QVERIFY(stale.open(QIODevice::WriteOnly));
        stale.write(QByteArray(20000, 'z'));
    }

    QList<qint64> reported;
    const TransportStatus result = transport->downloadFile(
        "rec.hda", data.size(), dest,
        [&reported](qint64 done, qint64) { reported.append(done); });
    QVERIFY(result.ok());

    const QList<qint64> expected = {3000, 6000, 9000, 10000};
    QCOMPARE(reported, expected);

    QFile file(dest);
    QVERIFY(file.open(QIODevice::ReadOnly));
    QCOMPARE(file.readAll(), data);
}

void TestTransportSerializer::testDownloadCancelled()
{
    m_backend->addFile("rec.hda", QByteArray(10000, 'c'));
    m_backend->chunkSize = 1000;

    QScopedPointer<TransportSerializer> transport(createTransport());
    QVERIFY(transport->connectDevice().ok());

    int chunks = 0;
    const QString dest = QDir(m_tempDir->path()).filePath("rec.hda");
    const TransportStatus result = transport->downloadFile(
        "rec.hda", 10000, dest,
        [&chunks](qint64, qint64) { ++chunks; },
        [&chunks]() { return chunks >= 3; });

    QCOMPARE(result.error, TransportError::Cancelled);
    QCOMPARE(chunks, 3);

    // Partial output is left for the caller
    QCOMPARE(QFileInfo(dest).size(), qint64(3000));
}

void TestTransportSerializer::testDownloadFailure()
{
    QScopedPointer<TransportSerializer> transport(createTransport());
    QVERIFY(transport->connectDevice().ok());

    const TransportStatus result = transport->downloadFile(
        "missing.hda", 10, QDir(m_tempDir->path()).filePath("missing.hda"));
    QCOMPARE(result.error, TransportError::OperationFailed);
    QVERIFY(result.errorMessage.contains("missing.hda"));

    // Session survives a failed operation
    QVERIFY(transport->isConnected());
}

// ========== Keep-alive Tests ==========

void TestTransportSerializer::testKeepAliveRunsOnWorker()
{
    const QString devicePath = QDir(m_tempDir->path()).filePath("recorder");
    QVERIFY(QDir().mkpath(devicePath));

    std::atomic<int> ticks{0};
    std::atomic<bool> onWorker{true};
    QThread *mainThread = QThread::currentThread();

    TransportSerializer transport([&, devicePath]() -> DeviceDriver * {
        auto *driver = new LocalDeviceDriver(devicePath);
        driver->setKeepAliveInterval(20);
        QObject::connect(driver, &LocalDeviceDriver::keepAliveSent, driver, [&, mainThread]() {
            if (QThread::currentThread() == mainThread) {
                onWorker = false;
            }
            ++ticks;
        });
        return driver;
    });

    QVERIFY(transport.connectDevice().ok());
    QTRY_VERIFY(ticks.load() >= 3);
    QVERIFY(onWorker.load());

    transport.disconnectDevice();
}

QTEST_MAIN(TestTransportSerializer)
#include "test_transportserializer.moc"
