/**
 * @file test_connectionsupervisor.cpp
 * @brief Unit tests for ConnectionSupervisor
 *
 * Tests the bounded retry/verify sequence, failure classification,
 * hotplug reaction, manual retry and battery polling.
 */

#include <QtTest/QtTest>
#include <QElapsedTimer>
#include <QMutex>
#include <QSignalSpy>
#include "device/connectionsupervisor.h"
#include "device/hotplugmonitor.h"
#include "device/transportserializer.h"
#include "fakes/fakedevicedriver.h"

/**
 * @brief Hotplug source driven by the test
 */
class ScriptedHotplugMonitor : public HotplugMonitor
{
    Q_OBJECT

public:
    void start() override { m_running = true; }
    void stop() override { m_running = false; }
    bool isRunning() const override { return m_running; }

    void attach(quint64 deviceId, quint16 productId) { emit deviceAttached(deviceId, productId); }
    void detach(quint64 deviceId) { emit deviceDetached(deviceId); }

private:
    bool m_running = false;
};

/**
 * @brief Records requested backoff delays instead of sleeping
 */
class SleepRecorder
{
public:
    SleepFunction function()
    {
        return [this](int ms) {
            QMutexLocker locker(&m_mutex);
            m_delays.append(ms);
        };
    }

    QList<int> delays() const
    {
        QMutexLocker locker(&m_mutex);
        return m_delays;
    }

private:
    mutable QMutex m_mutex;
    QList<int> m_delays;
};

class TestConnectionSupervisor : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // ========== Retry Tests ==========
    void testRetryBoundAndBackoff();
    void testSucceedsAfterRetries();
    void testVerificationRetries();
    void testVerificationExhaustionCountsAsAttempt();
    void testBusyFailureReason();
    void testNewSequenceCancelsSleepingOne();

    // ========== Classification Tests ==========
    void testClassifyFailure_data();
    void testClassifyFailure();
    void testFailureMessage();
    void testStateToString();

    // ========== Hotplug Tests ==========
    void testAttachConnects();
    void testAttachWhileConnectedIsIgnored();
    void testDetachDisconnects();
    void testDetachOfOtherDeviceIgnored();
    void testUnknownModelTakesAttachedModel();
    void testSessionLossWhileAttachedReconnects();
    void testSessionLossWithoutDeviceDisconnects();

    // ========== Manual Retry Tests ==========
    void testManualRetryWithoutDevice();
    void testManualRetryWhenAttached();

    // ========== Battery Tests ==========
    void testBatteryPolling();
    void testBatteryPollingHaltsWhenTransportDrops();
    void testNoBatteryPollingWithoutBattery();

private:
    QSharedPointer<FakeDeviceBackend> m_backend;
    TransportSerializer *m_transport;
    ConnectionSupervisor *m_supervisor;
    SleepRecorder *m_sleeps;
};

void TestConnectionSupervisor::init()
{
    m_backend.reset(new FakeDeviceBackend);

    QSharedPointer<FakeDeviceBackend> backend = m_backend;
    m_transport = new TransportSerializer([backend]() -> DeviceDriver * {
        return new FakeDeviceDriver(backend);
    });

    m_sleeps = new SleepRecorder;
    m_supervisor = new ConnectionSupervisor(m_transport);
    m_supervisor->setSleepFunction(m_sleeps->function());
}

void TestConnectionSupervisor::cleanup()
{
    delete m_supervisor;
    delete m_transport;
    delete m_sleeps;
    m_supervisor = nullptr;
    m_transport = nullptr;
    m_sleeps = nullptr;
    m_backend.reset();
}

// ========== Retry Tests ==========

void TestConnectionSupervisor::testRetryBoundAndBackoff()
{
    m_backend->failOpenCount = 100;
    m_backend->openError = "Operation timed out";

    QSignalSpy stateSpy(m_supervisor, &ConnectionSupervisor::stateChanged);
    QSignalSpy errorSpy(m_supervisor, &ConnectionSupervisor::errorOccurred);

    m_supervisor->connectWithRetry();
    QTRY_COMPARE(m_supervisor->state().kind, ConnectionState::ConnectionFailed);

    QCOMPARE(m_backend->openCount(), 3);
    QCOMPARE(m_sleeps->delays(), QList<int>({1000, 2000}));
    QCOMPARE(m_supervisor->state().reason, ConnectionFailureReason::Timeout);
    QVERIFY(!m_supervisor->isRetrying());
    QCOMPARE(errorSpy.count(), 1);

    QList<ConnectionState> states;
    for (const QList<QVariant> &args : stateSpy) {
        states.append(args.at(0).value<ConnectionState>());
    }
    QCOMPARE(states.size(), 4);
    QCOMPARE(states[0], ConnectionState::connecting(1, 3));
    QCOMPARE(states[1], ConnectionState::connecting(2, 3));
    QCOMPARE(states[2], ConnectionState::connecting(3, 3));
    QCOMPARE(states[3].kind, ConnectionState::ConnectionFailed);
    QCOMPARE(states[1].toString(), QString("Connecting (attempt 2/3)"));
}

void TestConnectionSupervisor::testSucceedsAfterRetries()
{
    m_backend->failOpenCount = 2;

    QSignalSpy readySpy(m_supervisor, &ConnectionSupervisor::deviceReady);

    m_supervisor->connectWithRetry();
    QTRY_VERIFY(m_supervisor->isConnected());

    QCOMPARE(m_backend->openCount(), 3);
    QCOMPARE(m_sleeps->delays(), QList<int>({1000, 2000}));
    QCOMPARE(readySpy.count(), 1);
    QCOMPARE(m_supervisor->session().serialNumber, QString("HD1-FAKE-0001"));
    QVERIFY(m_supervisor->storageInfo().totalBytes > 0);
    QVERIFY(m_transport->isConnected());
}

void TestConnectionSupervisor::testVerificationRetries()
{
    m_backend->failStorageInfoCount = 2;

    m_supervisor->connectWithRetry();
    QTRY_VERIFY(m_supervisor->isConnected());

    QCOMPARE(m_backend->openCount(), 1);
    QCOMPARE(m_sleeps->delays(), QList<int>({500, 1000}));
}

void TestConnectionSupervisor::testVerificationExhaustionCountsAsAttempt()
{
    m_backend->failStorageInfoCount = 3;

    m_supervisor->connectWithRetry();
    QTRY_VERIFY(m_supervisor->isConnected());

    // Attempt 1: three failed verifications; attempt 2 reopens and verifies
    QCOMPARE(m_backend->openCount(), 2);
    QCOMPARE(m_sleeps->delays(), QList<int>({500, 1000, 1000}));
}

void TestConnectionSupervisor::testBusyFailureReason()
{
    m_backend->failOpenCount = 100;
    m_backend->openError = "Device busy: another host holds the interface";

    m_supervisor->connectWithRetry();
    QTRY_COMPARE(m_supervisor->state().kind, ConnectionState::ConnectionFailed);

    QCOMPARE(m_supervisor->state().reason, ConnectionFailureReason::DeviceBusy);
    QVERIFY(m_supervisor->state().message.contains("in use"));
}

void TestConnectionSupervisor::testNewSequenceCancelsSleepingOne()
{
    // Real interruptible sleep with a long backoff
    m_supervisor->setSleepFunction(nullptr);
    RetryPolicy policy;
    policy.connectBackoffMs = {60000};
    m_supervisor->setRetryPolicy(policy);

    m_backend->failOpenCount = 1;

    QElapsedTimer timer;
    timer.start();

    m_supervisor->connectWithRetry();
    QTRY_COMPARE(m_backend->openCount(), 1);

    // First sequence is now waiting out its 60 s backoff
    m_supervisor->connectWithRetry();
    QTRY_VERIFY(m_supervisor->isConnected());

    QVERIFY(timer.elapsed() < 10000);
    QCOMPARE(m_backend->openCount(), 2);
}

// ========== Classification Tests ==========

void TestConnectionSupervisor::testClassifyFailure_data()
{
    QTest::addColumn<QString>("error");
    QTest::addColumn<int>("reason");

    QTest::newRow("timeout") << "USB TIMEOUT on endpoint 1" << int(ConnectionFailureReason::Timeout);
    QTest::newRow("timed out") << "Operation timed out" << int(ConnectionFailureReason::Timeout);
    QTest::newRow("busy") << "Resource busy" << int(ConnectionFailureReason::DeviceBusy);
    QTest::newRow("other") << "Pipe error" << int(ConnectionFailureReason::CommunicationError);
    QTest::newRow("empty") << "" << int(ConnectionFailureReason::CommunicationError);
}

void TestConnectionSupervisor::testClassifyFailure()
{
    QFETCH(QString, error);
    QFETCH(int, reason);

    QCOMPARE(int(ConnectionSupervisor::classifyFailure(error)), reason);
}

void TestConnectionSupervisor::testFailureMessage()
{
    const QString message = ConnectionSupervisor::failureMessage(
        ConnectionFailureReason::CommunicationError, "Pipe error");
    QVERIFY(message.contains("Pipe error"));

    QVERIFY(!ConnectionSupervisor::failureMessage(ConnectionFailureReason::Timeout, "x").isEmpty());
}

void TestConnectionSupervisor::testStateToString()
{
    QCOMPARE(ConnectionState::disconnected().toString(), QString("Disconnected"));
    QCOMPARE(ConnectionState::connected().toString(), QString("Connected"));
    QCOMPARE(ConnectionState::failed(ConnectionFailureReason::Timeout, "late").toString(),
             QString("Connection failed: late"));
}

// ========== Hotplug Tests ==========

void TestConnectionSupervisor::testAttachConnects()
{
    ScriptedHotplugMonitor monitor;
    m_supervisor->setHotplugMonitor(&monitor);

    monitor.attach(42, 8257);
    QVERIFY(m_supervisor->isDeviceAttached());
    QCOMPARE(m_supervisor->attachedDeviceId(), quint64(42));
    QCOMPARE(m_supervisor->attachedModel(), DeviceModel::P1Mini);

    QTRY_VERIFY(m_supervisor->isConnected());
}

void TestConnectionSupervisor::testAttachWhileConnectedIsIgnored()
{
    ScriptedHotplugMonitor monitor;
    m_supervisor->setHotplugMonitor(&monitor);

    monitor.attach(42, 8256);
    QTRY_VERIFY(m_supervisor->isConnected());

    monitor.attach(42, 8256);
    QVERIFY(!m_supervisor->isRetrying());
    QCOMPARE(m_backend->openCount(), 1);
}

void TestConnectionSupervisor::testDetachDisconnects()
{
    ScriptedHotplugMonitor monitor;
    m_supervisor->setHotplugMonitor(&monitor);
    m_supervisor->setBatteryPollInterval(50);

    monitor.attach(42, 8256);
    QTRY_VERIFY(m_supervisor->isConnected());
    QVERIFY(m_supervisor->isBatteryPolling());

    monitor.detach(42);

    QCOMPARE(m_supervisor->state().kind, ConnectionState::Disconnected);
    QVERIFY(!m_supervisor->isDeviceAttached());
    QVERIFY(!m_supervisor->isBatteryPolling());
    QVERIFY(!m_supervisor->session().isValid());
    QVERIFY(!m_transport->isConnected());
}

void TestConnectionSupervisor::testDetachOfOtherDeviceIgnored()
{
    ScriptedHotplugMonitor monitor;
    m_supervisor->setHotplugMonitor(&monitor);

    monitor.attach(42, 8256);
    QTRY_VERIFY(m_supervisor->isConnected());

    monitor.detach(7);
    QVERIFY(m_supervisor->isConnected());
    QVERIFY(m_supervisor->isDeviceAttached());
}

void TestConnectionSupervisor::testUnknownModelTakesAttachedModel()
{
    m_backend->session.model = DeviceModel::Unknown;
    m_backend->session.supportsBattery = false;
    m_supervisor->setBatteryPollInterval(50);

    ScriptedHotplugMonitor monitor;
    m_supervisor->setHotplugMonitor(&monitor);

    monitor.attach(42, 8256);
    QTRY_VERIFY(m_supervisor->isConnected());

    QCOMPARE(m_supervisor->session().model, DeviceModel::P1);
    QVERIFY(m_supervisor->session().supportsBattery);
    QVERIFY(m_supervisor->isBatteryPolling());
}

void TestConnectionSupervisor::testSessionLossWhileAttachedReconnects()
{
    ScriptedHotplugMonitor monitor;
    m_supervisor->setHotplugMonitor(&monitor);

    monitor.attach(42, 8256);
    QTRY_VERIFY(m_supervisor->isConnected());
    QCOMPARE(m_backend->openCount(), 1);

    QSignalSpy stateSpy(m_supervisor, &ConnectionSupervisor::stateChanged);

    // Device stays plugged in, the link drops
    m_transport->disconnectDevice();

    QTRY_COMPARE(m_backend->openCount(), 2);
    QTRY_VERIFY(m_supervisor->isConnected());
    QVERIFY(m_transport->isConnected());

    QVERIFY(stateSpy.count() >= 3);
    QCOMPARE(stateSpy.at(0).at(0).value<ConnectionState>().kind, ConnectionState::Disconnected);
    QCOMPARE(stateSpy.at(1).at(0).value<ConnectionState>().kind, ConnectionState::Connecting);
}

void TestConnectionSupervisor::testSessionLossWithoutDeviceDisconnects()
{
    m_supervisor->connectWithRetry();
    QTRY_VERIFY(m_supervisor->isConnected());

    m_transport->disconnectDevice();

    QTRY_COMPARE(m_supervisor->state().kind, ConnectionState::Disconnected);
    QVERIFY(!m_supervisor->session().isValid());
    QVERIFY(!m_supervisor->isRetrying());
    QCOMPARE(m_backend->openCount(), 1);
}

// ========== Manual Retry Tests ==========

void TestConnectionSupervisor::testManualRetryWithoutDevice()
{
    QSignalSpy logSpy(m_supervisor, &ConnectionSupervisor::logMessage);

    m_supervisor->retryConnection();

    QCOMPARE(m_supervisor->state().kind, ConnectionState::Disconnected);
    QVERIFY(!m_supervisor->isRetrying());
    QCOMPARE(m_backend->openCount(), 0);
    QCOMPARE(logSpy.count(), 1);
    QVERIFY(logSpy.at(0).at(0).toString().contains("Retry ignored"));
}

void TestConnectionSupervisor::testManualRetryWhenAttached()
{
    m_backend->failOpenCount = 3;

    ScriptedHotplugMonitor monitor;
    m_supervisor->setHotplugMonitor(&monitor);

    monitor.attach(42, 45068);
    QTRY_COMPARE(m_supervisor->state().kind, ConnectionState::ConnectionFailed);

    m_supervisor->retryConnection();
    QTRY_VERIFY(m_supervisor->isConnected());
    QCOMPARE(m_backend->openCount(), 4);
}

// ========== Battery Tests ==========

void TestConnectionSupervisor::testBatteryPolling()
{
    m_supervisor->setBatteryPollInterval(50);
    QSignalSpy batterySpy(m_supervisor, &ConnectionSupervisor::batteryStatusChanged);

    m_supervisor->connectWithRetry();
    QTRY_VERIFY(m_supervisor->isConnected());
    QVERIFY(m_supervisor->isBatteryPolling());

    QTRY_VERIFY(batterySpy.count() >= 2);
    QVERIFY(m_supervisor->hasBatteryStatus());
    QCOMPARE(m_supervisor->batteryStatus().percentage, 80);
    QCOMPARE(m_supervisor->batteryStatus().state, BatteryState::Discharging);
}

void TestConnectionSupervisor::testBatteryPollingHaltsWhenTransportDrops()
{
    m_supervisor->setBatteryPollInterval(50);

    m_supervisor->connectWithRetry();
    QTRY_VERIFY(m_supervisor->isConnected());
    QVERIFY(m_supervisor->isBatteryPolling());

    // Session vanishes underneath the supervisor
    m_transport->disconnectDevice();

    QTRY_VERIFY(!m_supervisor->isBatteryPolling());
}

void TestConnectionSupervisor::testNoBatteryPollingWithoutBattery()
{
    m_backend->session.model = DeviceModel::H1;
    m_backend->session.supportsBattery = false;
    m_supervisor->setBatteryPollInterval(20);

    m_supervisor->connectWithRetry();
    QTRY_VERIFY(m_supervisor->isConnected());

    QTest::qWait(100);
    QVERIFY(!m_supervisor->isBatteryPolling());
    QVERIFY(!m_backend->events().contains("begin:battery"));
}

QTEST_MAIN(TestConnectionSupervisor)
#include "test_connectionsupervisor.moc"
