#include "connectionsupervisor.h"
#include "transportserializer.h"
#include "batterypollworker.h"
#include "hotplugmonitor.h"

#include <QDeadlineTimer>
#include <QDebug>
#include <QMutexLocker>

// ========== ConnectionState ==========

ConnectionState ConnectionState::disconnected()
{
    return ConnectionState();
}

ConnectionState ConnectionState::connecting(int attempt, int maxAttempts)
{
    ConnectionState s;
    s.kind = Connecting;
    s.attempt = attempt;
    s.maxAttempts = maxAttempts;
    return s;
}

ConnectionState ConnectionState::connected()
{
    ConnectionState s;
    s.kind = Connected;
    return s;
}

ConnectionState ConnectionState::failed(ConnectionFailureReason reason, const QString &message)
{
    ConnectionState s;
    s.kind = ConnectionFailed;
    s.reason = reason;
    s.message = message;
    return s;
}

QString ConnectionState::toString() const
{
    switch (kind) {
    case Disconnected:
        return "Disconnected";
    case Connecting:
        return QString("Connecting (attempt %1/%2)").arg(attempt).arg(maxAttempts);
    case Connected:
        return "Connected";
    case ConnectionFailed:
        return QString("Connection failed: %1").arg(message);
    }
    return QString();
}

bool ConnectionState::operator==(const ConnectionState &other) const
{
    return kind == other.kind
        && attempt == other.attempt
        && maxAttempts == other.maxAttempts
        && reason == other.reason
        && message == other.message;
}

int RetryPolicy::delayAfter(const QList<int> &schedule, int failedAttempt)
{
    if (schedule.isEmpty() || failedAttempt < 1) {
        return 0;
    }
    return schedule.at(qMin(failedAttempt - 1, schedule.size() - 1));
}

// ========== ConnectionWorker ==========

ConnectionWorker::ConnectionWorker(TransportSerializer *transport, const RetryPolicy &policy,
                                   const SleepFunction &sleeper, QObject *parent)
    : QObject(parent)
    , m_transport(transport)
    , m_policy(policy)
    , m_sleeper(sleeper)
{
}

ConnectionWorker::~ConnectionWorker()
{
    qDebug() << "[ConnectionWorker] Destroyed";
}

void ConnectionWorker::requestCancel()
{
    QMutexLocker locker(&m_mutex);
    m_cancelRequested = true;
    m_wake.wakeAll();
}

bool ConnectionWorker::isCancelled() const
{
    QMutexLocker locker(&m_mutex);
    return m_cancelRequested;
}

bool ConnectionWorker::sleepFor(int ms)
{
    if (ms <= 0) {
        return !isCancelled();
    }

    if (m_sleeper) {
        m_sleeper(ms);
        return !isCancelled();
    }

    QMutexLocker locker(&m_mutex);
    QDeadlineTimer deadline(ms);
    while (!m_cancelRequested && !deadline.hasExpired()) {
        m_wake.wait(&m_mutex, deadline);
    }
    return !m_cancelRequested;
}

bool ConnectionWorker::verifyConnection(StorageInfo &storage, QString &error)
{
    for (int attempt = 1; attempt <= m_policy.verifyAttempts; ++attempt) {
        const TransportResult<StorageInfo> result = m_transport->getStorageInfo();
        if (result.ok()) {
            storage = result.value;
            return true;
        }

        error = result.errorMessage;
        qDebug() << "[ConnectionWorker] Verification" << attempt << "/" << m_policy.verifyAttempts
                 << "failed:" << error;

        if (result.error == TransportError::NotConnected) {
            return false;  // Session already gone, no point asking again
        }

        if (attempt < m_policy.verifyAttempts
            && !sleepFor(RetryPolicy::delayAfter(m_policy.verifyBackoffMs, attempt))) {
            return false;
        }
    }
    return false;
}

void ConnectionWorker::doConnect()
{
    qDebug() << "[ConnectionWorker] doConnect() on thread:" << QThread::currentThread();

    QString lastError = "Device not connected";

    for (int attempt = 1; attempt <= m_policy.maxAttempts; ++attempt) {
        if (isCancelled()) {
            emit cancelled();
            return;
        }

        emit attemptStarted(attempt, m_policy.maxAttempts);
        emit logMessage(QString("Connecting to recorder (attempt %1/%2)...")
                            .arg(attempt).arg(m_policy.maxAttempts));

        const TransportResult<DeviceSession> result = m_transport->connectDevice();
        if (result.ok()) {
            StorageInfo storage;
            QString verifyError;
            if (verifyConnection(storage, verifyError)) {
                emit connectionEstablished(result.value, storage);
                return;
            }
            lastError = verifyError.isEmpty() ? QString("Connection verification failed") : verifyError;
            m_transport->disconnectDevice();
        } else {
            lastError = result.errorMessage;
        }

        qWarning() << "[ConnectionWorker] Attempt" << attempt << "failed:" << lastError;

        if (isCancelled()) {
            emit cancelled();
            return;
        }

        if (attempt < m_policy.maxAttempts
            && !sleepFor(RetryPolicy::delayAfter(m_policy.connectBackoffMs, attempt))) {
            emit cancelled();
            return;
        }
    }

    emit connectionFailed(lastError);
}

// ========== ConnectionSupervisor ==========

ConnectionSupervisor::ConnectionSupervisor(TransportSerializer *transport, QObject *parent)
    : QObject(parent)
    , m_transport(transport)
{
    qRegisterMetaType<DeviceSession>();
    qRegisterMetaType<StorageInfo>();
    qRegisterMetaType<BatteryStatus>();
    qRegisterMetaType<ConnectionState>();

    connect(m_transport, &TransportSerializer::disconnected,
            this, &ConnectionSupervisor::onTransportDisconnected);
}

ConnectionSupervisor::~ConnectionSupervisor()
{
    stopRetry();
    stopBatteryPolling();
    qDebug() << "[ConnectionSupervisor] Destroyed";
}

void ConnectionSupervisor::setHotplugMonitor(HotplugMonitor *monitor)
{
    connect(monitor, &HotplugMonitor::deviceAttached,
            this, &ConnectionSupervisor::onDeviceAttached);
    connect(monitor, &HotplugMonitor::deviceDetached,
            this, &ConnectionSupervisor::onDeviceDetached);
}

void ConnectionSupervisor::setState(const ConnectionState &state)
{
    if (m_state == state) {
        return;
    }

    m_state = state;
    qDebug() << "[ConnectionSupervisor] State:" << state.toString();
    emit stateChanged(m_state);
    emit logMessage(state.toString());
}

// ========== Failure Classification ==========

ConnectionFailureReason ConnectionSupervisor::classifyFailure(const QString &errorText)
{
    const QString text = errorText.toLower();
    if (text.contains("timeout") || text.contains("timed out")) {
        return ConnectionFailureReason::Timeout;
    }
    if (text.contains("busy")) {
        return ConnectionFailureReason::DeviceBusy;
    }
    return ConnectionFailureReason::CommunicationError;
}

QString ConnectionSupervisor::failureMessage(ConnectionFailureReason reason, const QString &detail)
{
    switch (reason) {
    case ConnectionFailureReason::Timeout:
        return "The recorder did not respond in time. Reconnect the USB cable and try again.";
    case ConnectionFailureReason::DeviceBusy:
        return "The recorder is in use by another application. Close it and try again.";
    case ConnectionFailureReason::CommunicationError:
        return QString("Could not communicate with the recorder: %1").arg(detail);
    case ConnectionFailureReason::None:
        break;
    }
    return detail;
}

// ========== Connection ==========

void ConnectionSupervisor::connectWithRetry()
{
    stopRetry();

    if (m_state.kind == ConnectionState::Connected && m_transport->isConnected()) {
        qDebug() << "[ConnectionSupervisor] Already connected";
        return;
    }

    setState(ConnectionState::connecting(1, m_policy.maxAttempts));

    m_retryThread = new QThread(this);
    m_retryWorker = new ConnectionWorker(m_transport, m_policy, m_sleeper);
    m_retryWorker->moveToThread(m_retryThread);

    // Results of a superseded sequence may still be queued; drop them
    const int generation = ++m_retryGeneration;

    connect(m_retryThread, &QThread::started, m_retryWorker, &ConnectionWorker::doConnect);
    connect(m_retryThread, &QThread::finished, m_retryWorker, &QObject::deleteLater);

    connect(m_retryWorker, &ConnectionWorker::attemptStarted, this,
            [this, generation](int attempt, int maxAttempts) {
                if (generation == m_retryGeneration) {
                    onAttemptStarted(attempt, maxAttempts);
                }
            });
    connect(m_retryWorker, &ConnectionWorker::connectionEstablished, this,
            [this, generation](const DeviceSession &session, const StorageInfo &storage) {
                if (generation == m_retryGeneration) {
                    onConnectionEstablished(session, storage);
                }
            });
    connect(m_retryWorker, &ConnectionWorker::connectionFailed, this,
            [this, generation](const QString &error) {
                if (generation == m_retryGeneration) {
                    onConnectionFailed(error);
                }
            });
    connect(m_retryWorker, &ConnectionWorker::cancelled, this,
            [this, generation]() {
                if (generation == m_retryGeneration) {
                    stopRetry();
                }
            });
    connect(m_retryWorker, &ConnectionWorker::logMessage,
            this, &ConnectionSupervisor::logMessage);

    m_retryThread->start();
}

void ConnectionSupervisor::stopRetry()
{
    if (m_retryWorker) {
        m_retryWorker->requestCancel();
    }

    if (m_retryThread) {
        m_retryThread->quit();
        if (!m_retryThread->wait(5000)) {
            qWarning() << "[ConnectionSupervisor] Retry thread slow to stop, still waiting";
            m_retryThread->wait();
        }
        delete m_retryThread;
        m_retryThread = nullptr;
    }

    // Worker is deleted by thread's finished signal via deleteLater
    m_retryWorker = nullptr;
    ++m_retryGeneration;
}

void ConnectionSupervisor::onAttemptStarted(int attempt, int maxAttempts)
{
    setState(ConnectionState::connecting(attempt, maxAttempts));
}

void ConnectionSupervisor::onConnectionEstablished(const DeviceSession &session,
                                                   const StorageInfo &storage)
{
    stopRetry();

    m_session = session;
    if (m_session.model == DeviceModel::Unknown && m_attachedModel != DeviceModel::Unknown) {
        m_session.model = m_attachedModel;
        m_session.supportsBattery = deviceModelSupportsBattery(m_attachedModel);
    }
    m_storage = storage;

    setState(ConnectionState::connected());
    emit deviceReady(m_session);

    if (m_session.supportsBattery) {
        startBatteryPolling();
    }
}

void ConnectionSupervisor::onConnectionFailed(const QString &error)
{
    stopRetry();

    const ConnectionFailureReason reason = classifyFailure(error);
    const QString message = failureMessage(reason, error);

    setState(ConnectionState::failed(reason, message));
    emit errorOccurred(message);
}

void ConnectionSupervisor::onTransportDisconnected()
{
    // Our own teardown and failed verifications arrive here too
    if (m_state.kind != ConnectionState::Connected) {
        return;
    }

    qWarning() << "[ConnectionSupervisor] Transport lost the session";
    emit logMessage("Connection to the recorder was lost");

    stopBatteryPolling();
    m_session = DeviceSession();
    m_storage = StorageInfo();
    m_battery = BatteryStatus();
    m_hasBattery = false;
    setState(ConnectionState::disconnected());

    if (m_deviceAttached) {
        connectWithRetry();
    }
}

void ConnectionSupervisor::disconnectDevice()
{
    stopRetry();
    stopBatteryPolling();
    m_transport->disconnectDevice();

    m_session = DeviceSession();
    m_storage = StorageInfo();
    m_battery = BatteryStatus();
    m_hasBattery = false;

    setState(ConnectionState::disconnected());
}

void ConnectionSupervisor::retryConnection()
{
    if (!m_deviceAttached) {
        qWarning() << "[ConnectionSupervisor] Retry ignored: no recorder attached";
        emit logMessage("Retry ignored: no recorder attached");
        return;
    }

    connectWithRetry();
}

// ========== Hotplug ==========

void ConnectionSupervisor::onDeviceAttached(quint64 deviceId, quint16 productId)
{
    m_deviceAttached = true;
    m_attachedDeviceId = deviceId;
    m_attachedModel = deviceModelForProductId(productId);

    qDebug() << "[ConnectionSupervisor] Device attached:" << deviceId
             << "product" << productId << deviceModelName(m_attachedModel);
    emit logMessage(QString("Recorder attached (%1)").arg(deviceModelName(m_attachedModel)));

    if (m_state.kind == ConnectionState::Connected || m_state.kind == ConnectionState::Connecting) {
        return;
    }
    connectWithRetry();
}

void ConnectionSupervisor::onDeviceDetached(quint64 deviceId)
{
    if (m_deviceAttached && deviceId != m_attachedDeviceId) {
        qDebug() << "[ConnectionSupervisor] Ignoring detach of unknown device" << deviceId;
        return;
    }

    qDebug() << "[ConnectionSupervisor] Device detached:" << deviceId;
    emit logMessage("Recorder detached");

    m_deviceAttached = false;
    m_attachedDeviceId = 0;
    m_attachedModel = DeviceModel::Unknown;

    disconnectDevice();
}

// ========== Battery Polling ==========

void ConnectionSupervisor::startBatteryPolling()
{
    stopBatteryPolling();

    m_batteryThread = new QThread(this);
    m_batteryWorker = new BatteryPollWorker(m_transport);
    m_batteryWorker->setInterval(m_batteryIntervalMs);
    m_batteryWorker->moveToThread(m_batteryThread);

    const int generation = ++m_batteryGeneration;

    connect(m_batteryThread, &QThread::started, m_batteryWorker, &BatteryPollWorker::start);
    connect(m_batteryThread, &QThread::finished, m_batteryWorker, &QObject::deleteLater);

    connect(m_batteryWorker, &BatteryPollWorker::batteryUpdated, this,
            [this, generation](const BatteryStatus &status) {
                if (generation != m_batteryGeneration) {
                    return;
                }
                m_battery = status;
                m_hasBattery = true;
                emit batteryStatusChanged(status);
            });
    connect(m_batteryWorker, &BatteryPollWorker::pollingHalted, this,
            [this, generation](const QString &reason) {
                if (generation != m_batteryGeneration) {
                    return;
                }
                qDebug() << "[ConnectionSupervisor] Battery polling halted:" << reason;
                m_batteryPolling = false;
            });

    m_batteryPolling = true;
    m_batteryThread->start();
    qDebug() << "[ConnectionSupervisor] Battery polling every" << m_batteryIntervalMs << "ms";
}

void ConnectionSupervisor::stopBatteryPolling()
{
    if (m_batteryWorker) {
        QMetaObject::invokeMethod(m_batteryWorker, "stop", Qt::QueuedConnection);
    }

    if (m_batteryThread) {
        m_batteryThread->quit();
        if (!m_batteryThread->wait(5000)) {
            qWarning() << "[ConnectionSupervisor] Battery thread slow to stop, still waiting";
            m_batteryThread->wait();
        }
        delete m_batteryThread;
        m_batteryThread = nullptr;
    }

    m_batteryWorker = nullptr;
    m_batteryPolling = false;
    ++m_batteryGeneration;
}
