#ifndef CONNECTIONSUPERVISOR_H
#define CONNECTIONSUPERVISOR_H

#include <QObject>
#include <QList>
#include <QMutex>
#include <QThread>
#include <QWaitCondition>
#include <functional>

#include "devicetypes.h"

class TransportSerializer;
class BatteryPollWorker;
class HotplugMonitor;

/**
 * @brief Why the last connection sequence gave up
 */
enum class ConnectionFailureReason {
    None,
    Timeout,
    DeviceBusy,
    CommunicationError
};

/**
 * @brief Observable connection state of the supervisor
 */
struct ConnectionState {
    enum Kind {
        Disconnected,
        Connecting,         // attempt/maxAttempts are set
        Connected,
        ConnectionFailed    // reason/message are set
    };

    Kind kind = Disconnected;
    int attempt = 0;
    int maxAttempts = 0;
    ConnectionFailureReason reason = ConnectionFailureReason::None;
    QString message;

    static ConnectionState disconnected();
    static ConnectionState connecting(int attempt, int maxAttempts);
    static ConnectionState connected();
    static ConnectionState failed(ConnectionFailureReason reason, const QString &message);

    QString toString() const;

    bool operator==(const ConnectionState &other) const;
    bool operator!=(const ConnectionState &other) const { return !(*this == other); }
};

/**
 * @brief Attempt counts and backoff schedules for connecting
 *
 * Backoff lists are indexed by the number of the attempt that just failed;
 * the last entry repeats when the list is shorter than the attempt count.
 */
struct RetryPolicy {
    int maxAttempts = 3;
    QList<int> connectBackoffMs = {1000, 2000, 4000};
    int verifyAttempts = 3;
    QList<int> verifyBackoffMs = {500, 1000, 2000};

    static int delayAfter(const QList<int> &schedule, int failedAttempt);
};

/// Replaces the interruptible wait between attempts; receives the delay in ms
using SleepFunction = std::function<void(int)>;

/**
 * @brief Runs one connect/verify retry sequence off the main thread
 *
 * Each attempt is TransportSerializer::connectDevice() followed by a
 * storage query that proves the link actually answers. Only a verified
 * connection is reported as established; verification exhaustion counts
 * as a failed attempt.
 */
class ConnectionWorker : public QObject
{
    Q_OBJECT

public:
    ConnectionWorker(TransportSerializer *transport, const RetryPolicy &policy,
                     const SleepFunction &sleeper = nullptr, QObject *parent = nullptr);
    ~ConnectionWorker() override;

    /**
     * @brief Abort the sequence at the next boundary
     *
     * Thread-safe. Wakes a pending backoff wait immediately.
     */
    void requestCancel();

public slots:
    void doConnect();

signals:
    void attemptStarted(int attempt, int maxAttempts);
    void connectionEstablished(const DeviceSession &session, const StorageInfo &storage);
    void connectionFailed(const QString &error);
    void cancelled();
    void logMessage(const QString &message);

private:
    bool isCancelled() const;

    /**
     * @brief Wait between attempts; false when cancelled
     */
    bool sleepFor(int ms);

    bool verifyConnection(StorageInfo &storage, QString &error);

    TransportSerializer *m_transport;
    RetryPolicy m_policy;
    SleepFunction m_sleeper;

    mutable QMutex m_mutex;
    QWaitCondition m_wake;
    bool m_cancelRequested = false;
};

/**
 * @brief Connection lifecycle for the recorder
 *
 * Owns the retrying connect state machine, reacts to hotplug events and
 * runs background battery polling for models that report a battery.
 *
 * Lives on the main thread. The retry sequence runs in a ConnectionWorker
 * on a short-lived thread; battery polling runs in a BatteryPollWorker on
 * another. Both reach the device only through the TransportSerializer.
 */
class ConnectionSupervisor : public QObject
{
    Q_OBJECT

public:
    explicit ConnectionSupervisor(TransportSerializer *transport, QObject *parent = nullptr);
    ~ConnectionSupervisor() override;

    // ========== Configuration ==========

    void setRetryPolicy(const RetryPolicy &policy) { m_policy = policy; }
    RetryPolicy retryPolicy() const { return m_policy; }

    /**
     * @brief Replace the backoff wait (tests record delays instead of sleeping)
     */
    void setSleepFunction(const SleepFunction &sleeper) { m_sleeper = sleeper; }

    void setBatteryPollInterval(int intervalMs) { m_batteryIntervalMs = intervalMs; }

    /**
     * @brief Follow attach/detach events from @p monitor
     */
    void setHotplugMonitor(HotplugMonitor *monitor);

    // ========== State ==========

    ConnectionState state() const { return m_state; }
    bool isConnected() const { return m_state.kind == ConnectionState::Connected; }

    /**
     * @brief Cached identity, invalid unless connected
     */
    DeviceSession session() const { return m_session; }
    StorageInfo storageInfo() const { return m_storage; }
    BatteryStatus batteryStatus() const { return m_battery; }
    bool hasBatteryStatus() const { return m_hasBattery; }

    bool isDeviceAttached() const { return m_deviceAttached; }
    quint64 attachedDeviceId() const { return m_attachedDeviceId; }
    DeviceModel attachedModel() const { return m_attachedModel; }

    bool isRetrying() const { return m_retryThread != nullptr; }
    bool isBatteryPolling() const { return m_batteryPolling; }

    // ========== Failure Classification ==========

    static ConnectionFailureReason classifyFailure(const QString &errorText);
    static QString failureMessage(ConnectionFailureReason reason, const QString &detail);

public slots:
    /**
     * @brief Start a bounded connect/verify sequence
     *
     * Cancels and waits for any sequence already running.
     */
    void connectWithRetry();

    /**
     * @brief Tear down everything and go to Disconnected
     */
    void disconnectDevice();

    /**
     * @brief User-initiated retry, only while the device is attached
     */
    void retryConnection();

    void onDeviceAttached(quint64 deviceId, quint16 productId);
    void onDeviceDetached(quint64 deviceId);

signals:
    void stateChanged(const ConnectionState &state);
    void deviceReady(const DeviceSession &session);
    void batteryStatusChanged(const BatteryStatus &status);
    void logMessage(const QString &message);
    void errorOccurred(const QString &error);

private:
    void onAttemptStarted(int attempt, int maxAttempts);
    void onConnectionEstablished(const DeviceSession &session, const StorageInfo &storage);
    void onConnectionFailed(const QString &error);
    void onTransportDisconnected();

    void stopRetry();
    void startBatteryPolling();
    void stopBatteryPolling();
    void setState(const ConnectionState &state);

    TransportSerializer *m_transport;
    RetryPolicy m_policy;
    SleepFunction m_sleeper;
    int m_batteryIntervalMs = 30000;

    ConnectionState m_state;
    DeviceSession m_session;
    StorageInfo m_storage;
    BatteryStatus m_battery;
    bool m_hasBattery = false;

    bool m_deviceAttached = false;
    quint64 m_attachedDeviceId = 0;
    DeviceModel m_attachedModel = DeviceModel::Unknown;

    // Retry sequence
    QThread *m_retryThread = nullptr;
    ConnectionWorker *m_retryWorker = nullptr;
    int m_retryGeneration = 0;

    // Battery polling
    QThread *m_batteryThread = nullptr;
    BatteryPollWorker *m_batteryWorker = nullptr;
    int m_batteryGeneration = 0;
    bool m_batteryPolling = false;
};

Q_DECLARE_METATYPE(ConnectionState)

#endif // CONNECTIONSUPERVISOR_H
