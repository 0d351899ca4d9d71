#ifndef BATTERYPOLLWORKER_H
#define BATTERYPOLLWORKER_H

#include <QObject>
#include <QTimer>
#include <atomic>

#include "devicetypes.h"

class TransportSerializer;

/**
 * @brief Periodic battery telemetry for portable recorders
 *
 * Runs on its own thread and is controlled by ConnectionSupervisor. Every
 * query goes through the TransportSerializer, so a poll that lands during
 * a download simply waits its turn instead of interleaving with it.
 *
 * Polls once immediately on start(), then every interval (30 seconds by
 * default). A NotConnected result halts polling; any other failure is
 * reported and polling continues.
 */
class BatteryPollWorker : public QObject
{
    Q_OBJECT

public:
    explicit BatteryPollWorker(TransportSerializer *transport, QObject *parent = nullptr);
    ~BatteryPollWorker() override;

    /**
     * @brief Set the poll interval in milliseconds
     */
    void setInterval(int intervalMs);

    bool isRunning() const { return m_running.load(); }

public slots:
    void start();
    void stop();

signals:
    void batteryUpdated(const BatteryStatus &status);
    void pollFailed(const QString &error);

    /**
     * @brief Polling stopped because the transport has no session
     */
    void pollingHalted(const QString &reason);

private slots:
    void poll();

private:
    TransportSerializer *m_transport;
    QTimer *m_timer = nullptr;
    int m_intervalMs = 30000;
    std::atomic<bool> m_running{false};
};

#endif // BATTERYPOLLWORKER_H
