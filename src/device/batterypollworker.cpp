#include "batterypollworker.h"
#include "transportserializer.h"

#include <QDebug>
#include <QThread>

BatteryPollWorker::BatteryPollWorker(TransportSerializer *transport, QObject *parent)
    : QObject(parent)
    , m_transport(transport)
{
    m_timer = new QTimer(this);
    connect(m_timer, &QTimer::timeout, this, &BatteryPollWorker::poll);

    qDebug() << "[BatteryPollWorker] Created on thread:" << QThread::currentThread();
}

BatteryPollWorker::~BatteryPollWorker()
{
    stop();
    qDebug() << "[BatteryPollWorker] Destroyed";
}

void BatteryPollWorker::setInterval(int intervalMs)
{
    m_intervalMs = intervalMs;
    if (m_timer->isActive()) {
        m_timer->setInterval(intervalMs);
    }
}

void BatteryPollWorker::start()
{
    if (m_running.load()) {
        return;  // Already running
    }

    m_running = true;
    qDebug() << "[BatteryPollWorker] Started with interval:" << m_intervalMs << "ms";

    poll();
    if (m_running.load()) {
        m_timer->start(m_intervalMs);
    }
}

void BatteryPollWorker::stop()
{
    if (!m_running.load()) {
        return;  // Not running
    }

    m_running = false;
    m_timer->stop();
    qDebug() << "[BatteryPollWorker] Stopped";
}

void BatteryPollWorker::poll()
{
    if (!m_running.load()) {
        return;
    }

    const TransportResult<BatteryStatus> result = m_transport->getBatteryStatus();

    if (result.error == TransportError::NotConnected) {
        qWarning() << "[BatteryPollWorker] Transport not connected, halting";
        stop();
        emit pollingHalted(result.errorMessage);
        return;
    }

    if (!result.ok()) {
        qWarning() << "[BatteryPollWorker] Poll failed:" << result.errorMessage;
        emit pollFailed(result.errorMessage);
        return;
    }

    qDebug() << "[BatteryPollWorker] Battery" << result.value.percentage << "%"
             << batteryStateName(result.value.state);
    emit batteryUpdated(result.value);
}
