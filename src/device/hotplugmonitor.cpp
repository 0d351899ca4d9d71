#include "hotplugmonitor.h"
#include "localdevicedriver.h"

#include <QDebug>
#include <QFileInfo>
#include <QTimer>

HotplugMonitor::HotplugMonitor(QObject *parent)
    : QObject(parent)
{
}

HotplugMonitor::~HotplugMonitor()
{
}

// ========== DirectoryHotplugMonitor ==========

DirectoryHotplugMonitor::DirectoryHotplugMonitor(const QString &devicePath, QObject *parent)
    : HotplugMonitor(parent)
    , m_devicePath(devicePath)
{
    m_timer = new QTimer(this);
    connect(m_timer, &QTimer::timeout, this, &DirectoryHotplugMonitor::checkNow);
}

DirectoryHotplugMonitor::~DirectoryHotplugMonitor()
{
    stop();
}

void DirectoryHotplugMonitor::setPollInterval(int intervalMs)
{
    m_pollIntervalMs = intervalMs;
    if (m_timer->isActive()) {
        m_timer->setInterval(intervalMs);
    }
}

void DirectoryHotplugMonitor::start()
{
    if (m_timer->isActive()) {
        return;
    }

    qDebug() << "[DirectoryHotplugMonitor] Watching" << m_devicePath
             << "every" << m_pollIntervalMs << "ms";
    checkNow();
    m_timer->start(m_pollIntervalMs);
}

void DirectoryHotplugMonitor::stop()
{
    m_timer->stop();
}

bool DirectoryHotplugMonitor::isRunning() const
{
    return m_timer->isActive();
}

void DirectoryHotplugMonitor::checkNow()
{
    const bool present = QFileInfo(m_devicePath).isDir();

    if (present && !m_attached) {
        LocalDeviceDescriptor descriptor;
        QString error;
        if (!LocalDeviceDriver::readDescriptor(m_devicePath, descriptor, &error)) {
            // Half-written descriptor; try again on the next poll
            qWarning() << "[DirectoryHotplugMonitor]" << error;
            return;
        }

        m_attached = true;
        m_attachedId = descriptor.deviceId;
        qDebug() << "[DirectoryHotplugMonitor] Attached:" << m_attachedId
                 << "product" << descriptor.productId;
        emit deviceAttached(m_attachedId, descriptor.productId);
    } else if (!present && m_attached) {
        m_attached = false;
        qDebug() << "[DirectoryHotplugMonitor] Detached:" << m_attachedId;
        emit deviceDetached(m_attachedId);
    }
}
