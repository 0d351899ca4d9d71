#include "devicedriver.h"

#include <QDebug>

DeviceDriver::DeviceDriver(QObject *parent)
    : QObject(parent)
{
}

DeviceDriver::~DeviceDriver()
{
}

void DeviceDriver::setError(const QString &error)
{
    m_lastError = error;
    qWarning() << "[DeviceDriver]" << error;
    emit errorOccurred(error);
}
