#include "transportserializer.h"
#include "devicedriver.h"

#include <QDebug>
#include <QFile>
#include <QMutexLocker>

namespace {

template<typename T>
TransportResult<T> notConnected()
{
    return TransportResult<T>::failure(TransportError::NotConnected, "Device not connected");
}

}

TransportSerializer::TransportSerializer(DriverFactory factory, QObject *parent)
    : QObject(parent)
    , m_factory(std::move(factory))
{
    qRegisterMetaType<DeviceSession>();

    m_thread = new QThread(this);
    m_thread->setObjectName("TransportSerializer");

    m_context = new QObject;
    m_context->moveToThread(m_thread);
    connect(m_thread, &QThread::finished, m_context, &QObject::deleteLater);

    m_thread->start();
    qDebug() << "[TransportSerializer] Worker thread started:" << m_thread;
}

TransportSerializer::~TransportSerializer()
{
    disconnectDevice();

    m_thread->quit();
    if (!m_thread->wait(5000)) {
        qWarning() << "[TransportSerializer] Worker thread did not finish in time";
        m_thread->wait();
    }
    qDebug() << "[TransportSerializer] Destroyed";
}

template<typename T>
TransportResult<T> TransportSerializer::execute(const std::function<TransportResult<T>()> &operation)
{
    if (QThread::currentThread() == m_thread) {
        return operation();
    }

    TransportResult<T> result;
    const bool invoked = QMetaObject::invokeMethod(m_context, [&result, &operation]() {
        result = operation();
    }, Qt::BlockingQueuedConnection);

    if (!invoked) {
        qCritical() << "[TransportSerializer] Could not queue operation to worker thread";
        return TransportResult<T>::failure(TransportError::OperationFailed,
                                           "Transport worker is not running");
    }
    return result;
}

bool TransportSerializer::driverReady() const
{
    return m_driver && m_driver->isOpen();
}

void TransportSerializer::closeDriver()
{
    if (!m_driver) {
        return;
    }

    m_driver->close();
    m_driver->disconnect();
    m_driver->deleteLater();
    m_driver = nullptr;

    {
        QMutexLocker locker(&m_sessionMutex);
        m_session = DeviceSession();
    }

    if (m_connected.exchange(false)) {
        emit disconnected();
    }
}

// ========== Connection ==========

TransportResult<DeviceSession> TransportSerializer::connectDevice()
{
    return execute<DeviceSession>([this]() {
        if (driverReady()) {
            return TransportResult<DeviceSession>::success(session());
        }

        // A driver that lost its device is discarded before reconnecting
        closeDriver();

        m_driver = m_factory ? m_factory() : nullptr;
        if (!m_driver) {
            return TransportResult<DeviceSession>::failure(TransportError::NotConnected,
                                                           "No device driver available");
        }

        connect(m_driver, &DeviceDriver::logMessage, this, &TransportSerializer::logMessage);
        connect(m_driver, &DeviceDriver::connectionLost, m_context, [this]() {
            qWarning() << "[TransportSerializer] Driver reported connection lost";
            closeDriver();
        });

        if (!m_driver->open()) {
            const QString error = m_driver->lastError().isEmpty()
                ? QString("Failed to open device") : m_driver->lastError();
            closeDriver();
            emit errorOccurred(error);
            return TransportResult<DeviceSession>::failure(TransportError::NotConnected, error);
        }

        const DeviceSession info = m_driver->sessionInfo();
        {
            QMutexLocker locker(&m_sessionMutex);
            m_session = info;
        }
        m_connected = true;

        qDebug() << "[TransportSerializer] Connected to" << info.serialNumber
                 << deviceModelName(info.model) << "firmware" << info.firmwareVersion;
        emit logMessage(QString("Connected to %1").arg(info.serialNumber));
        emit connected(info);
        return TransportResult<DeviceSession>::success(info);
    });
}

void TransportSerializer::disconnectDevice()
{
    const TransportStatus result = execute<bool>([this]() {
        closeDriver();
        return TransportStatus::success(true);
    });

    if (!result.ok()) {
        qWarning() << "[TransportSerializer] disconnectDevice():" << result.errorMessage;
    }
}

DeviceSession TransportSerializer::session() const
{
    QMutexLocker locker(&m_sessionMutex);
    return m_session;
}

// ========== Device Operations ==========

TransportResult<QList<RemoteFileEntry>> TransportSerializer::listFiles()
{
    return execute<QList<RemoteFileEntry>>([this]() {
        if (!driverReady()) {
            return notConnected<QList<RemoteFileEntry>>();
        }

        QList<RemoteFileEntry> entries;
        if (!m_driver->listFiles(entries)) {
            return TransportResult<QList<RemoteFileEntry>>::failure(
                TransportError::OperationFailed, m_driver->lastError());
        }
        return TransportResult<QList<RemoteFileEntry>>::success(entries);
    });
}

TransportStatus TransportSerializer::downloadFile(const QString &filename,
                                                  qint64 expectedSize,
                                                  const QString &destinationPath,
                                                  const ProgressCallback &progress,
                                                  const CancelCheck &cancelCheck)
{
    return execute<bool>([&]() {
        if (!driverReady()) {
            return notConnected<bool>();
        }

        QFile destination(destinationPath);
        if (!destination.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            return TransportStatus::failure(
                TransportError::OperationFailed,
                QString("Cannot open %1 for writing: %2").arg(destinationPath, destination.errorString()));
        }

        qDebug() << "[TransportSerializer] Downloading" << filename << expectedSize << "bytes";
        const bool ok = m_driver->downloadFile(filename, expectedSize, &destination,
                                               progress, cancelCheck);
        const bool flushed = destination.flush();
        destination.close();

        if (!ok) {
            if (cancelCheck && cancelCheck()) {
                return TransportStatus::failure(TransportError::Cancelled,
                                                QString("Download of %1 cancelled").arg(filename));
            }
            return TransportStatus::failure(TransportError::OperationFailed, m_driver->lastError());
        }
        if (!flushed) {
            return TransportStatus::failure(TransportError::OperationFailed,
                                            QString("Failed to flush %1").arg(destinationPath));
        }
        return TransportStatus::success(true);
    });
}

TransportStatus TransportSerializer::deleteFile(const QString &filename)
{
    return execute<bool>([&]() {
        if (!driverReady()) {
            return notConnected<bool>();
        }
        if (!m_driver->deleteFile(filename)) {
            return TransportStatus::failure(TransportError::OperationFailed, m_driver->lastError());
        }
        return TransportStatus::success(true);
    });
}

TransportResult<BatteryStatus> TransportSerializer::getBatteryStatus()
{
    return execute<BatteryStatus>([this]() {
        if (!driverReady()) {
            return notConnected<BatteryStatus>();
        }

        BatteryStatus status;
        if (!m_driver->readBatteryStatus(status)) {
            return TransportResult<BatteryStatus>::failure(TransportError::OperationFailed,
                                                           m_driver->lastError());
        }
        return TransportResult<BatteryStatus>::success(status);
    });
}

TransportResult<StorageInfo> TransportSerializer::getStorageInfo()
{
    return execute<StorageInfo>([this]() {
        if (!driverReady()) {
            return notConnected<StorageInfo>();
        }

        StorageInfo info;
        if (!m_driver->readStorageInfo(info)) {
            return TransportResult<StorageInfo>::failure(TransportError::OperationFailed,
                                                         m_driver->lastError());
        }
        return TransportResult<StorageInfo>::success(info);
    });
}
