#include "localdevicedriver.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStorageInfo>
#include <QThread>
#include <QTimer>

const QString LocalDeviceDriver::DescriptorFileName = QStringLiteral("device.json");

LocalDeviceDriver::LocalDeviceDriver(const QString &rootPath, QObject *parent)
    : DeviceDriver(parent)
    , m_rootPath(QDir::cleanPath(rootPath))
{
    qDebug() << "[LocalDeviceDriver] Created for" << m_rootPath
             << "on thread:" << QThread::currentThread();
}

LocalDeviceDriver::~LocalDeviceDriver()
{
    close();
}

void LocalDeviceDriver::setKeepAliveInterval(int intervalMs)
{
    m_keepAliveIntervalMs = intervalMs;
    if (m_keepAliveTimer && m_keepAliveTimer->isActive()) {
        m_keepAliveTimer->setInterval(intervalMs);
    }
}

bool LocalDeviceDriver::readDescriptor(const QString &rootPath,
                                       LocalDeviceDescriptor &descriptor,
                                       QString *error)
{
    const QDir root(rootPath);
    descriptor = LocalDeviceDescriptor();
    descriptor.deviceId = static_cast<quint64>(qHash(root.absolutePath()));
    descriptor.serialNumber = QString("LOCAL-%1").arg(root.dirName().toUpper());

    QFile file(root.filePath(DescriptorFileName));
    if (!file.exists()) {
        return true;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        if (error) {
            *error = QString("Cannot read %1: %2").arg(file.fileName(), file.errorString());
        }
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error) {
            *error = QString("Malformed %1: %2").arg(file.fileName(), parseError.errorString());
        }
        return false;
    }

    const QJsonObject obj = doc.object();
    if (obj.contains("deviceId")) {
        descriptor.deviceId = static_cast<quint64>(obj["deviceId"].toDouble());
    }
    descriptor.productId = static_cast<quint16>(obj["productId"].toInt());
    descriptor.serialNumber = obj["serialNumber"].toString(descriptor.serialNumber);
    descriptor.model = obj.contains("model")
        ? deviceModelFromName(obj["model"].toString())
        : deviceModelForProductId(descriptor.productId);
    descriptor.firmwareVersion = obj["firmwareVersion"].toString();
    descriptor.firmwareNumber = static_cast<quint32>(obj["firmwareNumber"].toDouble());
    descriptor.busy = obj["busy"].toBool(false);

    const QJsonObject battery = obj["battery"].toObject();
    descriptor.battery.percentage = battery["percentage"].toInt(100);
    descriptor.battery.state = batteryStateFromName(battery["state"].toString("full"));

    descriptor.recordings = obj["recordings"].toObject();
    return true;
}

bool LocalDeviceDriver::open()
{
    qDebug() << "[LocalDeviceDriver] open() on thread:" << QThread::currentThread();
    clearError();

    if (m_open) {
        return true;
    }

    if (!QFileInfo(m_rootPath).isDir()) {
        setError(QString("Device not found at %1").arg(m_rootPath));
        return false;
    }

    QString error;
    if (!readDescriptor(m_rootPath, m_descriptor, &error)) {
        setError(error);
        return false;
    }

    if (m_descriptor.busy) {
        setError("Device busy: another host holds the interface");
        return false;
    }

    m_session = DeviceSession();
    m_session.serialNumber = m_descriptor.serialNumber;
    m_session.model = m_descriptor.model;
    m_session.firmwareVersion = m_descriptor.firmwareVersion;
    m_session.firmwareNumber = m_descriptor.firmwareNumber;
    m_session.supportsBattery = deviceModelSupportsBattery(m_descriptor.model);

    if (!m_keepAliveTimer) {
        m_keepAliveTimer = new QTimer(this);
        connect(m_keepAliveTimer, &QTimer::timeout, this, &LocalDeviceDriver::sendKeepAlive);
    }
    m_keepAliveTimer->start(m_keepAliveIntervalMs);

    m_open = true;
    emit logMessage(QString("Opened local device %1 (%2)")
                        .arg(m_session.serialNumber, deviceModelName(m_session.model)));
    return true;
}

void LocalDeviceDriver::close()
{
    if (!m_open) {
        return;
    }

    if (m_keepAliveTimer) {
        m_keepAliveTimer->stop();
    }
    m_open = false;
    m_session = DeviceSession();
    qDebug() << "[LocalDeviceDriver] Closed" << m_rootPath;
}

void LocalDeviceDriver::sendKeepAlive()
{
    if (!m_open) {
        return;
    }

    if (!QFileInfo(m_rootPath).isDir()) {
        qWarning() << "[LocalDeviceDriver] Device directory vanished, connection lost";
        close();
        emit connectionLost();
        return;
    }

    emit keepAliveSent();
}

QString LocalDeviceDriver::filePath(const QString &filename) const
{
    return QDir(m_rootPath).filePath(filename);
}

bool LocalDeviceDriver::isRecordingName(const QString &filename) const
{
    return !filename.isEmpty()
        && filename != DescriptorFileName
        && !filename.startsWith('.')
        && !filename.contains('/');
}

bool LocalDeviceDriver::listFiles(QList<RemoteFileEntry> &entries)
{
    entries.clear();
    if (!m_open) {
        setError("Device not open");
        return false;
    }

    const QFileInfoList files = QDir(m_rootPath).entryInfoList(
        QDir::Files | QDir::NoDotAndDotDot, QDir::Name);

    for (const QFileInfo &info : files) {
        if (!isRecordingName(info.fileName())) {
            continue;
        }

        RemoteFileEntry entry;
        entry.filename = info.fileName();
        entry.size = info.size();

        const QJsonObject meta = m_descriptor.recordings[entry.filename].toObject();
        entry.durationSeconds = meta["durationSeconds"].toInt();
        entry.mode = recordingModeFromName(meta["mode"].toString());
        if (meta.contains("createdAt")) {
            entry.createdAt = QDateTime::fromString(meta["createdAt"].toString(), Qt::ISODate);
        } else {
            entry.createdAt = info.lastModified();
        }

        entries.append(entry);
    }

    qDebug() << "[LocalDeviceDriver] Listed" << entries.size() << "recordings";
    return true;
}

bool LocalDeviceDriver::downloadFile(const QString &filename, qint64 expectedSize,
                                     QIODevice *sink,
                                     const ProgressCallback &progress,
                                     const CancelCheck &cancelCheck)
{
    clearError();
    if (!m_open) {
        setError("Device not open");
        return false;
    }
    if (!sink || !sink->isWritable()) {
        setError("Download sink is not writable");
        return false;
    }
    if (!isRecordingName(filename)) {
        setError(QString("Invalid recording name: %1").arg(filename));
        return false;
    }

    QFile source(filePath(filename));
    if (!source.open(QIODevice::ReadOnly)) {
        setError(QString("Cannot read %1: %2").arg(filename, source.errorString()));
        return false;
    }

    qint64 done = 0;
    while (!source.atEnd()) {
        if (cancelCheck && cancelCheck()) {
            qDebug() << "[LocalDeviceDriver] Download cancelled:" << filename << "at" << done;
            setError(QString("Transfer of %1 cancelled").arg(filename));
            return false;
        }

        const QByteArray chunk = source.read(ChunkSize);
        if (chunk.isEmpty()) {
            setError(QString("Read error on %1: %2").arg(filename, source.errorString()));
            return false;
        }
        if (sink->write(chunk) != chunk.size()) {
            setError(QString("Write error while receiving %1: %2").arg(filename, sink->errorString()));
            return false;
        }

        done += chunk.size();
        if (progress) {
            progress(done, expectedSize);
        }
    }

    return true;
}

bool LocalDeviceDriver::deleteFile(const QString &filename)
{
    clearError();
    if (!m_open) {
        setError("Device not open");
        return false;
    }
    if (!isRecordingName(filename)) {
        setError(QString("Invalid recording name: %1").arg(filename));
        return false;
    }

    QFile file(filePath(filename));
    if (!file.exists()) {
        setError(QString("No such recording on device: %1").arg(filename));
        return false;
    }
    if (!file.remove()) {
        setError(QString("Failed to delete %1: %2").arg(filename, file.errorString()));
        return false;
    }

    emit logMessage(QString("Deleted %1 from device").arg(filename));
    return true;
}

bool LocalDeviceDriver::readBatteryStatus(BatteryStatus &status)
{
    clearError();
    if (!m_open) {
        setError("Device not open");
        return false;
    }
    if (!m_session.supportsBattery) {
        setError(QString("%1 has no battery").arg(deviceModelName(m_session.model)));
        return false;
    }

    // Re-read so edits to device.json show up while connected
    LocalDeviceDescriptor current;
    QString error;
    if (!readDescriptor(m_rootPath, current, &error)) {
        setError(error);
        return false;
    }

    status = current.battery;
    return true;
}

bool LocalDeviceDriver::readStorageInfo(StorageInfo &info)
{
    clearError();
    if (!m_open) {
        setError("Device not open");
        return false;
    }

    const QStorageInfo storage(m_rootPath);
    if (!storage.isValid() || !storage.isReady()) {
        setError(QString("Storage not ready at %1").arg(m_rootPath));
        return false;
    }

    info.totalBytes = storage.bytesTotal();
    info.freeBytes = storage.bytesAvailable();
    return true;
}
