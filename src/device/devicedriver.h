#ifndef DEVICEDRIVER_H
#define DEVICEDRIVER_H

#include <QObject>
#include <QString>
#include <QList>

#include "devicetypes.h"

class QIODevice;

/**
 * @brief Abstract interface for recorder communication
 *
 * Device-independent surface over a USB recorder. Implementations can
 * talk to real hardware or serve a directory on disk (LocalDeviceDriver).
 *
 * A driver is not thread-safe. It is created, used and destroyed on the
 * TransportSerializer worker thread; nothing else may call it directly.
 * Implementations may own timers, so that thread must run an event loop.
 */
class DeviceDriver : public QObject
{
    Q_OBJECT

public:
    explicit DeviceDriver(QObject *parent = nullptr);
    virtual ~DeviceDriver();

    // Connection management
    virtual bool open() = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    /**
     * @brief Identity of the open device
     *
     * Only meaningful after a successful open().
     */
    virtual DeviceSession sessionInfo() const = 0;

    // File operations
    virtual bool listFiles(QList<RemoteFileEntry> &entries) = 0;

    /**
     * @brief Stream a recording into @p sink
     *
     * Progress is reported per chunk. The cancel check is polled between
     * chunks; when it fires the method returns false with whatever was
     * already written left in the sink.
     */
    virtual bool downloadFile(const QString &filename, qint64 expectedSize,
                              QIODevice *sink,
                              const ProgressCallback &progress,
                              const CancelCheck &cancelCheck) = 0;

    virtual bool deleteFile(const QString &filename) = 0;

    // Telemetry
    virtual bool readBatteryStatus(BatteryStatus &status) = 0;
    virtual bool readStorageInfo(StorageInfo &info) = 0;

    QString lastError() const { return m_lastError; }

signals:
    void logMessage(const QString &message);
    void errorOccurred(const QString &errorMsg);

    /**
     * @brief The device went away underneath an open session
     */
    void connectionLost();

protected:
    QString m_lastError;

    void setError(const QString &error);
    void clearError() { m_lastError.clear(); }
};

#endif // DEVICEDRIVER_H
