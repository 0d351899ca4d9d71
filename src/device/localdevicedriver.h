#ifndef LOCALDEVICEDRIVER_H
#define LOCALDEVICEDRIVER_H

#include "devicedriver.h"

#include <QHash>
#include <QJsonObject>

class QTimer;

/**
 * @brief Contents of a local device's device.json
 */
struct LocalDeviceDescriptor {
    quint64 deviceId = 0;
    quint16 productId = 0;
    QString serialNumber;
    DeviceModel model = DeviceModel::Unknown;
    QString firmwareVersion;
    quint32 firmwareNumber = 0;
    bool busy = false;
    BatteryStatus battery;
    QJsonObject recordings;     ///< filename -> {durationSeconds, mode, createdAt}
};

/**
 * @brief Filesystem-backed DeviceDriver
 *
 * A directory plays the recorder: every regular file in it is a
 * recording, and an optional device.json describes the identity:
 *
 * @code
 * {
 *   "serialNumber": "HD1-000123",
 *   "model": "hidock-p1",
 *   "productId": 45070,
 *   "firmwareVersion": "6.2.5",
 *   "battery": { "percentage": 80, "state": "idle" },
 *   "recordings": { "2025Jan01-090000-Rec01.hda": { "durationSeconds": 61, "mode": "call" } }
 * }
 * @endcode
 *
 * While open, a keep-alive timer checks that the directory is still
 * present, the way a real link pings the device.
 */
class LocalDeviceDriver : public DeviceDriver
{
    Q_OBJECT

public:
    static const QString DescriptorFileName;
    static constexpr int ChunkSize = 64 * 1024;

    explicit LocalDeviceDriver(const QString &rootPath, QObject *parent = nullptr);
    ~LocalDeviceDriver() override;

    QString rootPath() const { return m_rootPath; }

    /**
     * @brief Keep-alive interval in milliseconds (default 5000)
     */
    void setKeepAliveInterval(int intervalMs);

    bool open() override;
    void close() override;
    bool isOpen() const override { return m_open; }
    DeviceSession sessionInfo() const override { return m_session; }

    bool listFiles(QList<RemoteFileEntry> &entries) override;
    bool downloadFile(const QString &filename, qint64 expectedSize,
                      QIODevice *sink,
                      const ProgressCallback &progress,
                      const CancelCheck &cancelCheck) override;
    bool deleteFile(const QString &filename) override;

    bool readBatteryStatus(BatteryStatus &status) override;
    bool readStorageInfo(StorageInfo &info) override;

    /**
     * @brief Parse @p rootPath/device.json
     *
     * A missing descriptor is not an error: defaults are derived from the
     * directory name. Returns false only for an unreadable or malformed file.
     */
    static bool readDescriptor(const QString &rootPath,
                               LocalDeviceDescriptor &descriptor,
                               QString *error = nullptr);

signals:
    void keepAliveSent();

private slots:
    void sendKeepAlive();

private:
    QString filePath(const QString &filename) const;
    bool isRecordingName(const QString &filename) const;

    QString m_rootPath;
    bool m_open = false;
    DeviceSession m_session;
    LocalDeviceDescriptor m_descriptor;
    QTimer *m_keepAliveTimer = nullptr;
    int m_keepAliveIntervalMs = 5000;
};

#endif // LOCALDEVICEDRIVER_H
