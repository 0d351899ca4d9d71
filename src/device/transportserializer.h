#ifndef TRANSPORTSERIALIZER_H
#define TRANSPORTSERIALIZER_H

#include <QObject>
#include <QMutex>
#include <QThread>
#include <atomic>
#include <functional>

#include "devicetypes.h"

class DeviceDriver;

/**
 * @brief The single channel to the recorder
 *
 * Owns the one DeviceDriver instance on a dedicated worker thread. Every
 * public operation is queued to that thread and executed there one at a
 * time, in arrival order; the calling thread blocks until its operation
 * has completed. A battery query issued while a download is streaming
 * therefore waits for the download to finish.
 *
 * Operations never throw; they return a TransportResult whose error is
 * TransportError::NotConnected when there is no open session.
 *
 * The driver is created by the factory on the worker thread, so timers it
 * owns are serviced by the worker's event loop.
 */
class TransportSerializer : public QObject
{
    Q_OBJECT

public:
    using DriverFactory = std::function<DeviceDriver *()>;

    explicit TransportSerializer(DriverFactory factory, QObject *parent = nullptr);
    ~TransportSerializer() override;

    // ========== Connection ==========

    /**
     * @brief Create and open the driver
     *
     * Returns the cached session when already connected. On failure the
     * driver's error text is preserved in the result's errorMessage.
     */
    TransportResult<DeviceSession> connectDevice();

    /**
     * @brief Close and destroy the driver (idempotent)
     */
    void disconnectDevice();

    bool isConnected() const { return m_connected.load(); }

    /**
     * @brief Identity of the current session, invalid when disconnected
     */
    DeviceSession session() const;

    // ========== Device Operations ==========

    TransportResult<QList<RemoteFileEntry>> listFiles();

    /**
     * @brief Stream a recording into @p destinationPath
     *
     * The destination is created or truncated. On failure a partial file
     * may remain; removing it is the caller's job.
     */
    TransportStatus downloadFile(const QString &filename,
                                 qint64 expectedSize,
                                 const QString &destinationPath,
                                 const ProgressCallback &progress = nullptr,
                                 const CancelCheck &cancelCheck = nullptr);

    TransportStatus deleteFile(const QString &filename);
    TransportResult<BatteryStatus> getBatteryStatus();
    TransportResult<StorageInfo> getStorageInfo();

    /**
     * @brief Worker thread that owns the driver
     */
    QThread *workerThread() const { return m_thread; }

signals:
    void connected(const DeviceSession &session);
    void disconnected();
    void logMessage(const QString &message);
    void errorOccurred(const QString &error);

private:
    template<typename T>
    TransportResult<T> execute(const std::function<TransportResult<T>()> &operation);

    bool driverReady() const;
    void closeDriver();

    DriverFactory m_factory;
    QThread *m_thread = nullptr;
    QObject *m_context = nullptr;       // Lives on m_thread, target for queued calls

    // Touched only on m_thread
    DeviceDriver *m_driver = nullptr;

    mutable QMutex m_sessionMutex;
    DeviceSession m_session;
    std::atomic<bool> m_connected{false};
};

#endif // TRANSPORTSERIALIZER_H
