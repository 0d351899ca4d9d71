#ifndef SYNCORCHESTRATOR_H
#define SYNCORCHESTRATOR_H

#include <QObject>
#include <QHash>
#include <QElapsedTimer>
#include <QMutex>
#include <QSharedPointer>
#include <QStringList>
#include <functional>

#include "synctypes.h"
#include "audiovalidator.h"

class TransportSerializer;

namespace Sync {

class ImportSession;
class RecordingCatalog;
class RecordingStorage;

/**
 * @brief Imports recordings from the device into local storage
 *
 * Per file, in listing order:
 *   1. Look the filename up in the catalog
 *   2. Not cataloged: download
 *   3. Cataloged with the same size, or with an unknown size: skip
 *   4. Cataloged with a different size: rename the existing file and its
 *      catalog row to a backup name, then download. A file in storage
 *      with no catalog row is renamed to a backup name the same way.
 *   5. Download into a unique temp file and check the byte count
 *   6. Move into storage under the original name
 *   7. Insert the catalog row with status Synced
 *
 * A failure affects only its file; the batch carries on. The conflict
 * rename always reaches the catalog before the new row is inserted, which
 * is what keeps filenames unique without locking the catalog.
 *
 * The import methods block and are meant to run on a worker thread (see
 * ImportWorker). Signals are emitted from that thread. Only one import
 * per device id runs at a time; a second request is rejected.
 */
class SyncOrchestrator : public QObject
{
    Q_OBJECT

public:
    SyncOrchestrator(TransportSerializer *transport,
                     RecordingCatalog *catalog,
                     RecordingStorage *storage,
                     QObject *parent = nullptr);
    ~SyncOrchestrator() override;

    // ========== Configuration ==========

    /**
     * @brief Directory for in-flight downloads (default: system temp)
     */
    void setTempDirectory(const QString &path) { m_tempDirectory = path; }
    QString tempDirectory() const { return m_tempDirectory; }

    /**
     * @brief Replace the monotonic millisecond clock used for progress
     */
    void setClock(const std::function<qint64()> &clock) { m_clock = clock; }

    // ========== Device Import ==========

    /**
     * @brief List the device and import everything on it
     */
    ImportResult importFromDevice(quint64 deviceId);

    /**
     * @brief Import an explicit subset of the device listing
     */
    ImportResult importDeviceFiles(quint64 deviceId, const QList<RemoteFileEntry> &files);

    /**
     * @brief Stop the import for @p deviceId at its next check
     *
     * Thread-safe. The import finishes with ImportResult::cancelled set.
     */
    void cancelImport(quint64 deviceId);

    bool isImporting(quint64 deviceId) const;

    /**
     * @brief Latest snapshot for @p deviceId, Idle when nothing runs
     */
    ImportProgress progress(quint64 deviceId) const;

    // ========== Manual Import ==========

    /**
     * @brief Copy files from disk into storage and catalog them as LocalOnly
     *
     * Names are sanitized. A name already in the catalog gets a backup
     * name; a name taken only on disk gets "name 2.ext", "name 3.ext", ...
     */
    ManualImportResult importFiles(const QStringList &paths);

signals:
    void importStarted(quint64 deviceId);
    void progressUpdated(quint64 deviceId, const Sync::ImportProgress &progress);
    void fileProcessed(quint64 deviceId, const QString &filename,
                       Sync::FileOutcome outcome, const QString &detail);
    void importFinished(quint64 deviceId, const Sync::ImportResult &result);

    void logMessage(const QString &message);
    void errorOccurred(const QString &error);

private:
    enum class ProcessResult {
        Downloaded,
        Skipped,
        Failed,
        Cancelled
    };

    ImportResult runImport(quint64 deviceId, const QList<RemoteFileEntry> *explicitFiles);
    void processBatch(ImportSession *session, const QList<RemoteFileEntry> &files,
                      ImportResult &result);
    ProcessResult processFile(ImportSession *session, const DeviceSession &device,
                              const RemoteFileEntry &entry, QString *error);
    bool resolveConflict(const RecordingRecord &existing, QString *error);
    bool setAsideUncataloged(const QString &filename, QString *error);
    ProcessResult downloadAndStore(ImportSession *session, const DeviceSession &device,
                                   const RemoteFileEntry &entry, QString *error);
    QString manualImportName(const QString &sourceName) const;
    void restoreRenamed(const QString &path, const QString &originalName);
    void discardStored(const QString &filename);

    QSharedPointer<ImportSession> beginSession(quint64 deviceId);
    void endSession(quint64 deviceId);
    void publishProgress(ImportSession *session, bool force);
    qint64 now() const;

    TransportSerializer *m_transport;
    RecordingCatalog *m_catalog;
    RecordingStorage *m_storage;
    AudioValidator m_validator;
    QString m_tempDirectory;

    std::function<qint64()> m_clock;
    QElapsedTimer m_elapsed;

    mutable QMutex m_sessionsMutex;
    QHash<quint64, QSharedPointer<ImportSession>> m_sessions;
};

} // namespace Sync

#endif // SYNCORCHESTRATOR_H
