#ifndef IMPORTWORKER_H
#define IMPORTWORKER_H

#include <QObject>
#include <QStringList>

#include "synctypes.h"

namespace Sync {

class SyncOrchestrator;

/**
 * @brief Worker object for running imports off the main thread
 *
 * Moved onto a dedicated thread by its owner and driven through queued
 * invocations of its slots. Each slot runs one blocking orchestrator
 * call and reports the result via signals; cancellation goes straight
 * to SyncOrchestrator::cancelImport(), which is thread-safe.
 */
class ImportWorker : public QObject
{
    Q_OBJECT

public:
    explicit ImportWorker(SyncOrchestrator *orchestrator, QObject *parent = nullptr);
    ~ImportWorker() override;

public slots:
    /**
     * @brief List the device and import everything new
     */
    void doImportFromDevice(quint64 deviceId);

    /**
     * @brief Import a chosen subset of the device listing
     */
    void doImportDeviceFiles(quint64 deviceId, const QList<RemoteFileEntry> &files);

    /**
     * @brief Copy files from disk into storage
     */
    void doImportFiles(const QStringList &paths);

signals:
    void importFinished(const Sync::ImportResult &result);
    void manualImportFinished(const Sync::ManualImportResult &result);
    void logMessage(const QString &message);

private:
    SyncOrchestrator *m_orchestrator;
};

} // namespace Sync

#endif // IMPORTWORKER_H
