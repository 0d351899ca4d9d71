#include "importworker.h"
#include "syncorchestrator.h"

#include <QDebug>
#include <QThread>

namespace Sync {

ImportWorker::ImportWorker(SyncOrchestrator *orchestrator, QObject *parent)
    : QObject(parent)
    , m_orchestrator(orchestrator)
{
    qRegisterMetaType<QList<RemoteFileEntry>>();
    qRegisterMetaType<Sync::ImportResult>();
    qRegisterMetaType<Sync::ManualImportResult>();

    qDebug() << "[ImportWorker] Created on thread:" << QThread::currentThread();
}

ImportWorker::~ImportWorker()
{
    qDebug() << "[ImportWorker] Destroyed";
}

void ImportWorker::doImportFromDevice(quint64 deviceId)
{
    qDebug() << "[ImportWorker] doImportFromDevice()" << deviceId
             << "on thread:" << QThread::currentThread();

    const ImportResult result = m_orchestrator->importFromDevice(deviceId);
    emit importFinished(result);
}

void ImportWorker::doImportDeviceFiles(quint64 deviceId, const QList<RemoteFileEntry> &files)
{
    qDebug() << "[ImportWorker] doImportDeviceFiles()" << deviceId << files.size() << "file(s)";

    const ImportResult result = m_orchestrator->importDeviceFiles(deviceId, files);
    emit importFinished(result);
}

void ImportWorker::doImportFiles(const QStringList &paths)
{
    qDebug() << "[ImportWorker] doImportFiles()" << paths.size() << "file(s)";

    const ManualImportResult result = m_orchestrator->importFiles(paths);
    if (!result.success()) {
        emit logMessage(QString("%1 file(s) could not be imported").arg(result.failures.size()));
    }
    emit manualImportFinished(result);
}

} // namespace Sync
