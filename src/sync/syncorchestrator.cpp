#include "syncorchestrator.h"
#include "importsession.h"
#include "pathsanitizer.h"
#include "recordingcatalog.h"
#include "recordingstorage.h"
#include "../device/transportserializer.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutexLocker>
#include <QUuid>

namespace Sync {

namespace {

/**
 * @brief Removes an in-flight download on every exit path
 */
class TempFileGuard
{
public:
    explicit TempFileGuard(const QString &path) : m_path(path) {}
    ~TempFileGuard() {
        if (QFile::exists(m_path) && !QFile::remove(m_path)) {
            qWarning() << "[SyncOrchestrator] Could not remove temp file" << m_path;
        }
    }

private:
    QString m_path;
};

}

SyncOrchestrator::SyncOrchestrator(TransportSerializer *transport,
                                   RecordingCatalog *catalog,
                                   RecordingStorage *storage,
                                   QObject *parent)
    : QObject(parent)
    , m_transport(transport)
    , m_catalog(catalog)
    , m_storage(storage)
    , m_tempDirectory(QDir::tempPath())
{
    qRegisterMetaType<Sync::ImportProgress>();
    qRegisterMetaType<Sync::ImportResult>();
    qRegisterMetaType<Sync::FileOutcome>();

    m_elapsed.start();
}

SyncOrchestrator::~SyncOrchestrator()
{
    qDebug() << "[SyncOrchestrator] Destroyed";
}

qint64 SyncOrchestrator::now() const
{
    return m_clock ? m_clock() : m_elapsed.elapsed();
}

// ========== Sessions ==========

QSharedPointer<ImportSession> SyncOrchestrator::beginSession(quint64 deviceId)
{
    QMutexLocker locker(&m_sessionsMutex);
    if (m_sessions.contains(deviceId)) {
        return QSharedPointer<ImportSession>();
    }

    QSharedPointer<ImportSession> session(new ImportSession(deviceId));
    m_sessions.insert(deviceId, session);
    return session;
}

void SyncOrchestrator::endSession(quint64 deviceId)
{
    QMutexLocker locker(&m_sessionsMutex);
    m_sessions.remove(deviceId);
}

void SyncOrchestrator::cancelImport(quint64 deviceId)
{
    QSharedPointer<ImportSession> session;
    {
        QMutexLocker locker(&m_sessionsMutex);
        session = m_sessions.value(deviceId);
    }

    if (!session) {
        qDebug() << "[SyncOrchestrator] cancelImport(): nothing running for device" << deviceId;
        return;
    }

    qDebug() << "[SyncOrchestrator] Cancelling import for device" << deviceId;
    emit logMessage("Cancelling import...");
    session->requestStop();
}

bool SyncOrchestrator::isImporting(quint64 deviceId) const
{
    QMutexLocker locker(&m_sessionsMutex);
    return m_sessions.contains(deviceId);
}

ImportProgress SyncOrchestrator::progress(quint64 deviceId) const
{
    QSharedPointer<ImportSession> session;
    {
        QMutexLocker locker(&m_sessionsMutex);
        session = m_sessions.value(deviceId);
    }
    return session ? session->snapshot() : ImportProgress();
}

void SyncOrchestrator::publishProgress(ImportSession *session, bool force)
{
    if (session->shouldPublish(now(), force)) {
        emit progressUpdated(session->deviceId(), session->snapshot());
    }
}

// ========== Device Import ==========

ImportResult SyncOrchestrator::importFromDevice(quint64 deviceId)
{
    return runImport(deviceId, nullptr);
}

ImportResult SyncOrchestrator::importDeviceFiles(quint64 deviceId, const QList<RemoteFileEntry> &files)
{
    return runImport(deviceId, &files);
}

ImportResult SyncOrchestrator::runImport(quint64 deviceId, const QList<RemoteFileEntry> *explicitFiles)
{
    ImportResult result;
    result.deviceId = deviceId;
    result.startTime = QDateTime::currentDateTime();

    const QSharedPointer<ImportSession> session = beginSession(deviceId);
    if (!session) {
        qWarning() << "[SyncOrchestrator] Import already in progress for device" << deviceId;
        result.rejected = true;
        result.errorMessage = QString("An import is already running for device %1").arg(deviceId);
        result.endTime = QDateTime::currentDateTime();
        emit logMessage(result.errorMessage);
        return result;
    }

    qDebug() << "[SyncOrchestrator] Import started for device" << deviceId;
    emit importStarted(deviceId);

    session->setState(ImportState::Preparing);
    session->begin(0, 0, now());
    publishProgress(session.data(), true);

    QList<RemoteFileEntry> files;
    bool ready = true;

    if (explicitFiles) {
        files = *explicitFiles;
    } else {
        emit logMessage("Reading recordings from device...");
        const TransportResult<QList<RemoteFileEntry>> listing = m_transport->listFiles();
        if (!listing.ok()) {
            result.errorMessage = QString("Could not list recordings: %1").arg(listing.errorMessage);
            ready = false;
        } else {
            files = listing.value;
        }
    }

    if (ready && !m_storage->ensureStorageDirectoryExists()) {
        result.errorMessage = m_storage->lastError();
        ready = false;
    }

    if (ready) {
        if (session->isStopRequested()) {
            result.cancelled = true;
        } else {
            processBatch(session.data(), files, result);
        }
    }

    if (result.cancelled) {
        result.errorMessage = "Import cancelled";
        qInfo() << "[SyncOrchestrator] Import cancelled for device" << deviceId;
    } else if (ready) {
        result.errorMessage = result.failures.join('\n');
        result.success = result.stats.failed == 0;
        qInfo() << "[SyncOrchestrator] Import complete:" << result.stats.summary();
    } else {
        qWarning() << "[SyncOrchestrator] Import failed:" << result.errorMessage;
        emit errorOccurred(result.errorMessage);
    }

    session->setState(ImportState::Idle);
    publishProgress(session.data(), true);
    endSession(deviceId);

    result.endTime = QDateTime::currentDateTime();
    emit logMessage(result.cancelled ? result.errorMessage : result.stats.summary());
    emit importFinished(deviceId, result);
    return result;
}

void SyncOrchestrator::processBatch(ImportSession *session, const QList<RemoteFileEntry> &files,
                                    ImportResult &result)
{
    qint64 totalBytes = 0;
    for (const RemoteFileEntry &entry : files) {
        totalBytes += qMax<qint64>(0, entry.size);
    }

    session->begin(files.size(), totalBytes, now());
    session->setTotal(files.size());
    session->setState(ImportState::Importing);
    publishProgress(session, true);

    emit logMessage(QString("Importing %1 recording(s), %2 bytes").arg(files.size()).arg(totalBytes));

    // Provenance for new rows; empty when importing without a live session
    const DeviceSession device = m_transport->session();

    for (const RemoteFileEntry &entry : files) {
        if (session->isStopRequested()) {
            result.cancelled = true;
            break;
        }

        session->startFile(entry.filename, entry.size);
        publishProgress(session, false);

        QString error;
        const ProcessResult outcome = processFile(session, device, entry, &error);

        switch (outcome) {
        case ProcessResult::Downloaded:
            session->recordOutcome(FileOutcome::Downloaded);
            emit fileProcessed(session->deviceId(), entry.filename, FileOutcome::Downloaded, QString());
            break;
        case ProcessResult::Skipped:
            session->recordOutcome(FileOutcome::Skipped);
            emit fileProcessed(session->deviceId(), entry.filename, FileOutcome::Skipped, QString());
            break;
        case ProcessResult::Failed:
            qWarning() << "[SyncOrchestrator] Failed to import" << entry.filename << ":" << error;
            session->recordOutcome(FileOutcome::Failed);
            result.failures.append(QString("%1: %2").arg(entry.filename, error));
            emit fileProcessed(session->deviceId(), entry.filename, FileOutcome::Failed, error);
            break;
        case ProcessResult::Cancelled:
            result.cancelled = true;
            break;
        }

        session->completeFile(now());
        publishProgress(session, false);

        if (result.cancelled) {
            break;
        }
    }

    result.stats = session->stats();
}

SyncOrchestrator::ProcessResult SyncOrchestrator::processFile(ImportSession *session,
                                                              const DeviceSession &device,
                                                              const RemoteFileEntry &entry,
                                                              QString *error)
{
    // The name becomes a path component in temp and storage
    if (entry.filename != PathSanitizer::sanitize(entry.filename)) {
        *error = QString("\"%1\" is not a valid recording name").arg(entry.filename);
        return ProcessResult::Failed;
    }

    RecordingRecord existing;
    if (m_catalog->fetchByFilename(entry.filename, &existing)) {
        if (!existing.hasKnownSize() || existing.fileSizeBytes == entry.size) {
            qDebug() << "[SyncOrchestrator] Skipping" << entry.filename
                     << "- already imported (catalog size" << existing.fileSizeBytes << ")";
            return ProcessResult::Skipped;
        }

        qDebug() << "[SyncOrchestrator] Conflict:" << entry.filename << "catalog size"
                 << existing.fileSizeBytes << "device size" << entry.size;
        if (!resolveConflict(existing, error)) {
            return ProcessResult::Failed;
        }
    } else if (m_storage->recordingExists(entry.filename)) {
        // Left behind by an interrupted import or a reset catalog
        if (!setAsideUncataloged(entry.filename, error)) {
            return ProcessResult::Failed;
        }
    }

    if (session->isStopRequested()) {
        return ProcessResult::Cancelled;
    }

    return downloadAndStore(session, device, entry, error);
}

bool SyncOrchestrator::resolveConflict(const RecordingRecord &existing, QString *error)
{
    const QString backupName = m_storage->generateBackupFilename(existing.filename);

    const QString existingPath = m_storage->resolve(existing.relativePath);
    if (existingPath.isEmpty()) {
        *error = QString("Conflict resolution failed: cannot locate stored copy of %1").arg(existing.filename);
        return false;
    }

    const QString backupPath = m_storage->renameFile(existingPath, backupName);
    if (backupPath.isEmpty()) {
        *error = QString("Conflict resolution failed: %1").arg(m_storage->lastError());
        return false;
    }

    const QString backupRelative = m_storage->relativePath(backupPath);
    if (backupRelative.isEmpty()) {
        *error = "Conflict resolution failed: could not determine relative path for backup";
        restoreRenamed(backupPath, existing.filename);
        return false;
    }

    // Frees the filename before the new row is inserted
    if (!m_catalog->updateFilePath(existing.id, backupName, backupRelative)) {
        *error = QString("Conflict resolution failed: %1").arg(m_catalog->lastError());
        restoreRenamed(backupPath, existing.filename);
        return false;
    }

    qInfo() << "[SyncOrchestrator] Conflict resolved:" << existing.filename << "->" << backupName;
    emit logMessage(QString("Kept previous %1 as %2").arg(existing.filename, backupName));
    return true;
}

SyncOrchestrator::ProcessResult SyncOrchestrator::downloadAndStore(ImportSession *session,
                                                                   const DeviceSession &device,
                                                                   const RemoteFileEntry &entry,
                                                                   QString *error)
{
    const QString tempPath = QDir(m_tempDirectory).filePath(
        QString("download_%1_%2_%3")
            .arg(session->deviceId())
            .arg(QUuid::createUuid().toString(QUuid::WithoutBraces))
            .arg(entry.filename));
    const TempFileGuard tempGuard(tempPath);

    qDebug() << "[SyncOrchestrator] Downloading" << entry.filename << "->" << tempPath;

    const TransportStatus download = m_transport->downloadFile(
        entry.filename, entry.size, tempPath,
        [this, session](qint64 done, qint64) {
            session->updateProgress(done, now());
            publishProgress(session, false);
        },
        [session]() { return session->isStopRequested(); });

    if (download.error == TransportError::Cancelled) {
        return ProcessResult::Cancelled;
    }
    if (!download.ok()) {
        *error = QString("\"%1\" could not be downloaded: %2").arg(entry.filename, download.errorMessage);
        return ProcessResult::Failed;
    }

    if (!m_validator.validate(tempPath, entry.size, error)) {
        return ProcessResult::Failed;
    }

    const QString finalPath = m_storage->moveToStorage(tempPath, entry.filename);
    if (finalPath.isEmpty()) {
        *error = m_storage->lastError();
        return ProcessResult::Failed;
    }

    const QString relative = m_storage->relativePath(finalPath);
    if (relative.isEmpty()) {
        *error = QString("Could not resolve storage path for %1").arg(entry.filename);
        discardStored(entry.filename);
        return ProcessResult::Failed;
    }

    RecordingRecord record;
    record.filename = entry.filename;
    record.relativePath = relative;
    record.fileSizeBytes = entry.size;
    record.durationSeconds = entry.durationSeconds > 0
        ? entry.durationSeconds : m_validator.durationSeconds(finalPath);
    record.createdAt = entry.createdAt.isValid() ? entry.createdAt : QDateTime::currentDateTime();
    record.modifiedAt = QDateTime::currentDateTime();
    record.deviceSerial = device.serialNumber;
    record.deviceModel = device.isValid() ? deviceModelName(device.model) : QString();
    record.recordingMode = entry.mode;
    record.syncStatus = SyncStatus::Synced;

    if (!m_catalog->insert(record)) {
        *error = m_catalog->lastError();
        discardStored(entry.filename);
        return ProcessResult::Failed;
    }

    qDebug() << "[SyncOrchestrator] Imported" << entry.filename << "as row" << record.id;
    return ProcessResult::Downloaded;
}

bool SyncOrchestrator::setAsideUncataloged(const QString &filename, QString *error)
{
    const QString backupName = m_storage->generateBackupFilename(filename);
    if (m_storage->renameFile(m_storage->recordingPath(filename), backupName).isEmpty()) {
        *error = QString("Could not move aside uncataloged %1: %2").arg(filename, m_storage->lastError());
        return false;
    }

    qInfo() << "[SyncOrchestrator] Uncataloged" << filename << "kept as" << backupName;
    emit logMessage(QString("Kept uncataloged %1 as %2").arg(filename, backupName));
    return true;
}

void SyncOrchestrator::restoreRenamed(const QString &path, const QString &originalName)
{
    if (m_storage->renameFile(path, originalName).isEmpty()) {
        qCritical() << "[SyncOrchestrator] Could not restore" << originalName << ":" << m_storage->lastError();
        emit errorOccurred(QString("Could not restore %1: %2").arg(originalName, m_storage->lastError()));
    }
}

void SyncOrchestrator::discardStored(const QString &filename)
{
    if (!m_storage->deleteRecording(filename)) {
        qWarning() << "[SyncOrchestrator] Could not remove" << filename << ":" << m_storage->lastError();
    }
}

// ========== Manual Import ==========

QString SyncOrchestrator::manualImportName(const QString &sourceName) const
{
    const QString sanitized = PathSanitizer::sanitize(sourceName);

    if (m_catalog->fetchByFilename(sanitized, nullptr)) {
        return m_storage->generateBackupFilename(sanitized);
    }

    if (!m_storage->recordingExists(sanitized)) {
        return sanitized;
    }

    const QFileInfo info(sanitized);
    const QString suffix = info.suffix().isEmpty() ? QString() : QLatin1Char('.') + info.suffix();
    return PathSanitizer::resolveConflict(info.completeBaseName(), suffix,
                                          [this](const QString &candidate) {
                                              return m_storage->recordingExists(candidate)
                                                  || m_catalog->fetchByFilename(candidate, nullptr);
                                          });
}

ManualImportResult SyncOrchestrator::importFiles(const QStringList &paths)
{
    ManualImportResult result;

    if (!m_storage->ensureStorageDirectoryExists()) {
        for (const QString &path : paths) {
            result.failures.append(QString("%1: %2").arg(QFileInfo(path).fileName(), m_storage->lastError()));
        }
        emit errorOccurred(m_storage->lastError());
        return result;
    }

    for (const QString &path : paths) {
        const QFileInfo source(path);
        if (!source.isFile()) {
            result.failures.append(QString("%1: file not found").arg(path));
            continue;
        }

        const QString filename = manualImportName(source.fileName());
        const QString storedPath = m_storage->copyToStorage(source.absoluteFilePath(), filename);
        if (storedPath.isEmpty()) {
            result.failures.append(QString("%1: %2").arg(source.fileName(), m_storage->lastError()));
            continue;
        }

        const QString relative = m_storage->relativePath(storedPath);
        if (relative.isEmpty()) {
            discardStored(filename);
            result.failures.append(QString("%1: could not resolve storage path").arg(source.fileName()));
            continue;
        }

        RecordingRecord record;
        record.filename = filename;
        record.relativePath = relative;
        record.fileSizeBytes = source.size();
        record.durationSeconds = m_validator.durationSeconds(storedPath);
        record.createdAt = source.birthTime().isValid() ? source.birthTime() : source.lastModified();
        record.modifiedAt = QDateTime::currentDateTime();
        record.syncStatus = SyncStatus::LocalOnly;

        if (!m_catalog->insert(record)) {
            discardStored(filename);
            result.failures.append(QString("%1: %2").arg(source.fileName(), m_catalog->lastError()));
            continue;
        }

        qDebug() << "[SyncOrchestrator] Manually imported" << path << "as" << filename;
        result.imported.append(record);
    }

    emit logMessage(QString("Imported %1 of %2 file(s)").arg(result.imported.size()).arg(paths.size()));
    return result;
}

} // namespace Sync
