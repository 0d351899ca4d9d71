#ifndef RECORDINGCATALOG_H
#define RECORDINGCATALOG_H

#include <QObject>
#include <QString>
#include <QList>
#include "synctypes.h"

namespace Sync {

/**
 * @brief Abstract interface for the durable recording catalog
 *
 * The catalog holds one RecordingRecord per imported file. Filenames are
 * unique: insert() of a filename that is already present fails, and so
 * does updateFilePath() onto a taken name.
 *
 * Implementations must be safe to call from the import worker thread
 * while the main thread reads.
 */
class RecordingCatalog : public QObject
{
    Q_OBJECT

public:
    explicit RecordingCatalog(QObject *parent = nullptr) : QObject(parent) {}
    virtual ~RecordingCatalog() = default;

    // ========== Queries ==========

    /**
     * @brief Look up a record by its unique filename
     * @return true when found; @p record is filled in
     */
    virtual bool fetchByFilename(const QString &filename, RecordingRecord *record) const = 0;

    virtual bool fetchById(qint64 id, RecordingRecord *record) const = 0;
    virtual QList<RecordingRecord> fetchAll() const = 0;

    /**
     * @brief Whether @p filename was imported from the device @p deviceSerial
     */
    virtual bool existsByFilenameInSource(const QString &filename,
                                          const QString &deviceSerial) const = 0;

    // ========== Mutations ==========

    /**
     * @brief Add a record; assigns record.id on success
     *
     * Fails when the filename is already cataloged.
     */
    virtual bool insert(RecordingRecord &record) = 0;

    /**
     * @brief Point a record at a new file (used when renaming for a conflict)
     */
    virtual bool updateFilePath(qint64 id, const QString &filename,
                                const QString &relativePath) = 0;

    virtual bool updateSyncStatus(qint64 id, SyncStatus status) = 0;
    virtual bool updatePlaybackPosition(qint64 id, int seconds) = 0;
    virtual bool remove(qint64 id) = 0;

    QString lastError() const { return m_lastError; }

signals:
    void errorOccurred(const QString &error);

protected:
    void setError(const QString &error) {
        m_lastError = error;
        emit errorOccurred(error);
    }

    QString m_lastError;
};

} // namespace Sync

#endif // RECORDINGCATALOG_H
