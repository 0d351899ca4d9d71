#ifndef JSONRECORDINGCATALOG_H
#define JSONRECORDINGCATALOG_H

#include "recordingcatalog.h"

#include <QHash>
#include <QJsonObject>
#include <QMap>
#include <QMutex>
#include <functional>

namespace Sync {

/**
 * @brief RecordingCatalog persisted as a single JSON document
 *
 * Every mutation is written through to disk before it returns, via
 * QSaveFile so a crash never leaves a half-written catalog. A failed
 * write rolls the in-memory change back.
 *
 * File layout:
 * @code
 * { "version": 1, "nextId": 4, "recordings": [ { "id": 1, "filename": ..., ... } ] }
 * @endcode
 */
class JsonRecordingCatalog : public RecordingCatalog
{
    Q_OBJECT

public:
    explicit JsonRecordingCatalog(const QString &filePath, QObject *parent = nullptr);
    ~JsonRecordingCatalog() override;

    QString filePath() const { return m_filePath; }

    /**
     * @brief Read the catalog from disk
     *
     * A missing file is an empty catalog, not an error.
     */
    bool load();

    int count() const;

    bool fetchByFilename(const QString &filename, RecordingRecord *record) const override;
    bool fetchById(qint64 id, RecordingRecord *record) const override;
    QList<RecordingRecord> fetchAll() const override;
    bool existsByFilenameInSource(const QString &filename,
                                  const QString &deviceSerial) const override;

    bool insert(RecordingRecord &record) override;
    bool updateFilePath(qint64 id, const QString &filename,
                        const QString &relativePath) override;
    bool updateSyncStatus(qint64 id, SyncStatus status) override;
    bool updatePlaybackPosition(qint64 id, int seconds) override;
    bool remove(qint64 id) override;

private:
    bool saveLocked();
    bool applyLocked(qint64 id, const std::function<void(RecordingRecord &)> &change);
    void rebuildIndexLocked();

    static QJsonObject recordToJson(const RecordingRecord &record);
    static RecordingRecord recordFromJson(const QJsonObject &obj);

    QString m_filePath;
    mutable QMutex m_mutex;
    QMap<qint64, RecordingRecord> m_records;
    QHash<QString, qint64> m_idByFilename;
    qint64 m_nextId = 1;
};

} // namespace Sync

#endif // JSONRECORDINGCATALOG_H
