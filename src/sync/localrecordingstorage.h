#ifndef LOCALRECORDINGSTORAGE_H
#define LOCALRECORDINGSTORAGE_H

#include "recordingstorage.h"

namespace Sync {

/**
 * @brief Recordings stored as plain files in one directory
 */
class LocalRecordingStorage : public RecordingStorage
{
public:
    explicit LocalRecordingStorage(const QString &storageDirectory);
    ~LocalRecordingStorage() override = default;

    bool ensureStorageDirectoryExists() override;
    QString storageDirectory() const override { return m_storageDirectory; }

    QString recordingPath(const QString &filename) const override;
    bool recordingExists(const QString &filename) const override;

    QString moveToStorage(const QString &sourcePath, const QString &filename) override;
    QString copyToStorage(const QString &sourcePath, const QString &filename) override;

    QString relativePath(const QString &absolutePath) const override;
    QString resolve(const QString &relativePath) const override;

    QString renameFile(const QString &path, const QString &newFilename) override;
    QString generateBackupFilename(const QString &filename) const override;

    bool deleteRecording(const QString &filename) override;

private:
    bool prepareDestination(const QString &filename, QString *destination);

    QString m_storageDirectory;
};

} // namespace Sync

#endif // LOCALRECORDINGSTORAGE_H
