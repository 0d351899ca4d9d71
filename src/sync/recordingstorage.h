#ifndef RECORDINGSTORAGE_H
#define RECORDINGSTORAGE_H

#include <QString>

namespace Sync {

/**
 * @brief Abstract interface for the local recordings directory
 *
 * Paths returned by relativePath() are what the catalog stores; resolve()
 * turns them back into absolute paths. Methods that produce a path return
 * an empty string on failure and leave the reason in lastError().
 */
class RecordingStorage
{
public:
    virtual ~RecordingStorage() = default;

    virtual bool ensureStorageDirectoryExists() = 0;
    virtual QString storageDirectory() const = 0;

    /**
     * @brief Absolute path a recording named @p filename would have
     */
    virtual QString recordingPath(const QString &filename) const = 0;
    virtual bool recordingExists(const QString &filename) const = 0;

    /**
     * @brief Move @p sourcePath into storage as @p filename
     *
     * Never overwrites. Falls back to copy-and-delete across filesystems.
     * @return Final absolute path, empty on failure
     */
    virtual QString moveToStorage(const QString &sourcePath, const QString &filename) = 0;

    /**
     * @brief Copy @p sourcePath into storage as @p filename (never overwrites)
     */
    virtual QString copyToStorage(const QString &sourcePath, const QString &filename) = 0;

    /**
     * @brief Path of @p absolutePath relative to the storage directory
     *
     * Empty when the path lies outside storage.
     */
    virtual QString relativePath(const QString &absolutePath) const = 0;
    virtual QString resolve(const QString &relativePath) const = 0;

    /**
     * @brief Rename a stored file in place (never overwrites)
     * @return New absolute path, empty on failure
     */
    virtual QString renameFile(const QString &path, const QString &newFilename) = 0;

    /**
     * @brief "<base>_backup_<n>.<ext>" with the smallest n >= 1 not on disk
     */
    virtual QString generateBackupFilename(const QString &filename) const = 0;

    virtual bool deleteRecording(const QString &filename) = 0;

    QString lastError() const { return m_lastError; }

protected:
    QString m_lastError;
};

} // namespace Sync

#endif // RECORDINGSTORAGE_H
