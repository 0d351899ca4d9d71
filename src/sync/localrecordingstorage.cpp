#include "localrecordingstorage.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>

namespace Sync {

LocalRecordingStorage::LocalRecordingStorage(const QString &storageDirectory)
    : m_storageDirectory(QDir::cleanPath(QDir(storageDirectory).absolutePath()))
{
}

bool LocalRecordingStorage::ensureStorageDirectoryExists()
{
    if (QFileInfo(m_storageDirectory).isDir()) {
        return true;
    }

    if (!QDir().mkpath(m_storageDirectory)) {
        m_lastError = QString("Failed to create storage directory: %1").arg(m_storageDirectory);
        qWarning() << "[LocalRecordingStorage]" << m_lastError;
        return false;
    }

    qDebug() << "[LocalRecordingStorage] Created" << m_storageDirectory;
    return true;
}

QString LocalRecordingStorage::recordingPath(const QString &filename) const
{
    return QDir(m_storageDirectory).filePath(filename);
}

bool LocalRecordingStorage::recordingExists(const QString &filename) const
{
    return QFileInfo::exists(recordingPath(filename));
}

bool LocalRecordingStorage::prepareDestination(const QString &filename, QString *destination)
{
    if (filename.isEmpty() || filename.contains('/') || filename == "." || filename == "..") {
        m_lastError = QString("Invalid recording filename: %1").arg(filename);
        return false;
    }
    if (!ensureStorageDirectoryExists()) {
        return false;
    }

    *destination = recordingPath(filename);
    if (QFileInfo::exists(*destination)) {
        m_lastError = QString("A file named \"%1\" already exists in storage").arg(filename);
        return false;
    }
    return true;
}

QString LocalRecordingStorage::moveToStorage(const QString &sourcePath, const QString &filename)
{
    QString destination;
    if (!prepareDestination(filename, &destination)) {
        return QString();
    }

    if (QFile::rename(sourcePath, destination)) {
        return destination;
    }

    // Different filesystem (e.g. /tmp on tmpfs): copy, then drop the source
    if (!QFile::copy(sourcePath, destination)) {
        m_lastError = QString("Failed to move %1 into storage").arg(QFileInfo(sourcePath).fileName());
        QFile::remove(destination);
        return QString();
    }
    if (!QFile::remove(sourcePath)) {
        qWarning() << "[LocalRecordingStorage] Could not remove source after copy:" << sourcePath;
    }
    return destination;
}

QString LocalRecordingStorage::copyToStorage(const QString &sourcePath, const QString &filename)
{
    QString destination;
    if (!prepareDestination(filename, &destination)) {
        return QString();
    }

    if (!QFile::copy(sourcePath, destination)) {
        m_lastError = QString("Failed to copy %1 into storage").arg(sourcePath);
        QFile::remove(destination);
        return QString();
    }
    return destination;
}

QString LocalRecordingStorage::relativePath(const QString &absolutePath) const
{
    const QString cleaned = QDir::cleanPath(QFileInfo(absolutePath).absoluteFilePath());
    const QString root = m_storageDirectory + QLatin1Char('/');

    if (!cleaned.startsWith(root) || cleaned.size() == root.size()) {
        return QString();
    }
    return cleaned.mid(root.size());
}

QString LocalRecordingStorage::resolve(const QString &relativePath) const
{
    if (relativePath.isEmpty() || QDir::isAbsolutePath(relativePath)) {
        return QString();
    }

    const QString resolved = QDir::cleanPath(QDir(m_storageDirectory).filePath(relativePath));
    if (!resolved.startsWith(m_storageDirectory + QLatin1Char('/'))) {
        return QString();  // Escapes storage
    }
    return resolved;
}

QString LocalRecordingStorage::renameFile(const QString &path, const QString &newFilename)
{
    const QFileInfo source(path);
    if (!source.exists()) {
        m_lastError = QString("Cannot rename missing file: %1").arg(path);
        return QString();
    }
    if (newFilename.isEmpty() || newFilename.contains('/')) {
        m_lastError = QString("Invalid recording filename: %1").arg(newFilename);
        return QString();
    }

    const QString destination = source.dir().filePath(newFilename);
    if (QFileInfo::exists(destination)) {
        m_lastError = QString("A file named \"%1\" already exists").arg(newFilename);
        return QString();
    }

    if (!QFile::rename(path, destination)) {
        m_lastError = QString("Failed to rename %1 to %2").arg(source.fileName(), newFilename);
        return QString();
    }

    qDebug() << "[LocalRecordingStorage] Renamed" << source.fileName() << "->" << newFilename;
    return destination;
}

QString LocalRecordingStorage::generateBackupFilename(const QString &filename) const
{
    const QFileInfo info(filename);
    const QString base = info.completeBaseName();
    const QString suffix = info.suffix().isEmpty() ? QString() : QLatin1Char('.') + info.suffix();

    int n = 1;
    QString candidate;
    do {
        candidate = QString("%1_backup_%2%3").arg(base).arg(n).arg(suffix);
        ++n;
    } while (recordingExists(candidate));

    return candidate;
}

bool LocalRecordingStorage::deleteRecording(const QString &filename)
{
    QFile file(recordingPath(filename));
    if (!file.exists()) {
        return true;
    }
    if (!file.remove()) {
        m_lastError = QString("Failed to delete %1: %2").arg(filename, file.errorString());
        return false;
    }
    return true;
}

} // namespace Sync
