#include "jsonrecordingcatalog.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QMutexLocker>
#include <QSaveFile>

namespace Sync {

JsonRecordingCatalog::JsonRecordingCatalog(const QString &filePath, QObject *parent)
    : RecordingCatalog(parent)
    , m_filePath(filePath)
{
}

JsonRecordingCatalog::~JsonRecordingCatalog()
{
}

// ========== Persistence ==========

bool JsonRecordingCatalog::load()
{
    QMutexLocker locker(&m_mutex);

    m_records.clear();
    m_idByFilename.clear();
    m_nextId = 1;

    QFile file(m_filePath);
    if (!file.exists()) {
        // No catalog yet - first run
        return true;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        const QString error = QString("Failed to open catalog: %1").arg(m_filePath);
        locker.unlock();
        setError(error);
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        const QString error = QString("Failed to parse catalog: %1").arg(parseError.errorString());
        locker.unlock();
        setError(error);
        return false;
    }

    const QJsonObject root = doc.object();
    const QJsonArray recordings = root["recordings"].toArray();
    for (const QJsonValue &val : recordings) {
        const RecordingRecord record = recordFromJson(val.toObject());
        if (record.id <= 0 || record.filename.isEmpty()) {
            qWarning() << "[JsonRecordingCatalog] Skipping malformed row" << val;
            continue;
        }
        if (m_idByFilename.contains(record.filename)) {
            qWarning() << "[JsonRecordingCatalog] Skipping duplicate filename" << record.filename;
            continue;
        }
        m_records.insert(record.id, record);
        m_idByFilename.insert(record.filename, record.id);
        m_nextId = qMax(m_nextId, record.id + 1);
    }
    m_nextId = qMax(m_nextId, static_cast<qint64>(root["nextId"].toDouble(1)));

    qDebug() << "[JsonRecordingCatalog] Loaded" << m_records.size() << "recordings from" << m_filePath;
    return true;
}

bool JsonRecordingCatalog::saveLocked()
{
    QDir().mkpath(QFileInfo(m_filePath).absolutePath());

    QJsonArray recordings;
    for (const RecordingRecord &record : m_records) {
        recordings.append(recordToJson(record));
    }

    QJsonObject root;
    root["version"] = 1;
    root["nextId"] = static_cast<double>(m_nextId);
    root["recordings"] = recordings;

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        m_lastError = QString("Failed to save catalog: %1").arg(file.errorString());
        return false;
    }

    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        m_lastError = QString("Failed to save catalog: %1").arg(file.errorString());
        return false;
    }
    return true;
}

void JsonRecordingCatalog::rebuildIndexLocked()
{
    m_idByFilename.clear();
    for (const RecordingRecord &record : m_records) {
        m_idByFilename.insert(record.filename, record.id);
    }
}

// ========== Queries ==========

int JsonRecordingCatalog::count() const
{
    QMutexLocker locker(&m_mutex);
    return m_records.size();
}

bool JsonRecordingCatalog::fetchByFilename(const QString &filename, RecordingRecord *record) const
{
    QMutexLocker locker(&m_mutex);
    const auto it = m_idByFilename.constFind(filename);
    if (it == m_idByFilename.constEnd()) {
        return false;
    }
    if (record) {
        *record = m_records.value(it.value());
    }
    return true;
}

bool JsonRecordingCatalog::fetchById(qint64 id, RecordingRecord *record) const
{
    QMutexLocker locker(&m_mutex);
    const auto it = m_records.constFind(id);
    if (it == m_records.constEnd()) {
        return false;
    }
    if (record) {
        *record = it.value();
    }
    return true;
}

QList<RecordingRecord> JsonRecordingCatalog::fetchAll() const
{
    QMutexLocker locker(&m_mutex);
    return m_records.values();
}

bool JsonRecordingCatalog::existsByFilenameInSource(const QString &filename,
                                                    const QString &deviceSerial) const
{
    QMutexLocker locker(&m_mutex);
    const auto it = m_idByFilename.constFind(filename);
    if (it == m_idByFilename.constEnd()) {
        return false;
    }
    return m_records.value(it.value()).deviceSerial == deviceSerial;
}

// ========== Mutations ==========

bool JsonRecordingCatalog::insert(RecordingRecord &record)
{
    QMutexLocker locker(&m_mutex);

    if (record.filename.isEmpty()) {
        locker.unlock();
        setError("Cannot catalog a recording without a filename");
        return false;
    }
    if (m_idByFilename.contains(record.filename)) {
        const QString error = QString("A recording named \"%1\" is already cataloged").arg(record.filename);
        locker.unlock();
        setError(error);
        return false;
    }

    RecordingRecord stored = record;
    stored.id = m_nextId;
    if (!stored.modifiedAt.isValid()) {
        stored.modifiedAt = QDateTime::currentDateTimeUtc();
    }

    m_records.insert(stored.id, stored);
    m_idByFilename.insert(stored.filename, stored.id);
    ++m_nextId;

    if (!saveLocked()) {
        m_records.remove(stored.id);
        m_idByFilename.remove(stored.filename);
        --m_nextId;
        const QString error = m_lastError;
        locker.unlock();
        setError(error);
        return false;
    }

    record = stored;
    qDebug() << "[JsonRecordingCatalog] Inserted" << stored.id << stored.filename;
    return true;
}

bool JsonRecordingCatalog::applyLocked(qint64 id, const std::function<void(RecordingRecord &)> &change)
{
    auto it = m_records.find(id);
    if (it == m_records.end()) {
        m_lastError = QString("No recording with id %1").arg(id);
        return false;
    }

    const RecordingRecord previous = it.value();
    change(it.value());
    it.value().modifiedAt = QDateTime::currentDateTimeUtc();

    if (!saveLocked()) {
        m_records[id] = previous;
        rebuildIndexLocked();
        return false;
    }
    return true;
}

bool JsonRecordingCatalog::updateFilePath(qint64 id, const QString &filename,
                                          const QString &relativePath)
{
    QMutexLocker locker(&m_mutex);

    const qint64 owner = m_idByFilename.value(filename, 0);
    if (owner != 0 && owner != id) {
        const QString error = QString("A recording named \"%1\" is already cataloged").arg(filename);
        locker.unlock();
        setError(error);
        return false;
    }

    const bool ok = applyLocked(id, [&](RecordingRecord &record) {
        m_idByFilename.remove(record.filename);
        record.filename = filename;
        record.relativePath = relativePath;
        m_idByFilename.insert(filename, id);
    });

    if (!ok) {
        const QString error = m_lastError;
        locker.unlock();
        setError(error);
    }
    return ok;
}

bool JsonRecordingCatalog::updateSyncStatus(qint64 id, SyncStatus status)
{
    QMutexLocker locker(&m_mutex);
    const bool ok = applyLocked(id, [status](RecordingRecord &record) {
        record.syncStatus = status;
    });

    if (!ok) {
        const QString error = m_lastError;
        locker.unlock();
        setError(error);
    }
    return ok;
}

bool JsonRecordingCatalog::updatePlaybackPosition(qint64 id, int seconds)
{
    QMutexLocker locker(&m_mutex);
    const bool ok = applyLocked(id, [seconds](RecordingRecord &record) {
        record.playbackPositionSeconds = qMax(0, seconds);
    });

    if (!ok) {
        const QString error = m_lastError;
        locker.unlock();
        setError(error);
    }
    return ok;
}

bool JsonRecordingCatalog::remove(qint64 id)
{
    QMutexLocker locker(&m_mutex);

    const auto it = m_records.constFind(id);
    if (it == m_records.constEnd()) {
        const QString error = QString("No recording with id %1").arg(id);
        locker.unlock();
        setError(error);
        return false;
    }

    const RecordingRecord removed = it.value();
    m_records.remove(id);
    m_idByFilename.remove(removed.filename);

    if (!saveLocked()) {
        m_records.insert(id, removed);
        m_idByFilename.insert(removed.filename, id);
        const QString error = m_lastError;
        locker.unlock();
        setError(error);
        return false;
    }

    qDebug() << "[JsonRecordingCatalog] Removed" << id << removed.filename;
    return true;
}

// ========== Serialization ==========

QJsonObject JsonRecordingCatalog::recordToJson(const RecordingRecord &record)
{
    QJsonObject obj;
    obj["id"] = static_cast<double>(record.id);
    obj["filename"] = record.filename;
    obj["relativePath"] = record.relativePath;
    if (record.hasKnownSize()) {
        obj["fileSizeBytes"] = static_cast<double>(record.fileSizeBytes);
    }
    obj["durationSeconds"] = record.durationSeconds;
    if (record.createdAt.isValid()) {
        obj["createdAt"] = record.createdAt.toString(Qt::ISODateWithMs);
    }
    if (record.modifiedAt.isValid()) {
        obj["modifiedAt"] = record.modifiedAt.toString(Qt::ISODateWithMs);
    }
    obj["deviceSerial"] = record.deviceSerial;
    obj["deviceModel"] = record.deviceModel;
    obj["recordingMode"] = recordingModeName(record.recordingMode);
    obj["syncStatus"] = syncStatusName(record.syncStatus);
    obj["playbackPositionSeconds"] = record.playbackPositionSeconds;
    return obj;
}

RecordingRecord JsonRecordingCatalog::recordFromJson(const QJsonObject &obj)
{
    RecordingRecord record;
    record.id = static_cast<qint64>(obj["id"].toDouble());
    record.filename = obj["filename"].toString();
    record.relativePath = obj["relativePath"].toString(record.filename);
    record.fileSizeBytes = obj.contains("fileSizeBytes")
        ? static_cast<qint64>(obj["fileSizeBytes"].toDouble()) : -1;
    record.durationSeconds = obj["durationSeconds"].toInt();
    record.createdAt = QDateTime::fromString(obj["createdAt"].toString(), Qt::ISODateWithMs);
    record.modifiedAt = QDateTime::fromString(obj["modifiedAt"].toString(), Qt::ISODateWithMs);
    record.deviceSerial = obj["deviceSerial"].toString();
    record.deviceModel = obj["deviceModel"].toString();
    record.recordingMode = recordingModeFromName(obj["recordingMode"].toString());
    record.syncStatus = syncStatusFromName(obj["syncStatus"].toString());
    record.playbackPositionSeconds = obj["playbackPositionSeconds"].toInt();
    return record;
}

} // namespace Sync
