#ifndef SYNCTYPES_H
#define SYNCTYPES_H

#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QList>
#include <QMetaType>

#include "../device/devicetypes.h"

/**
 * @file synctypes.h
 * @brief Common types and enums for the import pipeline
 */

namespace Sync {

/**
 * @brief Where a cataloged recording currently lives
 */
enum class SyncStatus {
    LocalOnly,      ///< Imported from disk, or deleted from the device
    OnDeviceOnly,   ///< Known from a listing, not downloaded
    Synced          ///< Downloaded and still on the device
};

QString syncStatusName(SyncStatus status);
SyncStatus syncStatusFromName(const QString &name);

/**
 * @brief One catalog row
 */
struct RecordingRecord {
    qint64 id = 0;                      ///< Assigned by the catalog on insert
    QString filename;                   ///< Unique across the catalog
    QString relativePath;               ///< Relative to the storage directory
    qint64 fileSizeBytes = -1;          ///< -1 = unknown (rows from older imports)
    int durationSeconds = 0;
    QDateTime createdAt;
    QDateTime modifiedAt;
    QString deviceSerial;
    QString deviceModel;
    RecordingMode recordingMode = RecordingMode::Unknown;
    SyncStatus syncStatus = SyncStatus::LocalOnly;
    int playbackPositionSeconds = 0;

    bool hasKnownSize() const { return fileSizeBytes >= 0; }
};

/**
 * @brief Lifecycle of one import invocation
 */
enum class ImportState {
    Idle,
    Preparing,      ///< Listing the device
    Importing,      ///< Processing files
    Stopping        ///< Cancellation requested, winding down
};

QString importStateName(ImportState state);

/**
 * @brief What happened to one file
 */
enum class FileOutcome {
    Downloaded,
    Skipped,
    Failed
};

/**
 * @brief Counters for a finished invocation
 */
struct ImportStats {
    int total = 0;
    int downloaded = 0;
    int skipped = 0;
    int failed = 0;

    QString summary() const;
};

/**
 * @brief Terminal result of an import invocation
 */
struct ImportResult {
    quint64 deviceId = 0;
    bool success = false;
    bool cancelled = false;         ///< errorMessage is "Import cancelled"
    bool rejected = false;          ///< Another import for this device was running
    ImportStats stats;
    QString errorMessage;           ///< One line per failed file, or the fatal error
    QStringList failures;
    QDateTime startTime;
    QDateTime endTime;

    qint64 durationMs() const { return startTime.msecsTo(endTime); }
};

/**
 * @brief Snapshot published while an import runs
 */
struct ImportProgress {
    ImportState state = ImportState::Idle;
    QString currentFile;
    int filesCompleted = 0;
    int filesTotal = 0;
    qint64 totalBytesExpected = 0;
    qint64 totalBytesImported = 0;
    double bytesPerSecond = 0.0;
    double estimatedSecondsRemaining = -1.0;    ///< -1 when throughput is zero

    double fraction() const;
    QString formattedSpeed() const;
    QString formattedTimeRemaining() const;
    QString formattedBytes() const;
};

/**
 * @brief Result of a manual (disk) import
 */
struct ManualImportResult {
    QList<RecordingRecord> imported;
    QStringList failures;

    bool success() const { return failures.isEmpty(); }
};

} // namespace Sync

Q_DECLARE_METATYPE(Sync::RecordingRecord)
Q_DECLARE_METATYPE(Sync::ImportResult)
Q_DECLARE_METATYPE(Sync::ImportProgress)
Q_DECLARE_METATYPE(Sync::FileOutcome)
Q_DECLARE_METATYPE(Sync::ManualImportResult)

#endif // SYNCTYPES_H
