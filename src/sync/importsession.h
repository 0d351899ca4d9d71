#ifndef IMPORTSESSION_H
#define IMPORTSESSION_H

#include <QList>
#include <QMutex>
#include <QPair>
#include <QString>
#include <atomic>

#include "synctypes.h"

namespace Sync {

/**
 * @brief Bookkeeping for one import invocation
 *
 * Tracks state, byte counters, throughput and ETA for a single device.
 * Written by the import thread, read (snapshot()) and cancelled
 * (requestStop()) from anywhere. Never persisted.
 *
 * Byte accounting: imported bytes are the declared sizes of finished
 * files plus the current file's progress capped at its declared size,
 * and never exceed the expected total.
 *
 * All timestamps are caller-supplied milliseconds from a monotonic clock.
 */
class ImportSession
{
public:
    static constexpr qint64 SpeedWindowMs = 3000;
    static constexpr qint64 PublishIntervalMs = 250;

    explicit ImportSession(quint64 deviceId);

    quint64 deviceId() const { return m_deviceId; }

    // ========== State ==========

    ImportState state() const;
    void setState(ImportState state);

    /**
     * @brief Ask the running import to stop at its next check
     */
    void requestStop();
    bool isStopRequested() const { return m_stopRequested.load(); }

    // ========== Progress ==========

    /**
     * @brief Start the byte accounting for a batch
     */
    void begin(int fileCount, qint64 totalBytesExpected, qint64 nowMs);

    /**
     * @brief Switch to the next file
     */
    void startFile(const QString &filename, qint64 declaredSize);

    /**
     * @brief Record progress on the current file
     *
     * @param currentFileBytes Bytes received so far for the current file
     */
    void updateProgress(qint64 currentFileBytes, qint64 nowMs);

    /**
     * @brief Finish the current file, whatever its outcome
     *
     * Completed bytes always advance by the declared size.
     */
    void completeFile(qint64 nowMs);

    /**
     * @brief Throttle gate for progress publication
     *
     * True at most once per PublishIntervalMs; @p force always passes.
     */
    bool shouldPublish(qint64 nowMs, bool force = false);

    ImportProgress snapshot() const;

    // ========== Outcome ==========

    ImportStats stats() const;
    void recordOutcome(FileOutcome outcome);
    void setTotal(int total);

private:
    void addSampleLocked(qint64 nowMs);
    void recomputeLocked();

    const quint64 m_deviceId;
    std::atomic<bool> m_stopRequested{false};

    mutable QMutex m_mutex;
    ImportState m_state = ImportState::Idle;
    QString m_currentFile;
    qint64 m_currentDeclared = 0;
    qint64 m_currentBytes = 0;
    qint64 m_completedBytes = 0;
    qint64 m_totalBytesExpected = 0;
    qint64 m_totalBytesImported = 0;
    int m_filesCompleted = 0;
    int m_filesTotal = 0;
    double m_bytesPerSecond = 0.0;
    double m_etaSeconds = -1.0;
    ImportStats m_stats;

    QList<QPair<qint64, qint64>> m_samples;    // (ms, totalBytesImported)
    qint64 m_lastPublishMs = -1;
};

} // namespace Sync

#endif // IMPORTSESSION_H
