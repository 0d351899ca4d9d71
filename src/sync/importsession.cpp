#include "importsession.h"

#include <QMutexLocker>

namespace Sync {

ImportSession::ImportSession(quint64 deviceId)
    : m_deviceId(deviceId)
{
}

// ========== State ==========

ImportState ImportSession::state() const
{
    QMutexLocker locker(&m_mutex);
    return m_state;
}

void ImportSession::setState(ImportState state)
{
    QMutexLocker locker(&m_mutex);
    // Once stopping, only Idle ends it
    if (m_state == ImportState::Stopping && state != ImportState::Idle) {
        return;
    }
    m_state = state;
}

void ImportSession::requestStop()
{
    m_stopRequested = true;

    QMutexLocker locker(&m_mutex);
    if (m_state != ImportState::Idle) {
        m_state = ImportState::Stopping;
    }
}

// ========== Progress ==========

void ImportSession::begin(int fileCount, qint64 totalBytesExpected, qint64 nowMs)
{
    QMutexLocker locker(&m_mutex);
    m_filesTotal = fileCount;
    m_filesCompleted = 0;
    m_totalBytesExpected = qMax<qint64>(0, totalBytesExpected);
    m_totalBytesImported = 0;
    m_completedBytes = 0;
    m_currentBytes = 0;
    m_currentDeclared = 0;
    m_currentFile.clear();
    m_bytesPerSecond = 0.0;
    m_etaSeconds = -1.0;
    m_samples.clear();
    m_lastPublishMs = -1;
    addSampleLocked(nowMs);
}

void ImportSession::startFile(const QString &filename, qint64 declaredSize)
{
    QMutexLocker locker(&m_mutex);
    m_currentFile = filename;
    m_currentDeclared = qMax<qint64>(0, declaredSize);
    m_currentBytes = 0;
}

void ImportSession::updateProgress(qint64 currentFileBytes, qint64 nowMs)
{
    QMutexLocker locker(&m_mutex);
    m_currentBytes = qBound<qint64>(0, currentFileBytes, m_currentDeclared);
    addSampleLocked(nowMs);
}

void ImportSession::completeFile(qint64 nowMs)
{
    QMutexLocker locker(&m_mutex);
    m_completedBytes += m_currentDeclared;
    m_currentBytes = 0;
    m_currentDeclared = 0;
    ++m_filesCompleted;
    addSampleLocked(nowMs);
}

void ImportSession::addSampleLocked(qint64 nowMs)
{
    m_totalBytesImported = qMin(m_completedBytes + m_currentBytes, m_totalBytesExpected);

    m_samples.append(qMakePair(nowMs, m_totalBytesImported));
    while (!m_samples.isEmpty() && nowMs - m_samples.first().first > SpeedWindowMs) {
        m_samples.removeFirst();
    }

    recomputeLocked();
}

void ImportSession::recomputeLocked()
{
    m_bytesPerSecond = 0.0;
    if (m_samples.size() >= 2) {
        const QPair<qint64, qint64> &oldest = m_samples.first();
        const QPair<qint64, qint64> &newest = m_samples.last();
        const qint64 dtMs = newest.first - oldest.first;
        if (dtMs > 100) {
            m_bytesPerSecond = double(newest.second - oldest.second) * 1000.0 / double(dtMs);
        }
    }

    if (m_bytesPerSecond > 0.0) {
        m_etaSeconds = double(m_totalBytesExpected - m_totalBytesImported) / m_bytesPerSecond;
    } else {
        m_etaSeconds = -1.0;
    }
}

bool ImportSession::shouldPublish(qint64 nowMs, bool force)
{
    QMutexLocker locker(&m_mutex);
    if (!force && m_lastPublishMs >= 0 && nowMs - m_lastPublishMs < PublishIntervalMs) {
        return false;
    }
    m_lastPublishMs = nowMs;
    return true;
}

ImportProgress ImportSession::snapshot() const
{
    QMutexLocker locker(&m_mutex);
    ImportProgress progress;
    progress.state = m_state;
    progress.currentFile = m_currentFile;
    progress.filesCompleted = m_filesCompleted;
    progress.filesTotal = m_filesTotal;
    progress.totalBytesExpected = m_totalBytesExpected;
    progress.totalBytesImported = m_totalBytesImported;
    progress.bytesPerSecond = m_bytesPerSecond;
    progress.estimatedSecondsRemaining = m_etaSeconds;
    return progress;
}

// ========== Outcome ==========

ImportStats ImportSession::stats() const
{
    QMutexLocker locker(&m_mutex);
    return m_stats;
}

void ImportSession::setTotal(int total)
{
    QMutexLocker locker(&m_mutex);
    m_stats.total = total;
}

void ImportSession::recordOutcome(FileOutcome outcome)
{
    QMutexLocker locker(&m_mutex);
    switch (outcome) {
    case FileOutcome::Downloaded:
        ++m_stats.downloaded;
        break;
    case FileOutcome::Skipped:
        ++m_stats.skipped;
        break;
    case FileOutcome::Failed:
        ++m_stats.failed;
        break;
    }
}

} // namespace Sync
