#include "synctypes.h"

#include <QLocale>

namespace Sync {

QString syncStatusName(SyncStatus status)
{
    switch (status) {
    case SyncStatus::LocalOnly:    return "localOnly";
    case SyncStatus::OnDeviceOnly: return "onDeviceOnly";
    case SyncStatus::Synced:       return "synced";
    }
    return QString();
}

SyncStatus syncStatusFromName(const QString &name)
{
    if (name == "synced")       return SyncStatus::Synced;
    if (name == "onDeviceOnly") return SyncStatus::OnDeviceOnly;
    return SyncStatus::LocalOnly;
}

QString importStateName(ImportState state)
{
    switch (state) {
    case ImportState::Idle:      return "Idle";
    case ImportState::Preparing: return "Preparing";
    case ImportState::Importing: return "Importing";
    case ImportState::Stopping:  return "Stopping";
    }
    return QString();
}

QString ImportStats::summary() const
{
    return QString("%1 file(s): %2 downloaded, %3 skipped, %4 failed")
        .arg(total).arg(downloaded).arg(skipped).arg(failed);
}

double ImportProgress::fraction() const
{
    if (totalBytesExpected <= 0) {
        return 0.0;
    }
    return qBound(0.0, double(totalBytesImported) / double(totalBytesExpected), 1.0);
}

QString ImportProgress::formattedSpeed() const
{
    if (bytesPerSecond <= 0.0) {
        return "--";
    }
    return QLocale().formattedDataSize(qint64(bytesPerSecond)) + "/s";
}

QString ImportProgress::formattedTimeRemaining() const
{
    if (estimatedSecondsRemaining < 0.0) {
        return "Calculating...";
    }

    const qint64 seconds = qint64(estimatedSecondsRemaining + 0.5);
    if (seconds < 60) {
        return QString("%1 sec").arg(seconds);
    }
    if (seconds < 3600) {
        return QString("%1 min %2 sec").arg(seconds / 60).arg(seconds % 60);
    }
    return QString("%1 hr %2 min").arg(seconds / 3600).arg((seconds % 3600) / 60);
}

QString ImportProgress::formattedBytes() const
{
    const QLocale locale;
    return QString("%1 of %2").arg(locale.formattedDataSize(totalBytesImported),
                                   locale.formattedDataSize(totalBytesExpected));
}

} // namespace Sync
