#ifndef SETTINGS_H
#define SETTINGS_H

#include <QString>
#include <QList>
#include <QStringList>
#include <QSettings>

#include "device/connectionsupervisor.h"  // For RetryPolicy

/**
 * @brief Global application settings manager using QSettings
 *
 * Uses QSettings for platform-appropriate storage:
 *   - Linux: ~/.config/QDockSync/QDockSync.conf
 *   - Windows: Registry
 *   - macOS: plist
 *
 * Command line options override these values for a single run; they are
 * never written back. `qdocksync config` edits them persistently.
 */
class Settings
{
public:
    static Settings& instance();

    // ========== Storage Settings ==========

    // Directory recordings are stored in
    QString storageDirectory() const;
    void setStorageDirectory(const QString &path);

    // Catalog file (JSON)
    QString catalogPath() const;
    void setCatalogPath(const QString &path);

    // ========== Device Settings ==========

    // Mount point / directory of the recorder
    QString deviceDirectory() const;
    void setDeviceDirectory(const QString &path);

    // ========== Connection Settings ==========

    int maxRetryAttempts() const;
    void setMaxRetryAttempts(int attempts);

    QList<int> connectBackoffMs() const;
    void setConnectBackoffMs(const QList<int> &schedule);

    int verifyAttempts() const;
    void setVerifyAttempts(int attempts);

    QList<int> verifyBackoffMs() const;
    void setVerifyBackoffMs(const QList<int> &schedule);

    // Policy assembled from the four values above
    RetryPolicy retryPolicy() const;

    // ========== Battery Settings ==========

    int batteryPollIntervalMs() const;
    void setBatteryPollIntervalMs(int ms);

    // ========== Advanced Settings ==========

    bool debugLogging() const;
    void setDebugLogging(bool enabled);

    // ========== Command Line Access ==========

    // Keys accepted by setFromString(), e.g. "storage/directory"
    static QStringList keys();

    // Current value of @p key as text, empty for an unknown key
    QString valueAsString(const QString &key) const;

    /**
     * @brief Parse @p value and store it under @p key
     *
     * @param error Receives a message when the key is unknown or the
     *              value does not parse
     */
    bool setFromString(const QString &key, const QString &value, QString *error = nullptr);

    // Force sync to disk
    void sync();

private:
    Settings();
    ~Settings() = default;
    Settings(const Settings&) = delete;
    Settings& operator=(const Settings&) = delete;

    static QList<int> parseSchedule(const QString &value, const QList<int> &fallback);
    static QString formatSchedule(const QList<int> &schedule);

    mutable QSettings m_settings;
};

#endif // SETTINGS_H
