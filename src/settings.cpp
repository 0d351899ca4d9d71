#include "settings.h"
#include <QDir>
#include <QStandardPaths>

Settings& Settings::instance()
{
    static Settings instance;
    return instance;
}

Settings::Settings()
    : m_settings("QDockSync", "QDockSync")
{
}

// ========== Storage Settings ==========

QString Settings::storageDirectory() const
{
    const QString base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    return m_settings.value("storage/directory",
                            QDir(base).filePath("Recordings")).toString();
}

void Settings::setStorageDirectory(const QString &path)
{
    m_settings.setValue("storage/directory", QDir::cleanPath(path));
}

QString Settings::catalogPath() const
{
    const QString base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    return m_settings.value("storage/catalogPath",
                            QDir(base).filePath("catalog.json")).toString();
}

void Settings::setCatalogPath(const QString &path)
{
    m_settings.setValue("storage/catalogPath", QDir::cleanPath(path));
}

// ========== Device Settings ==========

QString Settings::deviceDirectory() const
{
    return m_settings.value("device/directory", QString()).toString();
}

void Settings::setDeviceDirectory(const QString &path)
{
    m_settings.setValue("device/directory", QDir::cleanPath(path));
}

// ========== Connection Settings ==========

int Settings::maxRetryAttempts() const
{
    return qMax(1, m_settings.value("connection/maxRetryAttempts", RetryPolicy().maxAttempts).toInt());
}

void Settings::setMaxRetryAttempts(int attempts)
{
    m_settings.setValue("connection/maxRetryAttempts", attempts);
}

QList<int> Settings::connectBackoffMs() const
{
    return parseSchedule(m_settings.value("connection/backoffMs").toString(),
                         RetryPolicy().connectBackoffMs);
}

void Settings::setConnectBackoffMs(const QList<int> &schedule)
{
    m_settings.setValue("connection/backoffMs", formatSchedule(schedule));
}

int Settings::verifyAttempts() const
{
    return qMax(1, m_settings.value("connection/verifyAttempts", RetryPolicy().verifyAttempts).toInt());
}

void Settings::setVerifyAttempts(int attempts)
{
    m_settings.setValue("connection/verifyAttempts", attempts);
}

QList<int> Settings::verifyBackoffMs() const
{
    return parseSchedule(m_settings.value("connection/verifyBackoffMs").toString(),
                         RetryPolicy().verifyBackoffMs);
}

void Settings::setVerifyBackoffMs(const QList<int> &schedule)
{
    m_settings.setValue("connection/verifyBackoffMs", formatSchedule(schedule));
}

RetryPolicy Settings::retryPolicy() const
{
    RetryPolicy policy;
    policy.maxAttempts = maxRetryAttempts();
    policy.connectBackoffMs = connectBackoffMs();
    policy.verifyAttempts = verifyAttempts();
    policy.verifyBackoffMs = verifyBackoffMs();
    return policy;
}

// Schedules are stored as "1000,2000,4000"
QList<int> Settings::parseSchedule(const QString &value, const QList<int> &fallback)
{
    if (value.trimmed().isEmpty()) return fallback;

    QList<int> schedule;
    const QStringList parts = value.split(',', Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        bool ok = false;
        int ms = part.trimmed().toInt(&ok);
        if (!ok || ms < 0) {
            return fallback;
        }
        schedule.append(ms);
    }
    return schedule.isEmpty() ? fallback : schedule;
}

QString Settings::formatSchedule(const QList<int> &schedule)
{
    QStringList parts;
    for (int ms : schedule) {
        parts.append(QString::number(ms));
    }
    return parts.join(',');
}

// ========== Battery Settings ==========

int Settings::batteryPollIntervalMs() const
{
    return qMax(1000, m_settings.value("battery/pollIntervalMs", 30000).toInt());
}

void Settings::setBatteryPollIntervalMs(int ms)
{
    m_settings.setValue("battery/pollIntervalMs", ms);
}

// ========== Advanced Settings ==========

bool Settings::debugLogging() const
{
    return m_settings.value("advanced/debugLogging", false).toBool();
}

void Settings::setDebugLogging(bool enabled)
{
    m_settings.setValue("advanced/debugLogging", enabled);
}

// ========== Command Line Access ==========

QStringList Settings::keys()
{
    return {
        "storage/directory",
        "storage/catalogPath",
        "device/directory",
        "connection/maxRetryAttempts",
        "connection/backoffMs",
        "connection/verifyAttempts",
        "connection/verifyBackoffMs",
        "battery/pollIntervalMs",
        "advanced/debugLogging"
    };
}

QString Settings::valueAsString(const QString &key) const
{
    if (key == "storage/directory") return storageDirectory();
    if (key == "storage/catalogPath") return catalogPath();
    if (key == "device/directory") return deviceDirectory();
    if (key == "connection/maxRetryAttempts") return QString::number(maxRetryAttempts());
    if (key == "connection/backoffMs") return formatSchedule(connectBackoffMs());
    if (key == "connection/verifyAttempts") return QString::number(verifyAttempts());
    if (key == "connection/verifyBackoffMs") return formatSchedule(verifyBackoffMs());
    if (key == "battery/pollIntervalMs") return QString::number(batteryPollIntervalMs());
    if (key == "advanced/debugLogging") return debugLogging() ? "true" : "false";
    return QString();
}

bool Settings::setFromString(const QString &key, const QString &value, QString *error)
{
    auto fail = [error](const QString &message) {
        if (error) *error = message;
        return false;
    };

    if (!keys().contains(key)) {
        return fail(QString("Unknown setting: %1").arg(key));
    }

    if (key == "storage/directory" || key == "storage/catalogPath" || key == "device/directory") {
        if (value.trimmed().isEmpty()) {
            return fail(QString("%1 needs a path").arg(key));
        }
        const QString path = QDir(value).absolutePath();
        if (key == "storage/directory") setStorageDirectory(path);
        else if (key == "storage/catalogPath") setCatalogPath(path);
        else setDeviceDirectory(path);
        return true;
    }

    if (key == "connection/backoffMs" || key == "connection/verifyBackoffMs") {
        const QList<int> schedule = parseSchedule(value, QList<int>());
        if (schedule.isEmpty()) {
            return fail(QString("%1 needs comma separated milliseconds, e.g. 1000,2000,4000").arg(key));
        }
        if (key == "connection/backoffMs") setConnectBackoffMs(schedule);
        else setVerifyBackoffMs(schedule);
        return true;
    }

    if (key == "advanced/debugLogging") {
        const QString flag = value.trimmed().toLower();
        if (flag == "true" || flag == "1" || flag == "on") setDebugLogging(true);
        else if (flag == "false" || flag == "0" || flag == "off") setDebugLogging(false);
        else return fail(QString("%1 needs true or false").arg(key));
        return true;
    }

    bool ok = false;
    const int number = value.trimmed().toInt(&ok);
    const int minimum = (key == "battery/pollIntervalMs") ? 1000 : 1;
    if (!ok || number < minimum) {
        return fail(QString("%1 needs a number of at least %2").arg(key).arg(minimum));
    }

    if (key == "connection/maxRetryAttempts") setMaxRetryAttempts(number);
    else if (key == "connection/verifyAttempts") setVerifyAttempts(number);
    else setBatteryPollIntervalMs(number);
    return true;
}

void Settings::sync()
{
    m_settings.sync();
}
