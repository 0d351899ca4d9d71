#ifndef HOTPLUGMONITOR_H
#define HOTPLUGMONITOR_H

#include <QObject>
#include <QString>

class QTimer;

/**
 * @brief Observer for recorder attach/detach events
 *
 * Emits deviceAttached() with the USB product id when a recorder appears
 * and deviceDetached() when it goes away. ConnectionSupervisor reacts to
 * both.
 */
class HotplugMonitor : public QObject
{
    Q_OBJECT

public:
    explicit HotplugMonitor(QObject *parent = nullptr);
    virtual ~HotplugMonitor();

    virtual void start() = 0;
    virtual void stop() = 0;
    virtual bool isRunning() const = 0;

signals:
    void deviceAttached(quint64 deviceId, quint16 productId);
    void deviceDetached(quint64 deviceId);
};

/**
 * @brief Polls for a local device directory
 *
 * Treats the appearance of the directory as an attach and its removal as
 * a detach. Identity comes from the directory's device.json.
 */
class DirectoryHotplugMonitor : public HotplugMonitor
{
    Q_OBJECT

public:
    explicit DirectoryHotplugMonitor(const QString &devicePath, QObject *parent = nullptr);
    ~DirectoryHotplugMonitor() override;

    /**
     * @brief Poll interval in milliseconds (default 1000)
     */
    void setPollInterval(int intervalMs);

    void start() override;
    void stop() override;
    bool isRunning() const override;

    bool isAttached() const { return m_attached; }

public slots:
    /**
     * @brief Check the directory once and emit on a transition
     */
    void checkNow();

private:
    QString m_devicePath;
    QTimer *m_timer = nullptr;
    int m_pollIntervalMs = 1000;
    bool m_attached = false;
    quint64 m_attachedId = 0;
};

#endif // HOTPLUGMONITOR_H
