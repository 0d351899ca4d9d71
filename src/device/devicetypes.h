#ifndef DEVICETYPES_H
#define DEVICETYPES_H

#include <QString>
#include <QDateTime>
#include <QList>
#include <QMetaType>
#include <functional>

/**
 * @file devicetypes.h
 * @brief Value types exchanged with the recorder transport
 */

/**
 * @brief Recorder hardware models
 */
enum class DeviceModel {
    H1,         ///< Desk dock
    H1E,        ///< Desk dock, economy
    P1,         ///< Portable, battery powered
    P1Mini,     ///< Portable mini, battery powered
    Unknown
};

/**
 * @brief Recording mode tag reported per file
 */
enum class RecordingMode {
    Unknown,
    Call,
    Room,
    Whisper
};

QString deviceModelName(DeviceModel model);
DeviceModel deviceModelFromName(const QString &name);

/**
 * @brief Map a USB product id to a model
 *
 * Unknown product ids map to DeviceModel::Unknown.
 */
DeviceModel deviceModelForProductId(quint16 productId);

/**
 * @brief Battery telemetry is only available on the portable models
 */
bool deviceModelSupportsBattery(DeviceModel model);

QString recordingModeName(RecordingMode mode);
RecordingMode recordingModeFromName(const QString &name);

/**
 * @brief One live connection to a recorder
 *
 * Invalid (empty serial) while disconnected.
 */
struct DeviceSession {
    QString serialNumber;
    DeviceModel model = DeviceModel::Unknown;
    QString firmwareVersion;
    quint32 firmwareNumber = 0;
    bool supportsBattery = false;

    bool isValid() const { return !serialNumber.isEmpty(); }
};

/**
 * @brief File descriptor enumerated from the device
 */
struct RemoteFileEntry {
    QString filename;
    qint64 size = 0;
    int durationSeconds = 0;
    QDateTime createdAt;        ///< Invalid when the device did not report one
    RecordingMode mode = RecordingMode::Unknown;
};

enum class BatteryState {
    Charging,
    Discharging,
    Full,
    Unknown
};

BatteryState batteryStateFromName(const QString &name);
QString batteryStateName(BatteryState state);

struct BatteryStatus {
    int percentage = 0;
    BatteryState state = BatteryState::Unknown;
};

struct StorageInfo {
    qint64 totalBytes = 0;
    qint64 freeBytes = 0;

    qint64 usedBytes() const { return totalBytes - freeBytes; }
};

/**
 * @brief Error classes reported by the transport
 */
enum class TransportError {
    None,
    NotConnected,       ///< No active session
    OperationFailed,    ///< Driver reported a failure
    Cancelled           ///< Caller's cancel check fired mid-operation
};

/**
 * @brief Result of a serialized device operation
 */
template<typename T>
struct TransportResult {
    T value{};
    TransportError error = TransportError::None;
    QString errorMessage;

    bool ok() const { return error == TransportError::None; }

    static TransportResult success(const T &v) {
        TransportResult r;
        r.value = v;
        return r;
    }

    static TransportResult failure(TransportError e, const QString &message) {
        TransportResult r;
        r.error = e;
        r.errorMessage = message;
        return r;
    }
};

using TransportStatus = TransportResult<bool>;

/// (bytesDone, bytesTotal) for the file currently being transferred
using ProgressCallback = std::function<void(qint64, qint64)>;

/// Returns true when the caller wants the operation abandoned
using CancelCheck = std::function<bool()>;

Q_DECLARE_METATYPE(DeviceSession)
Q_DECLARE_METATYPE(RemoteFileEntry)
Q_DECLARE_METATYPE(BatteryStatus)
Q_DECLARE_METATYPE(StorageInfo)

#endif // DEVICETYPES_H
