#include "devicetypes.h"

QString deviceModelName(DeviceModel model)
{
    switch (model) {
    case DeviceModel::H1:     return "hidock-h1";
    case DeviceModel::H1E:    return "hidock-h1e";
    case DeviceModel::P1:     return "hidock-p1";
    case DeviceModel::P1Mini: return "hidock-p1:mini";
    case DeviceModel::Unknown:
        break;
    }
    return "unknown";
}

DeviceModel deviceModelFromName(const QString &name)
{
    const QString n = name.trimmed().toLower();
    if (n == "hidock-h1")       return DeviceModel::H1;
    if (n == "hidock-h1e")      return DeviceModel::H1E;
    if (n == "hidock-p1")       return DeviceModel::P1;
    if (n == "hidock-p1:mini")  return DeviceModel::P1Mini;
    return DeviceModel::Unknown;
}

DeviceModel deviceModelForProductId(quint16 productId)
{
    switch (productId) {
    case 45068: case 256: case 258:
        return DeviceModel::H1;
    case 45069: case 257: case 259:
        return DeviceModel::H1E;
    case 45070: case 8256:
        return DeviceModel::P1;
    case 45071: case 8257:
        return DeviceModel::P1Mini;
    default:
        return DeviceModel::Unknown;
    }
}

bool deviceModelSupportsBattery(DeviceModel model)
{
    return model == DeviceModel::P1 || model == DeviceModel::P1Mini;
}

QString recordingModeName(RecordingMode mode)
{
    switch (mode) {
    case RecordingMode::Call:    return "call";
    case RecordingMode::Room:    return "room";
    case RecordingMode::Whisper: return "whisper";
    case RecordingMode::Unknown:
        break;
    }
    return QString();
}

RecordingMode recordingModeFromName(const QString &name)
{
    const QString n = name.trimmed().toLower();
    if (n == "call")    return RecordingMode::Call;
    if (n == "room")    return RecordingMode::Room;
    if (n == "whisper") return RecordingMode::Whisper;
    return RecordingMode::Unknown;
}

BatteryState batteryStateFromName(const QString &name)
{
    // Device firmware reports "idle" while running on battery
    const QString n = name.trimmed().toLower();
    if (n == "charging") return BatteryState::Charging;
    if (n == "idle" || n == "discharging") return BatteryState::Discharging;
    if (n == "full")     return BatteryState::Full;
    return BatteryState::Unknown;
}

QString batteryStateName(BatteryState state)
{
    switch (state) {
    case BatteryState::Charging:    return "charging";
    case BatteryState::Discharging: return "discharging";
    case BatteryState::Full:        return "full";
    case BatteryState::Unknown:
        break;
    }
    return "unknown";
}
