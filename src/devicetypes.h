#pragma once

#include <QFlags>
#include <QList>
#include <QString>
#include <QStringList>
#include <QVariant>

namespace hmbridge {

// Closed set of supported physical models.
enum class DeviceModel : quint8 {
    ShutterActuator = 1,    // HmIP-BROLL
    WindowHandle    = 2,    // HmIP-SRH
    SmokeAlarm      = 3     // HmIP-SWSD
};

enum class ValueKind : quint8 {
    Bool,
    Enum,
    Number
};

enum class DatapointAccessFlag : quint8 {
    AccessNone  = 0x00,
    AccessRead  = 0x01,
    AccessWrite = 0x02,
    AccessEvent = 0x04
};
Q_DECLARE_FLAGS(DatapointAccess, DatapointAccessFlag)
Q_DECLARE_OPERATORS_FOR_FLAGS(DatapointAccess)

inline constexpr DatapointAccess DatapointAccessState =
    DatapointAccessFlag::AccessRead
    | DatapointAccessFlag::AccessEvent;

inline constexpr DatapointAccess DatapointAccessControl =
    DatapointAccessFlag::AccessRead
    | DatapointAccessFlag::AccessWrite
    | DatapointAccessFlag::AccessEvent;

// Home Assistant entity shape a datapoint is announced as.
enum class ComponentKind : quint8 {
    None,           // Not announced on its own
    Sensor,
    BinarySensor,
    Cover,
    Trigger
};

QString componentName(ComponentKind kind);

struct ValueDomain {
    ValueKind   kind = ValueKind::Bool;
    QStringList enumLabels;     // Index == controller code
    double      minValue = 0.0; // Normalized units
    double      maxValue = 0.0;
    double      rawScale = 1.0; // normalized = raw * rawScale
    int         decimals = 0;

    // Value a datapoint is assumed to hold before its first event.
    QVariant initialValue() const;
};

// Write-only enumeration label mapped onto a concrete controller write.
struct CommandMapping {
    QString  label;
    QString  key;
    QVariant rawValue;
};

struct DatapointSpec {
    QString         key;            // Controller parameter, e.g. "LEVEL"
    QString         id;             // Normalized topic segment, e.g. "level"
    QString         label;
    ValueDomain     domain;
    DatapointAccess access = DatapointAccessFlag::AccessNone;
    bool            trigger = false;
    bool            momentary = false;      // Trigger on every event; no state is kept
    QString         triggerType;            // Device trigger type, the id when empty
    bool            availability = false;   // UNREACH style flag, true == offline
    bool            problemFlag = false;    // Feeds the channel's aggregate datapoint
    bool            aggregate = false;      // Set while any problemFlag datapoint is set
    ComponentKind   component = ComponentKind::None;
    QString         deviceClass;
    QString         unit;
    int             feedbackChannel = -1;   // Cover position is reported on another channel
    QString         movementId;             // Cover open/close/stop datapoint
    QList<CommandMapping> commands;

    bool isReadable() const { return access.testFlag(DatapointAccessFlag::AccessRead); }
    bool isWritable() const { return access.testFlag(DatapointAccessFlag::AccessWrite); }
    bool isEventing() const { return access.testFlag(DatapointAccessFlag::AccessEvent); }
};

struct ChannelRole {
    int     index = 0;
    QString type;                   // Controller channel type, e.g. "SMOKE_DETECTOR"
    QString label;
    QList<DatapointSpec> datapoints;

    const DatapointSpec *datapointByKey(const QString &key) const;
    const DatapointSpec *datapointById(const QString &id) const;
    const DatapointSpec *aggregateDatapoint() const;
};

struct DeviceTypeDescriptor {
    DeviceModel model = DeviceModel::SmokeAlarm;
    QString     modelName;
    QString     manufacturer;
    QList<ChannelRole> channels;

    const ChannelRole *channel(int index) const;
    const DatapointSpec *availabilityDatapoint(int *channelIndex = nullptr) const;
};

const QList<DeviceTypeDescriptor> &deviceTypes();
const DeviceTypeDescriptor *findDeviceType(const QString &modelName);
const DeviceTypeDescriptor *findDeviceType(DeviceModel model);

} // namespace hmbridge
