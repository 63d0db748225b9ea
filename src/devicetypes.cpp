#include "devicetypes.h"

namespace {

using namespace hmbridge;

ValueDomain boolDomain()
{
    ValueDomain domain;
    domain.kind = ValueKind::Bool;
    return domain;
}

ValueDomain enumDomain(const QStringList &labels)
{
    ValueDomain domain;
    domain.kind = ValueKind::Enum;
    domain.enumLabels = labels;
    domain.minValue = 0.0;
    domain.maxValue = labels.size() - 1;
    return domain;
}

ValueDomain numberDomain(double minValue, double maxValue, double rawScale, int decimals)
{
    ValueDomain domain;
    domain.kind = ValueKind::Number;
    domain.minValue = minValue;
    domain.maxValue = maxValue;
    domain.rawScale = rawScale;
    domain.decimals = decimals;
    return domain;
}

ValueDomain statusDomain()
{
    return enumDomain({ QStringLiteral("normal"),
                        QStringLiteral("unknown"),
                        QStringLiteral("overflow"),
                        QStringLiteral("underflow") });
}

// Maintenance parameter that is only reported through the problem indicator
// and the channel attributes.
DatapointSpec flagDatapoint(const QString &key, const QString &label, const ValueDomain &domain)
{
    DatapointSpec dp;
    dp.key = key;
    dp.id = key.toLower();
    dp.label = label;
    dp.domain = domain;
    dp.access = DatapointAccessState;
    dp.problemFlag = true;
    return dp;
}

DatapointSpec unreachDatapoint()
{
    DatapointSpec dp = flagDatapoint(QStringLiteral("UNREACH"), QStringLiteral("Unreachable"), boolDomain());
    dp.availability = true;
    return dp;
}

DatapointSpec problemDatapoint()
{
    DatapointSpec dp;
    dp.id = QStringLiteral("problem");
    dp.label = QStringLiteral("Problem");
    dp.domain = boolDomain();
    dp.access = DatapointAccessState;
    dp.aggregate = true;
    dp.component = ComponentKind::BinarySensor;
    dp.deviceClass = QStringLiteral("problem");
    return dp;
}

DatapointSpec lowBatteryDatapoint()
{
    DatapointSpec dp;
    dp.key = QStringLiteral("LOW_BAT");
    dp.id = QStringLiteral("low_bat");
    dp.label = QStringLiteral("Battery");
    dp.domain = boolDomain();
    dp.access = DatapointAccessState;
    dp.problemFlag = true;
    dp.component = ComponentKind::BinarySensor;
    dp.deviceClass = QStringLiteral("battery");
    return dp;
}

DatapointSpec operatingVoltageDatapoint()
{
    DatapointSpec dp;
    dp.key = QStringLiteral("OPERATING_VOLTAGE");
    dp.id = QStringLiteral("operating_voltage");
    dp.label = QStringLiteral("Battery voltage");
    dp.domain = numberDomain(0.0, 25.2, 1.0, 2);
    dp.access = DatapointAccessState;
    dp.component = ComponentKind::Sensor;
    dp.deviceClass = QStringLiteral("voltage");
    dp.unit = QStringLiteral("V");
    return dp;
}

ChannelRole maintenanceChannel(bool battery)
{
    ChannelRole role;
    role.index = 0;
    role.type = QStringLiteral("MAINTENANCE");
    role.label = QStringLiteral("Maintenance");
    role.datapoints.push_back(unreachDatapoint());
    if (battery) {
        role.datapoints.push_back(lowBatteryDatapoint());
        role.datapoints.push_back(operatingVoltageDatapoint());
    }
    role.datapoints.push_back(flagDatapoint(QStringLiteral("CONFIG_PENDING"), QStringLiteral("Configuration pending"), boolDomain()));
    role.datapoints.push_back(flagDatapoint(QStringLiteral("DUTY_CYCLE"), QStringLiteral("Duty cycle"), boolDomain()));
    role.datapoints.push_back(flagDatapoint(QStringLiteral("ERROR_CODE"), QStringLiteral("Error code"), numberDomain(0.0, 255.0, 1.0, 0)));
    role.datapoints.push_back(flagDatapoint(QStringLiteral("ERROR_OVERHEAT"), QStringLiteral("Overheated"), boolDomain()));
    role.datapoints.push_back(flagDatapoint(QStringLiteral("SABOTAGE"), QStringLiteral("Sabotage"), boolDomain()));
    role.datapoints.push_back(flagDatapoint(QStringLiteral("OPERATING_VOLTAGE_STATUS"), QStringLiteral("Voltage status"), statusDomain()));
    role.datapoints.push_back(flagDatapoint(QStringLiteral("ACTUAL_TEMPERATURE_STATUS"), QStringLiteral("Temperature status"), statusDomain()));
    role.datapoints.push_back(flagDatapoint(QStringLiteral("TIME_OF_OPERATION_STATUS"), QStringLiteral("Operating time status"), statusDomain()));
    role.datapoints.push_back(problemDatapoint());
    return role;
}

DatapointSpec pressDatapoint(const QString &key, const QString &label, const QString &triggerType)
{
    DatapointSpec dp;
    dp.key = key;
    dp.id = key.toLower();
    dp.label = label;
    dp.domain = boolDomain();
    dp.access = DatapointAccessFlag::AccessEvent;
    dp.trigger = true;
    dp.momentary = true;
    dp.triggerType = triggerType;
    return dp;
}

ChannelRole keyChannel(int index)
{
    ChannelRole role;
    role.index = index;
    role.type = QStringLiteral("KEY_TRANSCEIVER");
    role.label = QStringLiteral("Button %1").arg(index);
    role.datapoints.push_back(pressDatapoint(QStringLiteral("PRESS_SHORT"), QStringLiteral("Short press"),
                                             QStringLiteral("button_short_press")));
    role.datapoints.push_back(pressDatapoint(QStringLiteral("PRESS_LONG"), QStringLiteral("Long press"),
                                             QStringLiteral("button_long_press")));
    return role;
}

// HmIP-BROLL: channels 1 and 2 are the local up/down buttons, channel 3
// reports the physical position, channel 4 is the virtual receiver that
// accepts movement commands.
DeviceTypeDescriptor shutterActuator()
{
    DeviceTypeDescriptor desc;
    desc.model = DeviceModel::ShutterActuator;
    desc.modelName = QStringLiteral("HmIP-BROLL");
    desc.manufacturer = QStringLiteral("eQ-3");
    desc.channels.push_back(maintenanceChannel(false));
    desc.channels.push_back(keyChannel(1));
    desc.channels.push_back(keyChannel(2));

    ChannelRole transmitter;
    transmitter.index = 3;
    transmitter.type = QStringLiteral("SHUTTER_TRANSMITTER");
    transmitter.label = QStringLiteral("Shutter position");
    {
        DatapointSpec level;
        level.key = QStringLiteral("LEVEL");
        level.id = QStringLiteral("level");
        level.label = QStringLiteral("Position");
        level.domain = numberDomain(0.0, 100.0, 100.0, 0);
        level.access = DatapointAccessState;
        level.component = ComponentKind::Sensor;
        level.unit = QStringLiteral("%");
        transmitter.datapoints.push_back(level);
    }
    desc.channels.push_back(transmitter);

    ChannelRole receiver;
    receiver.index = 4;
    receiver.type = QStringLiteral("SHUTTER_VIRTUAL_RECEIVER");
    receiver.label = QStringLiteral("Shutter");
    {
        DatapointSpec level;
        level.key = QStringLiteral("LEVEL");
        level.id = QStringLiteral("level");
        level.label = QStringLiteral("Shutter");
        level.domain = numberDomain(0.0, 100.0, 100.0, 0);
        level.access = DatapointAccessControl;
        level.component = ComponentKind::Cover;
        level.deviceClass = QStringLiteral("shutter");
        level.feedbackChannel = 3;
        level.movementId = QStringLiteral("movement");
        receiver.datapoints.push_back(level);

        DatapointSpec movement;
        movement.key = QStringLiteral("LEVEL");
        movement.id = QStringLiteral("movement");
        movement.label = QStringLiteral("Movement");
        movement.domain = enumDomain({ QStringLiteral("up"), QStringLiteral("down"), QStringLiteral("stop") });
        movement.access = DatapointAccessFlag::AccessWrite;
        movement.commands = {
            { QStringLiteral("up"), QStringLiteral("LEVEL"), 1.0 },
            { QStringLiteral("down"), QStringLiteral("LEVEL"), 0.0 },
            { QStringLiteral("stop"), QStringLiteral("STOP"), true }
        };
        receiver.datapoints.push_back(movement);
    }
    desc.channels.push_back(receiver);
    return desc;
}

DeviceTypeDescriptor windowHandle()
{
    DeviceTypeDescriptor desc;
    desc.model = DeviceModel::WindowHandle;
    desc.modelName = QStringLiteral("HmIP-SRH");
    desc.manufacturer = QStringLiteral("eQ-3");
    desc.channels.push_back(maintenanceChannel(true));

    ChannelRole handle;
    handle.index = 1;
    handle.type = QStringLiteral("ROTARY_HANDLE_TRANSCEIVER");
    handle.label = QStringLiteral("Window handle");
    {
        DatapointSpec state;
        state.key = QStringLiteral("STATE");
        state.id = QStringLiteral("state");
        state.label = QStringLiteral("Window handle");
        state.domain = enumDomain({ QStringLiteral("closed"), QStringLiteral("tilted"), QStringLiteral("open") });
        state.access = DatapointAccessState;
        state.trigger = true;
        state.component = ComponentKind::Sensor;
        state.deviceClass = QStringLiteral("enum");
        handle.datapoints.push_back(state);
    }
    desc.channels.push_back(handle);
    return desc;
}

DeviceTypeDescriptor smokeAlarm()
{
    DeviceTypeDescriptor desc;
    desc.model = DeviceModel::SmokeAlarm;
    desc.modelName = QStringLiteral("HmIP-SWSD");
    desc.manufacturer = QStringLiteral("eQ-3");
    desc.channels.push_back(maintenanceChannel(true));

    ChannelRole detector;
    detector.index = 1;
    detector.type = QStringLiteral("SMOKE_DETECTOR");
    detector.label = QStringLiteral("Smoke detector");
    {
        DatapointSpec alarm;
        alarm.key = QStringLiteral("ALARM");
        alarm.id = QStringLiteral("alarm");
        alarm.label = QStringLiteral("Smoke alarm");
        alarm.domain = boolDomain();
        alarm.access = DatapointAccessState;
        alarm.trigger = true;
        alarm.component = ComponentKind::BinarySensor;
        alarm.deviceClass = QStringLiteral("smoke");
        detector.datapoints.push_back(alarm);

        DatapointSpec status;
        status.key = QStringLiteral("SMOKE_DETECTOR_ALARM_STATUS");
        status.id = QStringLiteral("alarm_status");
        status.label = QStringLiteral("Alarm status");
        status.domain = enumDomain({ QStringLiteral("off"),
                                     QStringLiteral("primary"),
                                     QStringLiteral("intrusion"),
                                     QStringLiteral("secondary") });
        status.access = DatapointAccessState;
        status.component = ComponentKind::Sensor;
        status.deviceClass = QStringLiteral("enum");
        detector.datapoints.push_back(status);
    }
    desc.channels.push_back(detector);
    return desc;
}

}

namespace hmbridge {

QString componentName(ComponentKind kind)
{
    switch (kind) {
    case ComponentKind::Sensor:
        return QStringLiteral("sensor");
    case ComponentKind::BinarySensor:
        return QStringLiteral("binary_sensor");
    case ComponentKind::Cover:
        return QStringLiteral("cover");
    case ComponentKind::Trigger:
        return QStringLiteral("device_automation");
    case ComponentKind::None:
        break;
    }
    return QString();
}

QVariant ValueDomain::initialValue() const
{
    switch (kind) {
    case ValueKind::Bool:
        return false;
    case ValueKind::Enum:
        return enumLabels.isEmpty() ? QVariant() : QVariant(enumLabels.first());
    case ValueKind::Number:
        if (decimals == 0)
            return static_cast<qint64>(minValue);
        return minValue;
    }
    return QVariant();
}

const DatapointSpec *ChannelRole::datapointByKey(const QString &key) const
{
    for (const DatapointSpec &dp : datapoints) {
        // Movement datapoints share the controller key of the value they drive.
        if (!dp.commands.isEmpty())
            continue;
        if (dp.key == key)
            return &dp;
    }
    return nullptr;
}

const DatapointSpec *ChannelRole::datapointById(const QString &id) const
{
    for (const DatapointSpec &dp : datapoints) {
        if (dp.id == id)
            return &dp;
    }
    return nullptr;
}

const DatapointSpec *ChannelRole::aggregateDatapoint() const
{
    for (const DatapointSpec &dp : datapoints) {
        if (dp.aggregate)
            return &dp;
    }
    return nullptr;
}

const ChannelRole *DeviceTypeDescriptor::channel(int index) const
{
    for (const ChannelRole &role : channels) {
        if (role.index == index)
            return &role;
    }
    return nullptr;
}

const DatapointSpec *DeviceTypeDescriptor::availabilityDatapoint(int *channelIndex) const
{
    for (const ChannelRole &role : channels) {
        for (const DatapointSpec &dp : role.datapoints) {
            if (!dp.availability)
                continue;
            if (channelIndex)
                *channelIndex = role.index;
            return &dp;
        }
    }
    return nullptr;
}

const QList<DeviceTypeDescriptor> &deviceTypes()
{
    static const QList<DeviceTypeDescriptor> kTypes = {
        shutterActuator(),
        windowHandle(),
        smokeAlarm()
    };
    return kTypes;
}

const DeviceTypeDescriptor *findDeviceType(const QString &modelName)
{
    const QString wanted = modelName.trimmed();
    for (const DeviceTypeDescriptor &desc : deviceTypes()) {
        if (desc.modelName.compare(wanted, Qt::CaseInsensitive) == 0)
            return &desc;
    }
    return nullptr;
}

const DeviceTypeDescriptor *findDeviceType(DeviceModel model)
{
    for (const DeviceTypeDescriptor &desc : deviceTypes()) {
        if (desc.model == model)
            return &desc;
    }
    return nullptr;
}

} // namespace hmbridge
