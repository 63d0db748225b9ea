#include "discoverypublisher.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(discoveryLog, "hmbridge.engine.discovery")

namespace {

using namespace hmbridge;

QJsonObject deviceBlock(const RegisteredDevice &device)
{
    QJsonObject block;
    block.insert(QStringLiteral("identifiers"), QJsonArray{ device.address });
    block.insert(QStringLiteral("name"), QStringLiteral("%1_%2").arg(device.type->modelName, device.address));
    block.insert(QStringLiteral("manufacturer"), device.type->manufacturer);
    block.insert(QStringLiteral("model"), device.type->modelName);
    if (!device.firmware.isEmpty())
        block.insert(QStringLiteral("sw_version"), device.firmware);
    return block;
}

QString uniqueId(const QString &address, int channel, const QString &datapoint)
{
    return QStringLiteral("Homematic-%1_%2-%3").arg(address).arg(channel).arg(datapoint);
}

QString availabilityTopicFor(const DeviceRegistry &registry, const RegisteredDevice &device)
{
    int channelIndex = -1;
    if (!device.type->availabilityDatapoint(&channelIndex))
        return QString();
    if (!registry.lookup(device.address, channelIndex))
        return QString();
    return registry.topics().availabilityTopic(device.address);
}

QByteArray toPayload(const QJsonObject &object)
{
    return QJsonDocument(object).toJson(QJsonDocument::Compact);
}

void appendCoverFields(const DeviceRegistry &registry,
                       const Channel &channel,
                       const DatapointSpec &spec,
                       QJsonObject &config)
{
    const TopicScheme &topics = registry.topics();
    const QString &address = channel.address;

    int positionChannel = channel.index;
    if (spec.feedbackChannel >= 0 && registry.lookup(address, spec.feedbackChannel))
        positionChannel = spec.feedbackChannel;
    config.insert(QStringLiteral("position_topic"), topics.stateTopic(address, positionChannel, spec.id));
    config.insert(QStringLiteral("set_position_topic"), topics.commandTopic(address, channel.index, spec.id));
    config.insert(QStringLiteral("position_open"), 100);
    config.insert(QStringLiteral("position_closed"), 0);

    const DatapointSpec *movement = spec.movementId.isEmpty() ? nullptr : channel.role->datapointById(spec.movementId);
    if (movement && movement->isWritable()) {
        config.insert(QStringLiteral("command_topic"), topics.commandTopic(address, channel.index, movement->id));
        for (const CommandMapping &mapping : movement->commands) {
            if (mapping.label == QLatin1String("up"))
                config.insert(QStringLiteral("payload_open"), mapping.label);
            else if (mapping.label == QLatin1String("down"))
                config.insert(QStringLiteral("payload_close"), mapping.label);
            else if (mapping.label == QLatin1String("stop"))
                config.insert(QStringLiteral("payload_stop"), mapping.label);
        }
    } else {
        config.insert(QStringLiteral("command_topic"), QJsonValue::Null);
    }
}

DiscoveryConfig entityConfig(const DeviceRegistry &registry,
                             const RegisteredDevice &device,
                             const Channel &channel,
                             const DatapointSpec &spec,
                             const QString &availabilityTopic)
{
    const TopicScheme &topics = registry.topics();

    QJsonObject config;
    config.insert(QStringLiteral("name"),
                  QStringLiteral("%1 %2 %3:%4")
                      .arg(device.type->modelName, spec.label, device.address)
                      .arg(channel.index));
    config.insert(QStringLiteral("unique_id"), uniqueId(device.address, channel.index, spec.id));
    config.insert(QStringLiteral("device"), deviceBlock(device));
    if (!availabilityTopic.isEmpty())
        config.insert(QStringLiteral("availability_topic"), availabilityTopic);
    if (!spec.deviceClass.isEmpty())
        config.insert(QStringLiteral("device_class"), spec.deviceClass);
    if (!spec.unit.isEmpty())
        config.insert(QStringLiteral("unit_of_measurement"), spec.unit);
    config.insert(QStringLiteral("json_attributes_topic"), topics.attributesTopic(device.address, channel.index));

    if (spec.component == ComponentKind::Cover) {
        appendCoverFields(registry, channel, spec, config);
    } else {
        config.insert(QStringLiteral("state_topic"), topics.stateTopic(device.address, channel.index, spec.id));
        if (spec.isWritable())
            config.insert(QStringLiteral("command_topic"), topics.commandTopic(device.address, channel.index, spec.id));
        if (spec.domain.kind == ValueKind::Bool) {
            config.insert(QStringLiteral("payload_on"), QStringLiteral("ON"));
            config.insert(QStringLiteral("payload_off"), QStringLiteral("OFF"));
        } else if (spec.domain.kind == ValueKind::Enum && spec.component == ComponentKind::Sensor) {
            config.insert(QStringLiteral("options"), QJsonArray::fromStringList(spec.domain.enumLabels));
        }
    }

    return { topics.discoveryTopic(componentName(spec.component), device.address, channel.index, spec.id),
             toPayload(config) };
}

DiscoveryConfig triggerConfig(const DeviceRegistry &registry,
                              const RegisteredDevice &device,
                              const Channel &channel,
                              const DatapointSpec &spec)
{
    const TopicScheme &topics = registry.topics();

    QJsonObject config;
    config.insert(QStringLiteral("automation_type"), QStringLiteral("trigger"));
    config.insert(QStringLiteral("topic"), topics.triggerTopic(device.address, channel.index, spec.id));
    config.insert(QStringLiteral("type"), spec.triggerType.isEmpty() ? spec.id : spec.triggerType);
    const QString subtype = spec.momentary ? QStringLiteral("button_%1") : QStringLiteral("channel_%1");
    config.insert(QStringLiteral("subtype"), subtype.arg(channel.index));
    config.insert(QStringLiteral("device"), deviceBlock(device));

    return { topics.discoveryTopic(componentName(ComponentKind::Trigger), device.address, channel.index, spec.id),
             toPayload(config) };
}

}

namespace hmbridge {

DiscoveryConfigList DiscoveryPublisher::generate(const DeviceRegistry &registry) const
{
    DiscoveryConfigList configs;
    const QList<RegisteredDevice> devices = registry.devices();
    for (const RegisteredDevice &device : devices)
        configs.append(generate(registry, device));
    return configs;
}

DiscoveryConfigList DiscoveryPublisher::generate(const DeviceRegistry &registry,
                                                 const RegisteredDevice &device) const
{
    DiscoveryConfigList configs;
    if (!device.type)
        return configs;

    const QString availabilityTopic = availabilityTopicFor(registry, device);
    for (const Channel &channel : device.channels) {
        for (const DatapointSpec &spec : channel.role->datapoints) {
            if (spec.component != ComponentKind::None)
                configs.push_back(entityConfig(registry, device, channel, spec, availabilityTopic));
            if (spec.trigger)
                configs.push_back(triggerConfig(registry, device, channel, spec));
        }
    }
    return configs;
}

PublishList DiscoveryPublisher::publishAll(const DeviceRegistry &registry) const
{
    PublishList publishes;
    const DiscoveryConfigList configs = generate(registry);
    publishes.reserve(configs.size());
    for (const DiscoveryConfig &config : configs)
        publishes.push_back({ config.topic, config.payload, true });
    qCInfo(discoveryLog) << "Announcing" << configs.size() << "entities for"
                         << registry.deviceCount() << "devices";
    return publishes;
}

PublishList DiscoveryPublisher::retractDevice(const DeviceRegistry &registry,
                                              const RegisteredDevice &device) const
{
    PublishList publishes;
    const DiscoveryConfigList configs = generate(registry, device);
    for (const DiscoveryConfig &config : configs)
        publishes.push_back({ config.topic, QByteArray(), true });
    qCInfo(discoveryLog).noquote() << "Retracting" << configs.size() << "entities of" << device.address;
    return publishes;
}

} // namespace hmbridge
