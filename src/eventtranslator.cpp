#include "eventtranslator.h"

#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>

#include "valuecodec.h"

Q_LOGGING_CATEGORY(eventLog, "hmbridge.engine.events")

namespace {

QByteArray attributesPayload(const QVariantMap &attributes)
{
    return QJsonDocument(QJsonObject::fromVariantMap(attributes)).toJson(QJsonDocument::Compact);
}

}

namespace hmbridge {

EventTranslator::EventTranslator(const DeviceRegistry &registry, StateCache &cache)
    : m_registry(registry)
    , m_cache(cache)
{
}

EventTranslation EventTranslator::translate(const RawEvent &rawEvent)
{
    EventTranslation result;

    const std::optional<Channel> channel = m_registry.lookup(rawEvent.address, rawEvent.channel);
    if (!channel) {
        result.error = ErrorKind::UnknownChannel;
        result.errorString = QStringLiteral("Unknown channel %1:%2").arg(rawEvent.address).arg(rawEvent.channel);
        return result;
    }

    const DatapointSpec *spec = channel->role->datapointByKey(rawEvent.key);
    if (!spec || !spec->isEventing()) {
        result.error = ErrorKind::UnknownDatapoint;
        result.errorString = QStringLiteral("%1:%2 (%3) does not report %4")
                                 .arg(rawEvent.address)
                                 .arg(rawEvent.channel)
                                 .arg(channel->role->type, rawEvent.key);
        // Undeclared parameters still show up in the channel attributes.
        appendAttributes(*channel, rawEvent, result.publishes);
        return result;
    }

    QVariant normalized;
    QString errorString;
    if (!normalizeRawValue(*spec, rawEvent.rawValue, normalized, errorString)) {
        result.error = ErrorKind::DomainViolation;
        result.errorString = QStringLiteral("%1:%2 %3").arg(rawEvent.address).arg(rawEvent.channel).arg(errorString);
        return result;
    }

    Event event;
    event.address = channel->address;
    event.channel = channel->index;
    event.datapoint = spec->id;
    event.value = normalized;
    event.tsMs = rawEvent.tsMs;

    const TopicScheme &topics = m_registry.topics();
    const QByteArray payload = encodeStatePayload(*spec, normalized);

    // Button presses carry no state; every report is a trigger.
    if (spec->momentary) {
        event.trigger = true;
        result.events.push_back(event);
        appendAttributes(*channel, rawEvent, result.publishes);
        result.publishes.push_back({ topics.triggerTopic(event.address, event.channel, event.datapoint), payload, false });
        qCInfo(eventLog).noquote() << "Trigger" << event.address << event.channel << event.datapoint;
        return result;
    }

    const StateTransition transition = m_cache.apply(event, spec->domain.initialValue());
    result.events.push_back(event);

    result.publishes.push_back({ topics.stateTopic(event.address, event.channel, event.datapoint), payload, true });

    if (spec->availability)
        appendAvailability(event.address, normalized, result.publishes);
    if (spec->problemFlag)
        appendAggregate(*channel, rawEvent.tsMs, result);
    appendAttributes(*channel, rawEvent, result.publishes);

    if (transition.transitioned && spec->trigger) {
        Event trigger = event;
        trigger.trigger = true;
        result.events.push_back(trigger);
        result.publishes.push_back({ topics.triggerTopic(event.address, event.channel, event.datapoint), payload, false });
        qCInfo(eventLog).noquote()
            << "Trigger" << event.address << event.channel << event.datapoint
            << transition.previous.toString() << "->" << normalized.toString();
    }

    qCDebug(eventLog).noquote()
        << "Event" << event.address << event.channel << event.datapoint
        << "value" << QString::fromUtf8(payload)
        << (transition.transitioned ? "changed" : "unchanged");
    return result;
}

PublishList EventTranslator::retainedState() const
{
    PublishList publishes;
    const TopicScheme &topics = m_registry.topics();

    const auto attributes = m_cache.attributeEntries();
    for (const auto &entry : attributes) {
        if (!m_registry.lookup(entry.first.address, entry.first.channel))
            continue;
        publishes.push_back({ topics.attributesTopic(entry.first.address, entry.first.channel),
                              attributesPayload(entry.second),
                              true });
    }

    const auto entries = m_cache.entries();
    for (const auto &entry : entries) {
        const DatapointKey &key = entry.first;
        const std::optional<Channel> channel = m_registry.lookup(key.address, key.channel);
        if (!channel)
            continue;
        const DatapointSpec *spec = channel->role->datapointById(key.datapoint);
        if (!spec)
            continue;
        publishes.push_back({ topics.stateTopic(key.address, key.channel, key.datapoint),
                              encodeStatePayload(*spec, entry.second.value),
                              true });
        if (spec->availability)
            appendAvailability(key.address, entry.second.value, publishes);
    }
    return publishes;
}

void EventTranslator::forgetDevice(const QString &address)
{
    m_cache.removeDevice(address);
}

void EventTranslator::appendAvailability(const QString &address,
                                         const QVariant &unreach,
                                         PublishList &publishes) const
{
    const QByteArray payload = unreach.toBool() ? QByteArrayLiteral("offline") : QByteArrayLiteral("online");
    publishes.push_back({ m_registry.topics().availabilityTopic(address), payload, true });
}

void EventTranslator::appendAttributes(const Channel &channel, const RawEvent &rawEvent, PublishList &publishes)
{
    if (!m_cache.applyAttribute(channel.address, channel.index, rawEvent.key, rawEvent.rawValue))
        return;
    publishes.push_back({ m_registry.topics().attributesTopic(channel.address, channel.index),
                          attributesPayload(m_cache.attributes(channel.address, channel.index)),
                          true });
}

// The aggregate is set while any flag of the channel differs from its
// initial value; flags never reported count as clear.
void EventTranslator::appendAggregate(const Channel &channel, qint64 tsMs, EventTranslation &result)
{
    const DatapointSpec *aggregate = channel.role->aggregateDatapoint();
    if (!aggregate)
        return;

    bool set = false;
    for (const DatapointSpec &dp : channel.role->datapoints) {
        if (!dp.problemFlag)
            continue;
        const StateEntry entry = m_cache.value(channel.address, channel.index, dp.id);
        if (entry.hasValue && entry.value != dp.domain.initialValue()) {
            set = true;
            break;
        }
    }

    Event event;
    event.address = channel.address;
    event.channel = channel.index;
    event.datapoint = aggregate->id;
    event.value = set;
    event.tsMs = tsMs;
    m_cache.apply(event, aggregate->domain.initialValue());
    result.events.push_back(event);
    result.publishes.push_back({ m_registry.topics().stateTopic(event.address, event.channel, event.datapoint),
                                 encodeStatePayload(*aggregate, event.value),
                                 true });
}

} // namespace hmbridge
