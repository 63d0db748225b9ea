#include "bridgeengine.h"

#include <QLoggingCategory>
#include <QSet>

Q_LOGGING_CATEGORY(engineLog, "hmbridge.engine")

namespace hmbridge {

BridgeEngine::BridgeEngine(const TopicScheme &topics, int queueCapacity)
    : m_registry(topics)
    , m_events(m_registry, m_cache)
    , m_commands(m_registry)
    , m_queueCapacity(queueCapacity > 0 ? queueCapacity : DefaultQueueCapacity)
{
}

bool BridgeEngine::registerInventory(const Inventory &inventory, QString &errorString)
{
    if (!m_registry.registerInventory(inventory, errorString)) {
        qCCritical(engineLog).noquote() << errorKindName(ErrorKind::MalformedInventory) << errorString;
        return false;
    }
    // Cached values of devices that are gone must not be republished.
    QSet<QString> vanished;
    const auto entries = m_cache.entries();
    for (const auto &entry : entries) {
        if (!m_registry.device(entry.first.address))
            vanished.insert(entry.first.address);
    }
    const auto attributes = m_cache.attributeEntries();
    for (const auto &entry : attributes) {
        if (!m_registry.device(entry.first.address))
            vanished.insert(entry.first.address);
    }
    for (const QString &address : std::as_const(vanished))
        m_events.forgetDevice(address);
    return true;
}

PublishList BridgeEngine::addDevices(const Inventory &inventory)
{
    PublishList publishes;
    const QStringList added = m_registry.addDevices(inventory);
    for (const QString &address : added) {
        const RegisteredDevice *device = m_registry.device(address);
        if (!device)
            continue;
        const DiscoveryConfigList configs = m_discovery.generate(m_registry, *device);
        for (const DiscoveryConfig &config : configs)
            publishes.push_back({ config.topic, config.payload, true });
    }
    if (!added.isEmpty())
        qCInfo(engineLog).noquote() << "Added devices" << added.join(QStringLiteral(", "));
    return publishes;
}

PublishList BridgeEngine::removeDevices(const QStringList &addresses)
{
    PublishList publishes;
    for (const QString &address : addresses) {
        const RegisteredDevice *device = m_registry.device(address.trimmed());
        if (!device)
            continue;
        publishes.append(m_discovery.retractDevice(m_registry, *device));
    }
    const QStringList removed = m_registry.removeDevices(addresses);
    for (const QString &address : removed)
        m_events.forgetDevice(address);
    return publishes;
}

bool BridgeEngine::enqueueEvent(const RawEvent &event, QString &errorString)
{
    if (m_queue.size() >= m_queueCapacity) {
        ++m_stats.eventsOverflowed;
        errorString = QStringLiteral("%1: event queue full (%2), rejecting %3:%4 %5")
                          .arg(QString::fromLatin1(errorKindName(ErrorKind::QueueOverflow)))
                          .arg(m_queueCapacity)
                          .arg(event.address)
                          .arg(event.channel)
                          .arg(event.key);
        qCWarning(engineLog).noquote() << errorString;
        return false;
    }
    m_queue.enqueue(event);
    return true;
}

PublishList BridgeEngine::processPendingEvents()
{
    PublishList publishes;
    while (!m_paused && !m_queue.isEmpty()) {
        const RawEvent raw = m_queue.dequeue();
        const EventTranslation result = m_events.translate(raw);
        publishes.append(result.publishes);
        if (!result.ok()) {
            ++m_stats.eventsRejected;
            if (result.error == ErrorKind::UnknownDatapoint)
                qCDebug(engineLog).noquote() << errorKindName(result.error) << result.errorString;
            else
                qCWarning(engineLog).noquote() << errorKindName(result.error) << result.errorString;
            continue;
        }
        ++m_stats.eventsProcessed;
        for (const Event &event : result.events) {
            if (event.trigger)
                ++m_stats.triggers;
        }
    }
    return publishes;
}

CommandTranslation BridgeEngine::translateCommand(const InboundMessage &message)
{
    CommandTranslation result = m_commands.translate(message);
    if (result.ok()) {
        ++m_stats.commandsAccepted;
    } else {
        ++m_stats.commandsRejected;
        qCWarning(engineLog).noquote() << errorKindName(result.error) << result.errorString;
    }
    return result;
}

void BridgeEngine::setPaused(bool paused)
{
    if (m_paused == paused)
        return;
    m_paused = paused;
    qCDebug(engineLog) << (paused ? "Paused" : "Resumed") << "with" << m_queue.size() << "queued events";
}

PublishList BridgeEngine::republish() const
{
    PublishList publishes = m_discovery.publishAll(m_registry);
    publishes.append(m_events.retainedState());
    return publishes;
}

} // namespace hmbridge
