#pragma once

#include <QQueue>
#include <QString>
#include <QStringList>

#include "bridgetypes.h"
#include "commandtranslator.h"
#include "deviceregistry.h"
#include "discoverypublisher.h"
#include "eventtranslator.h"
#include "statecache.h"

namespace hmbridge {

struct EngineStats {
    quint64 eventsProcessed   = 0;
    quint64 eventsRejected    = 0;
    quint64 eventsOverflowed  = 0;
    quint64 triggers          = 0;
    quint64 commandsAccepted  = 0;
    quint64 commandsRejected  = 0;
};

// Coordinates registry, cache, translators and discovery. Performs no I/O:
// every operation returns the publishes or commands the caller has to carry out.
class BridgeEngine
{
public:
    static constexpr int DefaultQueueCapacity = 1024;

    explicit BridgeEngine(const TopicScheme &topics = TopicScheme(),
                          int queueCapacity = DefaultQueueCapacity);

    BridgeEngine(const BridgeEngine &) = delete;
    BridgeEngine &operator=(const BridgeEngine &) = delete;

    bool registerInventory(const Inventory &inventory, QString &errorString);

    // Membership changes at runtime. Returned publishes announce or retract
    // the affected devices.
    PublishList addDevices(const Inventory &inventory);
    PublishList removeDevices(const QStringList &addresses);

    bool enqueueEvent(const RawEvent &event, QString &errorString);
    PublishList processPendingEvents();
    int pendingEvents() const { return m_queue.size(); }
    int queueCapacity() const { return m_queueCapacity; }

    CommandTranslation translateCommand(const InboundMessage &message);

    // While paused, queued events are kept but not drained.
    void setPaused(bool paused);
    bool isPaused() const { return m_paused; }

    // Discovery configs followed by the retained state of every cached datapoint.
    PublishList republish() const;

    const DeviceRegistry &registry() const { return m_registry; }
    const StateCache &cache() const { return m_cache; }
    const TopicScheme &topics() const { return m_registry.topics(); }
    EngineStats stats() const { return m_stats; }

private:
    DeviceRegistry m_registry;
    StateCache m_cache;
    EventTranslator m_events;
    CommandTranslator m_commands;
    DiscoveryPublisher m_discovery;

    QQueue<RawEvent> m_queue;
    int m_queueCapacity = DefaultQueueCapacity;
    bool m_paused = false;
    EngineStats m_stats;
};

} // namespace hmbridge
