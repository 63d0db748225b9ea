#pragma once

#include "bridgetypes.h"
#include "deviceregistry.h"
#include "statecache.h"

namespace hmbridge {

// Turns controller parameter changes into normalized events and the MQTT
// publishes that follow from them. Sole writer of the State Cache.
class EventTranslator
{
public:
    EventTranslator(const DeviceRegistry &registry, StateCache &cache);

    EventTranslation translate(const RawEvent &rawEvent);

    // Channel attributes and retained state of every cached datapoint, e.g.
    // after a broker restart.
    PublishList retainedState() const;

    void forgetDevice(const QString &address);

private:
    void appendAvailability(const QString &address, const QVariant &unreach, PublishList &publishes) const;
    void appendAttributes(const Channel &channel, const RawEvent &rawEvent, PublishList &publishes);
    void appendAggregate(const Channel &channel, qint64 tsMs, EventTranslation &result);

    const DeviceRegistry &m_registry;
    StateCache &m_cache;
};

} // namespace hmbridge
