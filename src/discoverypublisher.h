#pragma once

#include <QByteArray>
#include <QList>
#include <QString>

#include "bridgetypes.h"
#include "deviceregistry.h"

namespace hmbridge {

struct DiscoveryConfig {
    QString    topic;
    QByteArray payload;

    bool operator==(const DiscoveryConfig &other) const
    {
        return topic == other.topic && payload == other.payload;
    }
};

using DiscoveryConfigList = QList<DiscoveryConfig>;

// Builds Home Assistant MQTT discovery payloads. Generation is pure: the same
// registry always produces the same list, byte for byte.
class DiscoveryPublisher
{
public:
    DiscoveryConfigList generate(const DeviceRegistry &registry) const;
    DiscoveryConfigList generate(const DeviceRegistry &registry, const RegisteredDevice &device) const;

    PublishList publishAll(const DeviceRegistry &registry) const;

    // Empty retained payloads that remove a device from the consumer.
    PublishList retractDevice(const DeviceRegistry &registry, const RegisteredDevice &device) const;
};

} // namespace hmbridge
