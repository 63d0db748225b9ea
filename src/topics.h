#pragma once

#include <QString>

namespace hmbridge {

// Core-owned MQTT topic layout.
class TopicScheme
{
public:
    explicit TopicScheme(const QString &topicNamespace = QStringLiteral("Homematic"),
                         const QString &discoveryPrefix = QStringLiteral("homeassistant"));

    QString topicNamespace() const { return m_namespace; }
    QString discoveryPrefix() const { return m_discoveryPrefix; }

    QString stateTopic(const QString &address, int channel, const QString &datapoint) const;
    QString commandTopic(const QString &address, int channel, const QString &datapoint) const;
    QString triggerTopic(const QString &address, int channel, const QString &datapoint) const;
    QString availabilityTopic(const QString &address) const;
    // JSON object with every raw parameter reported for the channel.
    QString attributesTopic(const QString &address, int channel) const;
    QString discoveryTopic(const QString &component,
                           const QString &address,
                           int channel,
                           const QString &datapoint) const;

    // Filter matching every command topic of this namespace.
    QString commandSubscription() const;

    static bool isValidSegment(const QString &segment);

private:
    QString m_namespace;
    QString m_discoveryPrefix;
};

} // namespace hmbridge
