#include "topics.h"

namespace {

QString trimTopic(const QString &topic, const QString &fallback)
{
    QString out = topic.trimmed();
    while (out.endsWith(QLatin1Char('/')))
        out.chop(1);
    return out.isEmpty() ? fallback : out;
}

}

namespace hmbridge {

TopicScheme::TopicScheme(const QString &topicNamespace, const QString &discoveryPrefix)
    : m_namespace(trimTopic(topicNamespace, QStringLiteral("Homematic")))
    , m_discoveryPrefix(trimTopic(discoveryPrefix, QStringLiteral("homeassistant")))
{
}

QString TopicScheme::stateTopic(const QString &address, int channel, const QString &datapoint) const
{
    return QStringLiteral("%1/%2/%3/%4").arg(m_namespace, address, QString::number(channel), datapoint);
}

QString TopicScheme::commandTopic(const QString &address, int channel, const QString &datapoint) const
{
    return stateTopic(address, channel, datapoint) + QStringLiteral("/set");
}

QString TopicScheme::triggerTopic(const QString &address, int channel, const QString &datapoint) const
{
    return stateTopic(address, channel, datapoint) + QStringLiteral("/trigger");
}

QString TopicScheme::availabilityTopic(const QString &address) const
{
    return QStringLiteral("%1/%2/availability").arg(m_namespace, address);
}

QString TopicScheme::attributesTopic(const QString &address, int channel) const
{
    return QStringLiteral("%1/%2/%3/attributes").arg(m_namespace, address, QString::number(channel));
}

QString TopicScheme::discoveryTopic(const QString &component,
                                    const QString &address,
                                    int channel,
                                    const QString &datapoint) const
{
    return QStringLiteral("%1/%2/%3_%4/%5/config")
        .arg(m_discoveryPrefix, component, address, QString::number(channel), datapoint);
}

QString TopicScheme::commandSubscription() const
{
    return QStringLiteral("%1/+/+/+/set").arg(m_namespace);
}

bool TopicScheme::isValidSegment(const QString &segment)
{
    if (segment.trimmed().isEmpty() || segment.trimmed() != segment)
        return false;
    for (const QChar c : segment) {
        if (c == QLatin1Char('/') || c == QLatin1Char('+') || c == QLatin1Char('#'))
            return false;
        if (c.unicode() < 0x20)
            return false;
    }
    return true;
}

} // namespace hmbridge
