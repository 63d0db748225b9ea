#include "commandtranslator.h"

#include <QLoggingCategory>

#include "valuecodec.h"

Q_LOGGING_CATEGORY(commandLog, "hmbridge.engine.commands")

namespace hmbridge {

CommandTranslator::CommandTranslator(const DeviceRegistry &registry)
    : m_registry(registry)
{
}

CommandTranslation CommandTranslator::translate(const InboundMessage &message) const
{
    CommandTranslation result;

    const std::optional<DatapointRef> target = m_registry.reverseLookup(message.topic);
    if (!target) {
        result.error = ErrorKind::UnresolvedTopic;
        result.errorString = QStringLiteral("No datapoint for topic %1").arg(message.topic);
        return result;
    }

    // The index is rebuilt on every membership change, so a resolved target
    // always has a registered channel.
    const std::optional<Channel> channel = m_registry.lookup(target->address, target->channel);
    const DatapointSpec *spec = channel ? channel->role->datapointById(target->datapoint) : nullptr;
    if (!spec) {
        result.error = ErrorKind::UnknownChannel;
        result.errorString = QStringLiteral("Unknown channel %1:%2").arg(target->address).arg(target->channel);
        return result;
    }

    if (!spec->isWritable()) {
        result.error = ErrorKind::NotWritable;
        result.errorString = QStringLiteral("%1:%2 %3 is read-only")
                                 .arg(target->address)
                                 .arg(target->channel)
                                 .arg(spec->id);
        return result;
    }

    QString key;
    QVariant rawValue;
    QString errorString;
    if (!decodeCommandPayload(*spec, message.payload, key, rawValue, errorString)) {
        result.error = ErrorKind::DomainViolation;
        result.errorString = QStringLiteral("%1:%2 %3").arg(target->address).arg(target->channel).arg(errorString);
        return result;
    }

    result.command.address = target->address;
    result.command.channel = target->channel;
    result.command.key = key;
    result.command.value = rawValue;
    result.command.messageId = message.messageId;

    qCDebug(commandLog).noquote()
        << "Command" << result.command.address << result.command.channel
        << key << "=" << rawValue.toString() << "from mid" << message.messageId;
    return result;
}

} // namespace hmbridge
