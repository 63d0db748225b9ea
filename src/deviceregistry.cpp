#include "deviceregistry.h"

#include <QLoggingCategory>
#include <QSet>

Q_LOGGING_CATEGORY(registryLog, "hmbridge.registry")

namespace {

bool validateEntry(const hmbridge::InventoryEntry &entry, QString &errorString)
{
    if (entry.address.trimmed().isEmpty()) {
        errorString = QStringLiteral("inventory entry without address");
        return false;
    }
    if (entry.model.trimmed().isEmpty()) {
        errorString = QStringLiteral("inventory entry %1 without model").arg(entry.address);
        return false;
    }
    if (entry.channelCount < 1) {
        errorString = QStringLiteral("inventory entry %1 has invalid channel count %2")
                          .arg(entry.address)
                          .arg(entry.channelCount);
        return false;
    }
    return true;
}

}

namespace hmbridge {

DeviceRegistry::DeviceRegistry(const TopicScheme &topics)
    : m_topics(topics)
{
}

bool DeviceRegistry::registerInventory(const Inventory &inventory, QString &errorString)
{
    errorString.clear();
    if (inventory.isEmpty()) {
        errorString = QStringLiteral("device inventory is empty");
        return false;
    }
    for (const InventoryEntry &entry : inventory) {
        if (!validateEntry(entry, errorString))
            return false;
    }

    m_devices.clear();
    m_commandIndex.clear();
    m_unsupported.clear();
    m_conflicts.clear();

    for (const InventoryEntry &entry : inventory)
        admit(entry);
    rebuildIndex();

    qCInfo(registryLog) << "Registered" << m_devices.size() << "devices,"
                        << m_unsupported.size() << "unsupported,"
                        << m_conflicts.size() << "conflicting";
    if (m_devices.isEmpty())
        qCWarning(registryLog) << "No supported devices in inventory of" << inventory.size() << "entries";
    return true;
}

QStringList DeviceRegistry::addDevices(const Inventory &inventory)
{
    QStringList added;
    for (const InventoryEntry &entry : inventory) {
        QString errorString;
        if (!validateEntry(entry, errorString)) {
            qCWarning(registryLog) << "Ignoring new device:" << errorString;
            continue;
        }
        if (m_devices.contains(entry.address.trimmed())) {
            qCDebug(registryLog) << "Device" << entry.address << "already registered";
            continue;
        }
        if (admit(entry))
            added.push_back(entry.address.trimmed());
    }
    if (!added.isEmpty())
        rebuildIndex();
    return added;
}

QStringList DeviceRegistry::removeDevices(const QStringList &addresses)
{
    QStringList removed;
    for (const QString &address : addresses) {
        if (m_devices.remove(address.trimmed()) > 0) {
            qCInfo(registryLog) << "Device" << address << "removed";
            removed.push_back(address.trimmed());
        }
    }
    if (!removed.isEmpty())
        rebuildIndex();
    return removed;
}

std::optional<Channel> DeviceRegistry::lookup(const QString &address, int channel) const
{
    const auto it = m_devices.constFind(address);
    if (it == m_devices.constEnd())
        return std::nullopt;
    for (const Channel &entry : it.value().channels) {
        if (entry.index == channel)
            return entry;
    }
    return std::nullopt;
}

std::optional<DatapointRef> DeviceRegistry::reverseLookup(const QString &topic) const
{
    const auto it = m_commandIndex.constFind(topic);
    if (it == m_commandIndex.constEnd())
        return std::nullopt;
    return it.value();
}

const RegisteredDevice *DeviceRegistry::device(const QString &address) const
{
    const auto it = m_devices.constFind(address);
    if (it == m_devices.constEnd())
        return nullptr;
    return &it.value();
}

QList<RegisteredDevice> DeviceRegistry::devices() const
{
    return m_devices.values();
}

QList<Channel> DeviceRegistry::channels() const
{
    QList<Channel> out;
    for (const RegisteredDevice &device : m_devices)
        out.append(device.channels);
    return out;
}

bool DeviceRegistry::admit(const InventoryEntry &entry)
{
    const QString address = entry.address.trimmed();

    if (!TopicScheme::isValidSegment(address)) {
        reject(m_conflicts, { entry, ErrorKind::RegistrationConflict,
                              QStringLiteral("address is not a valid topic segment") });
        return false;
    }

    const DeviceTypeDescriptor *type = findDeviceType(entry.model);
    if (!type) {
        reject(m_unsupported, { entry, ErrorKind::None, QStringLiteral("unsupported model %1").arg(entry.model) });
        return false;
    }

    if (m_devices.contains(address)) {
        reject(m_conflicts, { entry, ErrorKind::RegistrationConflict, QStringLiteral("address already registered") });
        return false;
    }

    RegisteredDevice device;
    device.address = address;
    device.firmware = entry.firmware.trimmed();
    device.type = type;
    for (const ChannelRole &role : type->channels) {
        if (role.index >= entry.channelCount)
            continue;
        Channel channel;
        channel.address = address;
        channel.index = role.index;
        channel.type = type;
        channel.role = &role;
        channel.firmware = device.firmware;
        device.channels.push_back(channel);
    }
    if (device.channels.isEmpty()) {
        reject(m_unsupported, { entry, ErrorKind::None,
                                QStringLiteral("only %1 channels, none supported").arg(entry.channelCount) });
        return false;
    }

    const QStringList topics = commandTopicsFor(device);
    const QSet<QString> unique(topics.cbegin(), topics.cend());
    bool collides = unique.size() != topics.size();
    for (const QString &topic : topics) {
        if (collides)
            break;
        collides = m_commandIndex.contains(topic);
    }
    if (collides) {
        reject(m_conflicts, { entry, ErrorKind::RegistrationConflict,
                              QStringLiteral("command topics collide with a registered device") });
        return false;
    }

    for (const Channel &channel : device.channels) {
        for (const DatapointSpec &dp : channel.role->datapoints) {
            m_commandIndex.insert(m_topics.commandTopic(address, channel.index, dp.id),
                                  DatapointRef{ address, channel.index, dp.id });
        }
    }
    qCInfo(registryLog) << "Device" << address << "registered as" << type->modelName
                        << "with" << device.channels.size() << "channels";
    m_devices.insert(address, device);
    return true;
}

// One record per address; a device announced again through newDevices
// replaces its earlier record.
void DeviceRegistry::reject(QList<RejectedDevice> &records, const RejectedDevice &rejected)
{
    const QString address = rejected.entry.address.trimmed();
    for (RejectedDevice &existing : records) {
        if (existing.entry.address.trimmed() == address) {
            qCDebug(registryLog).noquote() << "Device" << address << "still rejected:" << rejected.detail;
            existing = rejected;
            return;
        }
    }
    qCWarning(registryLog).noquote() << "Rejecting device" << address << ":" << rejected.detail;
    records.push_back(rejected);
}

void DeviceRegistry::rebuildIndex()
{
    m_commandIndex.clear();
    for (const RegisteredDevice &device : m_devices) {
        for (const Channel &channel : device.channels) {
            for (const DatapointSpec &dp : channel.role->datapoints) {
                m_commandIndex.insert(m_topics.commandTopic(device.address, channel.index, dp.id),
                                      DatapointRef{ device.address, channel.index, dp.id });
            }
        }
    }
}

QStringList DeviceRegistry::commandTopicsFor(const RegisteredDevice &device) const
{
    QStringList topics;
    for (const Channel &channel : device.channels) {
        for (const DatapointSpec &dp : channel.role->datapoints)
            topics.push_back(m_topics.commandTopic(device.address, channel.index, dp.id));
    }
    return topics;
}

} // namespace hmbridge
