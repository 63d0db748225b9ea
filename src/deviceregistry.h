#pragma once

#include <QHash>
#include <QList>
#include <QMap>
#include <QString>
#include <QStringList>

#include <optional>

#include "bridgetypes.h"
#include "devicetypes.h"
#include "topics.h"

namespace hmbridge {

struct Channel {
    QString address;
    int     index = 0;
    const DeviceTypeDescriptor *type = nullptr;
    const ChannelRole *role = nullptr;
    QString firmware;

    bool isValid() const { return type && role; }
};

struct RegisteredDevice {
    QString address;
    QString firmware;
    const DeviceTypeDescriptor *type = nullptr;
    QList<Channel> channels;
};

struct RejectedDevice {
    InventoryEntry entry;
    ErrorKind reason = ErrorKind::None;
    QString   detail;
};

class DeviceRegistry
{
public:
    explicit DeviceRegistry(const TopicScheme &topics = TopicScheme());

    // Replaces the registry contents. Fails only on an empty or malformed
    // inventory; unsupported and conflicting devices are recorded and skipped.
    bool registerInventory(const Inventory &inventory, QString &errorString);

    // Runtime membership changes; both rebuild the reverse index.
    QStringList addDevices(const Inventory &inventory);
    QStringList removeDevices(const QStringList &addresses);

    std::optional<Channel> lookup(const QString &address, int channel) const;
    std::optional<DatapointRef> reverseLookup(const QString &topic) const;

    const RegisteredDevice *device(const QString &address) const;
    QList<RegisteredDevice> devices() const;
    QList<Channel> channels() const;
    QList<RejectedDevice> unsupported() const { return m_unsupported; }
    QList<RejectedDevice> conflicts() const { return m_conflicts; }
    bool isEmpty() const { return m_devices.isEmpty(); }
    int deviceCount() const { return m_devices.size(); }

    const TopicScheme &topics() const { return m_topics; }

private:
    bool admit(const InventoryEntry &entry);
    void reject(QList<RejectedDevice> &records, const RejectedDevice &rejected);
    void rebuildIndex();
    QStringList commandTopicsFor(const RegisteredDevice &device) const;

    TopicScheme m_topics;
    QMap<QString, RegisteredDevice> m_devices;     // Sorted by address
    QHash<QString, DatapointRef> m_commandIndex;
    QList<RejectedDevice> m_unsupported;
    QList<RejectedDevice> m_conflicts;
};

} // namespace hmbridge
