#pragma once

#include <QHash>
#include <QList>
#include <QMap>
#include <QPair>
#include <QReadWriteLock>
#include <QString>
#include <QVariant>

#include "bridgetypes.h"

namespace hmbridge {

struct DatapointKey {
    QString address;
    int     channel = 0;
    QString datapoint;

    bool operator==(const DatapointKey &other) const
    {
        return channel == other.channel && address == other.address && datapoint == other.datapoint;
    }
};

size_t qHash(const DatapointKey &key, size_t seed = 0) noexcept;

struct StateEntry {
    QVariant value;
    qint64   tsMs = 0;
    bool     hasValue = false;
};

struct ChannelKey {
    QString address;
    int     channel = 0;

    bool operator==(const ChannelKey &other) const
    {
        return channel == other.channel && address == other.address;
    }
};

size_t qHash(const ChannelKey &key, size_t seed = 0) noexcept;

struct StateTransition {
    StateEntry entry;
    QVariant   previous;
    bool       transitioned = false;
};

// Last observed value per (address, channel, datapoint). The Event Translator
// is the only writer; readers may run on other threads.
class StateCache
{
public:
    // `initialValue` stands in for the previous value when the datapoint has
    // never been observed. An invalid initial value makes the first
    // observation a transition.
    StateTransition apply(const Event &event, const QVariant &initialValue = QVariant());

    StateEntry value(const QString &address, int channel, const QString &datapoint) const;
    QList<QPair<DatapointKey, StateEntry>> entries() const;

    // Raw parameters per channel, keyed by lower-cased parameter name.
    // Returns false when the value was already recorded.
    bool applyAttribute(const QString &address, int channel, const QString &key, const QVariant &rawValue);
    QVariantMap attributes(const QString &address, int channel) const;
    QList<QPair<ChannelKey, QVariantMap>> attributeEntries() const;

    void removeDevice(const QString &address);

    int size() const;
    bool isEmpty() const { return size() == 0; }

private:
    mutable QReadWriteLock m_lock;
    QHash<DatapointKey, StateEntry> m_entries;
    QHash<ChannelKey, QVariantMap> m_attributes;
};

} // namespace hmbridge
