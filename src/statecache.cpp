#include "statecache.h"

#include <QHash>
#include <QReadWriteLock>

#include <algorithm>

namespace hmbridge {

size_t qHash(const DatapointKey &key, size_t seed) noexcept
{
    return qHashMulti(seed, key.address, key.channel, key.datapoint);
}

size_t qHash(const ChannelKey &key, size_t seed) noexcept
{
    return qHashMulti(seed, key.address, key.channel);
}

StateTransition StateCache::apply(const Event &event, const QVariant &initialValue)
{
    const DatapointKey key{ event.address, event.channel, event.datapoint };

    QWriteLocker locker(&m_lock);
    StateEntry &entry = m_entries[key];

    StateTransition result;
    result.previous = entry.hasValue ? entry.value : initialValue;
    result.transitioned = !result.previous.isValid() || result.previous != event.value;

    entry.value = event.value;
    entry.tsMs = event.tsMs;
    entry.hasValue = true;
    result.entry = entry;
    return result;
}

StateEntry StateCache::value(const QString &address, int channel, const QString &datapoint) const
{
    QReadLocker locker(&m_lock);
    return m_entries.value(DatapointKey{ address, channel, datapoint });
}

QList<QPair<DatapointKey, StateEntry>> StateCache::entries() const
{
    QList<QPair<DatapointKey, StateEntry>> out;
    {
        QReadLocker locker(&m_lock);
        out.reserve(m_entries.size());
        for (auto it = m_entries.constBegin(); it != m_entries.constEnd(); ++it)
            out.push_back(qMakePair(it.key(), it.value()));
    }
    std::sort(out.begin(), out.end(), [](const auto &a, const auto &b) {
        if (a.first.address != b.first.address)
            return a.first.address < b.first.address;
        if (a.first.channel != b.first.channel)
            return a.first.channel < b.first.channel;
        return a.first.datapoint < b.first.datapoint;
    });
    return out;
}

bool StateCache::applyAttribute(const QString &address, int channel, const QString &key, const QVariant &rawValue)
{
    const QString name = key.toLower();
    QWriteLocker locker(&m_lock);
    QVariantMap &attributes = m_attributes[ChannelKey{ address, channel }];
    const auto it = attributes.constFind(name);
    if (it != attributes.constEnd() && it.value() == rawValue)
        return false;
    attributes.insert(name, rawValue);
    return true;
}

QVariantMap StateCache::attributes(const QString &address, int channel) const
{
    QReadLocker locker(&m_lock);
    return m_attributes.value(ChannelKey{ address, channel });
}

QList<QPair<ChannelKey, QVariantMap>> StateCache::attributeEntries() const
{
    QList<QPair<ChannelKey, QVariantMap>> out;
    {
        QReadLocker locker(&m_lock);
        out.reserve(m_attributes.size());
        for (auto it = m_attributes.constBegin(); it != m_attributes.constEnd(); ++it)
            out.push_back(qMakePair(it.key(), it.value()));
    }
    std::sort(out.begin(), out.end(), [](const auto &a, const auto &b) {
        if (a.first.address != b.first.address)
            return a.first.address < b.first.address;
        return a.first.channel < b.first.channel;
    });
    return out;
}

void StateCache::removeDevice(const QString &address)
{
    QWriteLocker locker(&m_lock);
    auto it = m_entries.begin();
    while (it != m_entries.end()) {
        if (it.key().address == address) {
            it = m_entries.erase(it);
            continue;
        }
        ++it;
    }
    auto attrs = m_attributes.begin();
    while (attrs != m_attributes.end()) {
        if (attrs.key().address == address) {
            attrs = m_attributes.erase(attrs);
            continue;
        }
        ++attrs;
    }
}

int StateCache::size() const
{
    QReadLocker locker(&m_lock);
    return static_cast<int>(m_entries.size());
}

} // namespace hmbridge
