#include <gtest/gtest.h>

#include "statecache.h"

using namespace hmbridge;

namespace {

Event makeEvent(const QVariant &value, qint64 tsMs, const QString &address = QStringLiteral("A1"))
{
    Event event;
    event.address = address;
    event.channel = 1;
    event.datapoint = QStringLiteral("alarm");
    event.value = value;
    event.tsMs = tsMs;
    return event;
}

}

TEST(StateCache, SameEventTwiceTransitionsOnce)
{
    StateCache cache;
    const StateTransition first = cache.apply(makeEvent(true, 10), false);
    EXPECT_TRUE(first.transitioned);
    EXPECT_EQ(first.previous, QVariant(false));

    const StateTransition second = cache.apply(makeEvent(true, 20), false);
    EXPECT_FALSE(second.transitioned);
    EXPECT_EQ(second.entry.tsMs, 20);
}

TEST(StateCache, FirstObservationMatchingInitialValueIsNoTransition)
{
    StateCache cache;
    EXPECT_FALSE(cache.apply(makeEvent(false, 10), false).transitioned);
    EXPECT_TRUE(cache.value(QStringLiteral("A1"), 1, QStringLiteral("alarm")).hasValue);
}

TEST(StateCache, WithoutInitialValueFirstObservationTransitions)
{
    StateCache cache;
    EXPECT_TRUE(cache.apply(makeEvent(false, 10)).transitioned);
}

TEST(StateCache, UnknownKeyHasNoValue)
{
    StateCache cache;
    const StateEntry entry = cache.value(QStringLiteral("A1"), 1, QStringLiteral("alarm"));
    EXPECT_FALSE(entry.hasValue);
    EXPECT_FALSE(entry.value.isValid());
}

TEST(StateCache, EntriesAreSortedAndRemovable)
{
    StateCache cache;
    cache.apply(makeEvent(true, 1, QStringLiteral("B2")));
    cache.apply(makeEvent(true, 2, QStringLiteral("A1")));

    const auto entries = cache.entries();
    ASSERT_EQ(entries.size(), 2);
    EXPECT_EQ(entries.at(0).first.address, QStringLiteral("A1"));
    EXPECT_EQ(entries.at(1).first.address, QStringLiteral("B2"));

    cache.removeDevice(QStringLiteral("A1"));
    EXPECT_EQ(cache.size(), 1);
    EXPECT_FALSE(cache.value(QStringLiteral("A1"), 1, QStringLiteral("alarm")).hasValue);
}

TEST(StateCache, AttributesAreKeptPerChannel)
{
    StateCache cache;
    EXPECT_TRUE(cache.applyAttribute(QStringLiteral("A1"), 0, QStringLiteral("LOW_BAT"), true));
    EXPECT_FALSE(cache.applyAttribute(QStringLiteral("A1"), 0, QStringLiteral("LOW_BAT"), true));
    EXPECT_TRUE(cache.applyAttribute(QStringLiteral("A1"), 0, QStringLiteral("DUTY_CYCLE"), false));
    EXPECT_TRUE(cache.applyAttribute(QStringLiteral("A1"), 1, QStringLiteral("ALARM"), false));

    const QVariantMap maintenance = cache.attributes(QStringLiteral("A1"), 0);
    EXPECT_EQ(maintenance.keys(), (QStringList{ QStringLiteral("duty_cycle"), QStringLiteral("low_bat") }));
    EXPECT_TRUE(cache.isEmpty());

    cache.removeDevice(QStringLiteral("A1"));
    EXPECT_TRUE(cache.attributeEntries().isEmpty());
}
