#include <gtest/gtest.h>

#include "deviceregistry.h"
#include "eventtranslator.h"
#include "statecache.h"
#include "testsupport.h"

using namespace hmbridge;
using namespace hmbridge::testing;

class EventTranslatorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        QString error;
        ASSERT_TRUE(m_registry.registerInventory(sampleInventory(), error)) << error.toStdString();
    }

    DeviceRegistry m_registry;
    StateCache m_cache;
    EventTranslator m_translator{ m_registry, m_cache };
};

TEST_F(EventTranslatorTest, SmokeAlarmPublishesStateAndTrigger)
{
    const EventTranslation result = m_translator.translate(rawEvent(QStringLiteral("A1"), 1, QStringLiteral("ALARM"), 1));
    ASSERT_TRUE(result.ok()) << result.errorString.toStdString();

    ASSERT_EQ(result.publishes.size(), 3);
    EXPECT_EQ(result.publishes.at(0).topic, QStringLiteral("Homematic/A1/1/alarm"));
    EXPECT_EQ(result.publishes.at(0).payload, QByteArray("ON"));
    EXPECT_TRUE(result.publishes.at(0).retained);
    EXPECT_EQ(result.publishes.at(1).topic, QStringLiteral("Homematic/A1/1/attributes"));
    EXPECT_TRUE(result.publishes.at(1).retained);
    EXPECT_EQ(result.publishes.at(2).topic, QStringLiteral("Homematic/A1/1/alarm/trigger"));
    EXPECT_EQ(result.publishes.at(2).payload, QByteArray("ON"));
    EXPECT_FALSE(result.publishes.at(2).retained);

    ASSERT_EQ(result.events.size(), 2);
    EXPECT_FALSE(result.events.at(0).trigger);
    EXPECT_TRUE(result.events.at(1).trigger);
    EXPECT_EQ(result.events.at(0).value, QVariant(true));

    EXPECT_EQ(m_cache.value(QStringLiteral("A1"), 1, QStringLiteral("alarm")).value, QVariant(true));
}

TEST_F(EventTranslatorTest, RepeatedValueRepublishesStateWithoutTrigger)
{
    m_translator.translate(rawEvent(QStringLiteral("A1"), 1, QStringLiteral("ALARM"), true));
    const EventTranslation again = m_translator.translate(rawEvent(QStringLiteral("A1"), 1, QStringLiteral("ALARM"), true, 2000));
    ASSERT_TRUE(again.ok());
    ASSERT_EQ(again.publishes.size(), 1);
    EXPECT_EQ(again.publishes.first().topic, QStringLiteral("Homematic/A1/1/alarm"));
    EXPECT_EQ(again.events.size(), 1);
}

TEST_F(EventTranslatorTest, UnknownChannelLeavesCacheUntouched)
{
    const EventTranslation result = m_translator.translate(rawEvent(QStringLiteral("UNKNOWN123"), 1, QStringLiteral("ALARM"), true));
    EXPECT_EQ(result.error, ErrorKind::UnknownChannel);
    EXPECT_TRUE(result.publishes.isEmpty());
    EXPECT_TRUE(result.events.isEmpty());
    EXPECT_TRUE(m_cache.isEmpty());
}

TEST_F(EventTranslatorTest, UnmappedParameterIsUnknownDatapoint)
{
    const EventTranslation result = m_translator.translate(rawEvent(QStringLiteral("A1"), 0, QStringLiteral("RSSI_DEVICE"), -65));
    EXPECT_EQ(result.error, ErrorKind::UnknownDatapoint);
    EXPECT_TRUE(m_cache.isEmpty());
    EXPECT_TRUE(result.events.isEmpty());

    // The value still lands in the channel attributes.
    ASSERT_EQ(result.publishes.size(), 1);
    const QJsonObject attributes = payloadObject(findPublish(result.publishes, QStringLiteral("Homematic/A1/0/attributes")));
    EXPECT_EQ(attributes.value(QStringLiteral("rssi_device")).toInt(), -65);
}

TEST_F(EventTranslatorTest, ChannelAttributesCollectEveryParameter)
{
    m_translator.translate(rawEvent(QStringLiteral("H1"), 0, QStringLiteral("RSSI_DEVICE"), -65));
    const EventTranslation battery = m_translator.translate(rawEvent(QStringLiteral("H1"), 0, QStringLiteral("LOW_BAT"), true));
    ASSERT_TRUE(battery.ok()) << battery.errorString.toStdString();

    const PublishAction *action = findPublish(battery.publishes, QStringLiteral("Homematic/H1/0/attributes"));
    ASSERT_NE(action, nullptr);
    EXPECT_TRUE(action->retained);
    EXPECT_EQ(action->payload, QByteArray("{\"low_bat\":true,\"rssi_device\":-65}"));

    const EventTranslation same = m_translator.translate(rawEvent(QStringLiteral("H1"), 0, QStringLiteral("LOW_BAT"), true, 2000));
    EXPECT_EQ(findPublish(same.publishes, QStringLiteral("Homematic/H1/0/attributes")), nullptr);
}

TEST_F(EventTranslatorTest, MaintenanceFlagsDriveProblemIndicator)
{
    const auto problemAfter = [this](const QString &key, const QVariant &value) {
        const EventTranslation result = m_translator.translate(rawEvent(QStringLiteral("A1"), 0, key, value));
        EXPECT_TRUE(result.ok()) << result.errorString.toStdString();
        const PublishAction *action = findPublish(result.publishes, QStringLiteral("Homematic/A1/0/problem"));
        return action ? action->payload : QByteArray();
    };

    EXPECT_EQ(problemAfter(QStringLiteral("ERROR_CODE"), 0), QByteArray("OFF"));
    EXPECT_EQ(problemAfter(QStringLiteral("CONFIG_PENDING"), true), QByteArray("ON"));
    EXPECT_EQ(problemAfter(QStringLiteral("LOW_BAT"), true), QByteArray("ON"));
    EXPECT_EQ(problemAfter(QStringLiteral("CONFIG_PENDING"), false), QByteArray("ON"));
    EXPECT_EQ(problemAfter(QStringLiteral("LOW_BAT"), false), QByteArray("OFF"));
    EXPECT_EQ(problemAfter(QStringLiteral("OPERATING_VOLTAGE_STATUS"), 3), QByteArray("ON"));
    EXPECT_EQ(m_cache.value(QStringLiteral("A1"), 0, QStringLiteral("problem")).value, QVariant(true));

    // Values that are not maintenance flags leave the indicator alone.
    const EventTranslation voltage = m_translator.translate(rawEvent(QStringLiteral("A1"), 0, QStringLiteral("OPERATING_VOLTAGE"), 2.9));
    ASSERT_TRUE(voltage.ok());
    EXPECT_EQ(findPublish(voltage.publishes, QStringLiteral("Homematic/A1/0/problem")), nullptr);
}

TEST_F(EventTranslatorTest, ButtonPressTriggersOnEveryReport)
{
    for (qint64 ts : { 1000, 2000 }) {
        const EventTranslation result = m_translator.translate(rawEvent(QStringLiteral("B1"), 2, QStringLiteral("PRESS_LONG"), true, ts));
        ASSERT_TRUE(result.ok()) << result.errorString.toStdString();
        ASSERT_EQ(result.events.size(), 1);
        EXPECT_TRUE(result.events.first().trigger);
        EXPECT_EQ(result.events.first().datapoint, QStringLiteral("press_long"));

        const PublishAction *trigger = findPublish(result.publishes, QStringLiteral("Homematic/B1/2/press_long/trigger"));
        ASSERT_NE(trigger, nullptr);
        EXPECT_EQ(trigger->payload, QByteArray("ON"));
        EXPECT_FALSE(trigger->retained);
        EXPECT_EQ(findPublish(result.publishes, QStringLiteral("Homematic/B1/2/press_long")), nullptr);
    }
    EXPECT_FALSE(m_cache.value(QStringLiteral("B1"), 2, QStringLiteral("press_long")).hasValue);
    const PublishList retained = m_translator.retainedState();
    EXPECT_NE(findPublish(retained, QStringLiteral("Homematic/B1/2/attributes")), nullptr);
    EXPECT_EQ(findPublish(retained, QStringLiteral("Homematic/B1/2/press_long")), nullptr);
}

TEST_F(EventTranslatorTest, WindowHandleTriggersOnEveryTransition)
{
    int triggers = 0;
    const QList<int> codes{ 0, 2, 0 };
    qint64 ts = 1000;
    for (int code : codes) {
        const EventTranslation result = m_translator.translate(rawEvent(QStringLiteral("H1"), 1, QStringLiteral("STATE"), code, ts++));
        ASSERT_TRUE(result.ok()) << result.errorString.toStdString();
        if (findPublish(result.publishes, QStringLiteral("Homematic/H1/1/state/trigger")))
            ++triggers;
    }
    // The first "closed" matches the assumed initial state.
    EXPECT_EQ(triggers, 2);
    EXPECT_EQ(m_cache.value(QStringLiteral("H1"), 1, QStringLiteral("state")).value, QVariant(QStringLiteral("closed")));
}

TEST_F(EventTranslatorTest, EnumerationCodeOutOfRangeIsDomainViolation)
{
    const EventTranslation result = m_translator.translate(rawEvent(QStringLiteral("H1"), 1, QStringLiteral("STATE"), 5));
    EXPECT_EQ(result.error, ErrorKind::DomainViolation);
    EXPECT_TRUE(result.publishes.isEmpty());
    EXPECT_FALSE(m_cache.value(QStringLiteral("H1"), 1, QStringLiteral("state")).hasValue);
}

TEST_F(EventTranslatorTest, ShutterLevelIsScaledToPercent)
{
    const EventTranslation result = m_translator.translate(rawEvent(QStringLiteral("B1"), 3, QStringLiteral("LEVEL"), 0.5));
    ASSERT_TRUE(result.ok()) << result.errorString.toStdString();
    const PublishAction *state = findPublish(result.publishes, QStringLiteral("Homematic/B1/3/level"));
    ASSERT_NE(state, nullptr);
    EXPECT_EQ(state->payload, QByteArray("50"));

    const EventTranslation outside = m_translator.translate(rawEvent(QStringLiteral("B1"), 3, QStringLiteral("LEVEL"), 1.5));
    EXPECT_EQ(outside.error, ErrorKind::DomainViolation);
}

TEST_F(EventTranslatorTest, UnreachDrivesAvailability)
{
    const EventTranslation offline = m_translator.translate(rawEvent(QStringLiteral("A1"), 0, QStringLiteral("UNREACH"), true));
    ASSERT_TRUE(offline.ok());
    const PublishAction *availability = findPublish(offline.publishes, QStringLiteral("Homematic/A1/availability"));
    ASSERT_NE(availability, nullptr);
    EXPECT_EQ(availability->payload, QByteArray("offline"));
    EXPECT_TRUE(availability->retained);

    const EventTranslation online = m_translator.translate(rawEvent(QStringLiteral("A1"), 0, QStringLiteral("UNREACH"), false));
    availability = findPublish(online.publishes, QStringLiteral("Homematic/A1/availability"));
    ASSERT_NE(availability, nullptr);
    EXPECT_EQ(availability->payload, QByteArray("online"));
}

TEST_F(EventTranslatorTest, RetainedStateCoversCachedDatapoints)
{
    m_translator.translate(rawEvent(QStringLiteral("A1"), 1, QStringLiteral("ALARM"), true));
    m_translator.translate(rawEvent(QStringLiteral("B1"), 3, QStringLiteral("LEVEL"), 0.25));

    const PublishList state = m_translator.retainedState();
    ASSERT_EQ(state.size(), 4);
    EXPECT_EQ(state.at(0).topic, QStringLiteral("Homematic/A1/1/attributes"));
    EXPECT_EQ(state.at(1).topic, QStringLiteral("Homematic/B1/3/attributes"));
    EXPECT_EQ(state.at(2).topic, QStringLiteral("Homematic/A1/1/alarm"));
    EXPECT_EQ(state.at(3).topic, QStringLiteral("Homematic/B1/3/level"));
    EXPECT_EQ(state.at(3).payload, QByteArray("25"));

    m_translator.forgetDevice(QStringLiteral("A1"));
    EXPECT_EQ(m_translator.retainedState().size(), 2);
}
