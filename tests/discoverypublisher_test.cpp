#include <gtest/gtest.h>

#include <QJsonArray>

#include "deviceregistry.h"
#include "discoverypublisher.h"
#include "testsupport.h"

using namespace hmbridge;
using namespace hmbridge::testing;

class DiscoveryPublisherTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        QString error;
        ASSERT_TRUE(m_registry.registerInventory(sampleInventory(), error)) << error.toStdString();
    }

    DeviceRegistry m_registry;
    DiscoveryPublisher m_publisher;
};

TEST_F(DiscoveryPublisherTest, GenerationIsDeterministic)
{
    const PublishList first = m_publisher.publishAll(m_registry);
    const PublishList second = m_publisher.publishAll(m_registry);
    ASSERT_EQ(first.size(), second.size());
    for (int i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first.at(i).topic, second.at(i).topic);
        EXPECT_EQ(first.at(i).payload, second.at(i).payload);
        EXPECT_TRUE(first.at(i).retained);
    }
    EXPECT_EQ(m_publisher.generate(m_registry), m_publisher.generate(m_registry));
}

TEST_F(DiscoveryPublisherTest, SmokeAlarmBinarySensor)
{
    const PublishList publishes = m_publisher.publishAll(m_registry);
    const QJsonObject config = payloadObject(
        findPublish(publishes, QStringLiteral("homeassistant/binary_sensor/A1_1/alarm/config")));
    ASSERT_FALSE(config.isEmpty());

    EXPECT_EQ(config.value(QStringLiteral("device_class")).toString(), QStringLiteral("smoke"));
    EXPECT_EQ(config.value(QStringLiteral("unique_id")).toString(), QStringLiteral("Homematic-A1_1-alarm"));
    EXPECT_EQ(config.value(QStringLiteral("state_topic")).toString(), QStringLiteral("Homematic/A1/1/alarm"));
    EXPECT_EQ(config.value(QStringLiteral("availability_topic")).toString(), QStringLiteral("Homematic/A1/availability"));
    EXPECT_EQ(config.value(QStringLiteral("payload_on")).toString(), QStringLiteral("ON"));
    EXPECT_EQ(config.value(QStringLiteral("json_attributes_topic")).toString(), QStringLiteral("Homematic/A1/1/attributes"));
    EXPECT_FALSE(config.contains(QStringLiteral("command_topic")));

    const QJsonObject device = config.value(QStringLiteral("device")).toObject();
    EXPECT_EQ(device.value(QStringLiteral("identifiers")).toArray().first().toString(), QStringLiteral("A1"));
    EXPECT_EQ(device.value(QStringLiteral("model")).toString(), QStringLiteral("HmIP-SWSD"));
    EXPECT_EQ(device.value(QStringLiteral("sw_version")).toString(), QStringLiteral("1.2.3"));
}

TEST_F(DiscoveryPublisherTest, TriggersAreAnnouncedAsDeviceAutomations)
{
    const PublishList publishes = m_publisher.publishAll(m_registry);
    const QJsonObject config = payloadObject(
        findPublish(publishes, QStringLiteral("homeassistant/device_automation/H1_1/state/config")));
    ASSERT_FALSE(config.isEmpty());
    EXPECT_EQ(config.value(QStringLiteral("automation_type")).toString(), QStringLiteral("trigger"));
    EXPECT_EQ(config.value(QStringLiteral("topic")).toString(), QStringLiteral("Homematic/H1/1/state/trigger"));
    EXPECT_EQ(config.value(QStringLiteral("subtype")).toString(), QStringLiteral("channel_1"));

    const QJsonObject sensor = payloadObject(
        findPublish(publishes, QStringLiteral("homeassistant/sensor/H1_1/state/config")));
    EXPECT_EQ(sensor.value(QStringLiteral("options")).toArray().size(), 3);
}

TEST_F(DiscoveryPublisherTest, ButtonsAreAnnouncedAsPressTriggers)
{
    const PublishList publishes = m_publisher.publishAll(m_registry);
    const QJsonObject shortPress = payloadObject(
        findPublish(publishes, QStringLiteral("homeassistant/device_automation/B1_1/press_short/config")));
    ASSERT_FALSE(shortPress.isEmpty());
    EXPECT_EQ(shortPress.value(QStringLiteral("type")).toString(), QStringLiteral("button_short_press"));
    EXPECT_EQ(shortPress.value(QStringLiteral("subtype")).toString(), QStringLiteral("button_1"));
    EXPECT_EQ(shortPress.value(QStringLiteral("topic")).toString(), QStringLiteral("Homematic/B1/1/press_short/trigger"));

    const QJsonObject longPress = payloadObject(
        findPublish(publishes, QStringLiteral("homeassistant/device_automation/B1_2/press_long/config")));
    ASSERT_FALSE(longPress.isEmpty());
    EXPECT_EQ(longPress.value(QStringLiteral("type")).toString(), QStringLiteral("button_long_press"));
    EXPECT_EQ(longPress.value(QStringLiteral("subtype")).toString(), QStringLiteral("button_2"));

    // Presses have no state to show.
    for (const PublishAction &action : publishes) {
        if (action.topic.contains(QStringLiteral("/press_")))
            EXPECT_TRUE(action.topic.startsWith(QStringLiteral("homeassistant/device_automation/"))) << action.topic.toStdString();
    }
}

TEST_F(DiscoveryPublisherTest, MaintenanceProblemBinarySensor)
{
    const PublishList publishes = m_publisher.publishAll(m_registry);
    const QJsonObject config = payloadObject(
        findPublish(publishes, QStringLiteral("homeassistant/binary_sensor/A1_0/problem/config")));
    ASSERT_FALSE(config.isEmpty());
    EXPECT_EQ(config.value(QStringLiteral("device_class")).toString(), QStringLiteral("problem"));
    EXPECT_EQ(config.value(QStringLiteral("state_topic")).toString(), QStringLiteral("Homematic/A1/0/problem"));
    EXPECT_EQ(config.value(QStringLiteral("json_attributes_topic")).toString(), QStringLiteral("Homematic/A1/0/attributes"));
    EXPECT_NE(findPublish(publishes, QStringLiteral("homeassistant/binary_sensor/B1_0/problem/config")), nullptr);
}

TEST_F(DiscoveryPublisherTest, ShutterCover)
{
    const PublishList publishes = m_publisher.publishAll(m_registry);
    const QJsonObject config = payloadObject(
        findPublish(publishes, QStringLiteral("homeassistant/cover/B1_4/level/config")));
    ASSERT_FALSE(config.isEmpty());
    EXPECT_EQ(config.value(QStringLiteral("position_topic")).toString(), QStringLiteral("Homematic/B1/3/level"));
    EXPECT_EQ(config.value(QStringLiteral("set_position_topic")).toString(), QStringLiteral("Homematic/B1/4/level/set"));
    EXPECT_EQ(config.value(QStringLiteral("command_topic")).toString(), QStringLiteral("Homematic/B1/4/movement/set"));
    EXPECT_EQ(config.value(QStringLiteral("payload_open")).toString(), QStringLiteral("up"));
    EXPECT_EQ(config.value(QStringLiteral("payload_close")).toString(), QStringLiteral("down"));
    EXPECT_EQ(config.value(QStringLiteral("payload_stop")).toString(), QStringLiteral("stop"));
    EXPECT_EQ(config.value(QStringLiteral("position_open")).toInt(), 100);
}

TEST_F(DiscoveryPublisherTest, InternalDatapointsAreNotAnnounced)
{
    const PublishList publishes = m_publisher.publishAll(m_registry);
    for (const PublishAction &action : publishes) {
        EXPECT_FALSE(action.topic.contains(QStringLiteral("/unreach/"))) << action.topic.toStdString();
        EXPECT_FALSE(action.topic.contains(QStringLiteral("/movement/"))) << action.topic.toStdString();
        EXPECT_FALSE(action.topic.contains(QStringLiteral("/config_pending/"))) << action.topic.toStdString();
    }
}

TEST_F(DiscoveryPublisherTest, RetractionClearsEveryConfigOfTheDevice)
{
    const RegisteredDevice *device = m_registry.device(QStringLiteral("B1"));
    ASSERT_NE(device, nullptr);
    const DiscoveryConfigList configs = m_publisher.generate(m_registry, *device);
    const PublishList retract = m_publisher.retractDevice(m_registry, *device);
    ASSERT_EQ(retract.size(), configs.size());
    for (int i = 0; i < retract.size(); ++i) {
        EXPECT_EQ(retract.at(i).topic, configs.at(i).topic);
        EXPECT_TRUE(retract.at(i).payload.isEmpty());
        EXPECT_TRUE(retract.at(i).retained);
    }
}
