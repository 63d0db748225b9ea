#include <gtest/gtest.h>

#include <QSet>

#include "devicetypes.h"
#include "topics.h"

using namespace hmbridge;

TEST(DeviceTypes, FindsModelsCaseInsensitively)
{
    const DeviceTypeDescriptor *smoke = findDeviceType(QStringLiteral("hmip-swsd"));
    ASSERT_NE(smoke, nullptr);
    EXPECT_EQ(smoke->model, DeviceModel::SmokeAlarm);
    EXPECT_EQ(smoke->manufacturer, QStringLiteral("eQ-3"));

    EXPECT_EQ(findDeviceType(QStringLiteral(" HmIP-BROLL ")), findDeviceType(DeviceModel::ShutterActuator));
    EXPECT_EQ(findDeviceType(QStringLiteral("HmIP-PS")), nullptr);
}

TEST(DeviceTypes, DatapointIdsAreUniqueTopicSegments)
{
    for (const DeviceTypeDescriptor &desc : deviceTypes()) {
        QSet<int> channels;
        for (const ChannelRole &role : desc.channels) {
            EXPECT_FALSE(channels.contains(role.index)) << desc.modelName.toStdString();
            channels.insert(role.index);

            QSet<QString> ids;
            for (const DatapointSpec &dp : role.datapoints) {
                EXPECT_TRUE(TopicScheme::isValidSegment(dp.id)) << dp.id.toStdString();
                EXPECT_FALSE(ids.contains(dp.id)) << desc.modelName.toStdString() << " " << dp.id.toStdString();
                ids.insert(dp.id);
            }
        }
    }
}

TEST(DeviceTypes, EveryModelReportsAvailability)
{
    for (const DeviceTypeDescriptor &desc : deviceTypes()) {
        int channel = -1;
        const DatapointSpec *unreach = desc.availabilityDatapoint(&channel);
        ASSERT_NE(unreach, nullptr) << desc.modelName.toStdString();
        EXPECT_EQ(channel, 0);
        EXPECT_EQ(unreach->key, QStringLiteral("UNREACH"));
    }
}

TEST(DeviceTypes, ShutterCoverTakesPositionFromTransmitter)
{
    const DeviceTypeDescriptor *shutter = findDeviceType(DeviceModel::ShutterActuator);
    ASSERT_NE(shutter, nullptr);
    const ChannelRole *receiver = shutter->channel(4);
    ASSERT_NE(receiver, nullptr);

    const DatapointSpec *level = receiver->datapointById(QStringLiteral("level"));
    ASSERT_NE(level, nullptr);
    EXPECT_EQ(level->component, ComponentKind::Cover);
    EXPECT_EQ(level->feedbackChannel, 3);
    EXPECT_TRUE(level->isWritable());

    const DatapointSpec *movement = receiver->datapointById(level->movementId);
    ASSERT_NE(movement, nullptr);
    EXPECT_FALSE(movement->isEventing());
    EXPECT_EQ(movement->commands.size(), 3);

    // Controller LEVEL events resolve to the position, never to the movement.
    EXPECT_EQ(receiver->datapointByKey(QStringLiteral("LEVEL")), level);

    const DatapointSpec *position = shutter->channel(3)->datapointByKey(QStringLiteral("LEVEL"));
    ASSERT_NE(position, nullptr);
    EXPECT_FALSE(position->isWritable());
}

TEST(DeviceTypes, InitialValues)
{
    const DeviceTypeDescriptor *handle = findDeviceType(DeviceModel::WindowHandle);
    ASSERT_NE(handle, nullptr);
    const DatapointSpec *state = handle->channel(1)->datapointByKey(QStringLiteral("STATE"));
    ASSERT_NE(state, nullptr);
    EXPECT_EQ(state->domain.initialValue(), QVariant(QStringLiteral("closed")));
    EXPECT_TRUE(state->trigger);

    const DeviceTypeDescriptor *smoke = findDeviceType(DeviceModel::SmokeAlarm);
    const DatapointSpec *alarm = smoke->channel(1)->datapointByKey(QStringLiteral("ALARM"));
    ASSERT_NE(alarm, nullptr);
    EXPECT_EQ(alarm->domain.initialValue(), QVariant(false));

    const DatapointSpec *voltage = smoke->channel(0)->datapointByKey(QStringLiteral("OPERATING_VOLTAGE"));
    ASSERT_NE(voltage, nullptr);
    EXPECT_DOUBLE_EQ(voltage->domain.initialValue().toDouble(), 0.0);
}
