#include <gtest/gtest.h>

#include <QVariantMap>

#include "homematic/homematicclient.h"

using namespace hmbridge;

namespace {

QVariantMap parentDescription(const QString &address, const QString &type, const QStringList &children)
{
    QVariantMap desc;
    desc.insert(QStringLiteral("ADDRESS"), address);
    desc.insert(QStringLiteral("TYPE"), type);
    desc.insert(QStringLiteral("FIRMWARE"), QStringLiteral("1.4.8"));
    desc.insert(QStringLiteral("CHILDREN"), children);
    return desc;
}

QVariantMap channelDescription(const QString &address, const QString &parent)
{
    QVariantMap desc;
    desc.insert(QStringLiteral("ADDRESS"), address);
    desc.insert(QStringLiteral("PARENT"), parent);
    desc.insert(QStringLiteral("TYPE"), QStringLiteral("SHUTTER_VIRTUAL_RECEIVER"));
    return desc;
}

}

TEST(HomematicInventory, BuildsSortedInventoryFromDescriptions)
{
    const QVariantList descriptions{
        parentDescription(QStringLiteral("B1"), QStringLiteral("HmIP-BROLL"),
                          { QStringLiteral("B1:0"), QStringLiteral("B1:3"), QStringLiteral("B1:4") }),
        channelDescription(QStringLiteral("B1:6"), QStringLiteral("B1")),
        parentDescription(QStringLiteral("A1"), QStringLiteral("HmIP-SWSD"),
                          { QStringLiteral("A1:0"), QStringLiteral("A1:1") }),
    };

    Inventory inventory;
    QString error;
    ASSERT_TRUE(inventoryFromDescriptions(descriptions, inventory, error)) << error.toStdString();
    ASSERT_EQ(inventory.size(), 2);

    EXPECT_EQ(inventory.at(0).address, QStringLiteral("A1"));
    EXPECT_EQ(inventory.at(0).model, QStringLiteral("HmIP-SWSD"));
    EXPECT_EQ(inventory.at(0).channelCount, 2);
    EXPECT_EQ(inventory.at(0).firmware, QStringLiteral("1.4.8"));

    EXPECT_EQ(inventory.at(1).address, QStringLiteral("B1"));
    // Channel descriptions extend the count beyond the listed children.
    EXPECT_EQ(inventory.at(1).channelCount, 7);
}

TEST(HomematicInventory, ChannelIndexIsPreferredOverAddressSuffix)
{
    QVariantMap channel = channelDescription(QStringLiteral("A1:x"), QStringLiteral("A1"));
    channel.insert(QStringLiteral("INDEX"), 3);
    const QVariantList descriptions{
        parentDescription(QStringLiteral("A1"), QStringLiteral("HmIP-SWSD"), {}),
        channel,
    };

    Inventory inventory;
    QString error;
    ASSERT_TRUE(inventoryFromDescriptions(descriptions, inventory, error));
    ASSERT_EQ(inventory.size(), 1);
    EXPECT_EQ(inventory.first().channelCount, 4);
}

TEST(HomematicInventory, RejectsMalformedDescriptions)
{
    Inventory inventory;
    QString error;
    EXPECT_FALSE(inventoryFromDescriptions({ QStringLiteral("A1") }, inventory, error));
    EXPECT_FALSE(error.isEmpty());

    QVariantMap noAddress;
    noAddress.insert(QStringLiteral("TYPE"), QStringLiteral("HmIP-SWSD"));
    error.clear();
    EXPECT_FALSE(inventoryFromDescriptions({ noAddress }, inventory, error));
    EXPECT_TRUE(error.contains(QStringLiteral("ADDRESS")));
}
