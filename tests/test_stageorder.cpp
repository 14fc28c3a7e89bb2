#include <QTemporaryDir>

#include <gtest/gtest.h>

#include "configmanager.h"
#include "stageorder.h"

namespace {

StageOrder shopOrder()
{
    return StageOrder(QStringList{"New Entry", "Intake", "Disassembly", "Body", "Paint",
                                  "Reassembly", "Detail", "QC", "Deliver"});
}

}  // namespace

TEST(StageOrderTest, IndexOf_FollowsConfiguredSequence) {
    const StageOrder order = shopOrder();
    EXPECT_EQ(order.indexOf("New Entry"), 0);
    EXPECT_EQ(order.indexOf("Paint"), 4);
    EXPECT_EQ(order.indexOf("Deliver"), 8);
    EXPECT_EQ(order.indexOf("Sublet"), -1);
}

TEST(StageOrderTest, AtOrAfter_IncludesTarget) {
    const StageOrder order = shopOrder();
    EXPECT_TRUE(order.isAtOrAfter("Paint", "Paint"));
    EXPECT_TRUE(order.isAtOrAfter("Detail", "Paint"));
    EXPECT_FALSE(order.isAtOrAfter("Body", "Paint"));
}

TEST(StageOrderTest, After_ExcludesTarget) {
    const StageOrder order = shopOrder();
    EXPECT_FALSE(order.isAfter("Reassembly", "Reassembly"));
    EXPECT_TRUE(order.isAfter("Detail", "Reassembly"));
    EXPECT_FALSE(order.isAfter("Paint", "Reassembly"));
}

TEST(StageOrderTest, UnknownStage_IsNeverAtOrAfter) {
    const StageOrder order = shopOrder();
    EXPECT_FALSE(order.isAtOrAfter("Sublet", "Body"));
    EXPECT_FALSE(order.isAtOrAfter("Body", "Sublet"));
    EXPECT_FALSE(order.isAfter("Sublet", "New Entry"));
    EXPECT_FALSE(order.contains("Sublet"));
}

TEST(StageOrderTest, Names_AreCaseSensitive) {
    const StageOrder order = shopOrder();
    EXPECT_EQ(order.indexOf("paint"), -1);
    EXPECT_FALSE(order.isAtOrAfter("paint", "Body"));
}

TEST(StageOrderTest, EmptyOrder_MatchesNothing) {
    const StageOrder order;
    EXPECT_TRUE(order.isEmpty());
    EXPECT_FALSE(order.isAtOrAfter("Body", "Body"));
}

TEST(StageOrderTest, FromConfig_PicksUpEdits) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    ConfigManager& config = ConfigManager::instance();
    config.initialize("ShopCreditTests", "ShopCreditTests", dir.filePath("stages.ini"));

    const StageOrder before = StageOrder::fromConfig();
    EXPECT_EQ(before.indexOf("Paint"), 4);

    config.setValue("Ledger/Stages", QStringList{"Intake", "Paint", "Body"});
    const StageOrder after = StageOrder::fromConfig();
    EXPECT_EQ(after.indexOf("Paint"), 1);
    EXPECT_TRUE(after.isAfter("Body", "Paint"));
    EXPECT_NE(after.version(), before.version());
}
