#include <gtest/gtest.h>

#include "BroadcastDispatcher.h"
#include "TestDoubles.h"

class BroadcastDispatcherTest : public ::testing::Test {
protected:
    FakePortFactory factory;
    RecordingSink sink;
    ConnectionRegistry registry{ factory, 9600, sink };
    BroadcastDispatcher dispatcher{ sink };
    GatewayStats stats;
};

TEST_F(BroadcastDispatcherTest, FullDeliveryCountsOneCommand) {
    registry.Reconcile({ "COM3", "COM5" });

    DispatchResult result = dispatcher.Dispatch("PICK_A1", registry, stats);

    EXPECT_TRUE(result.attempted);
    EXPECT_EQ(result.delivered, 2u);
    EXPECT_TRUE(result.failed.empty());
    EXPECT_EQ(stats.commands_sent, 1u);
    EXPECT_EQ(stats.device_count, 2u);
    EXPECT_EQ(sink.CountLogsContaining("Sent to 2 devs: PICK_A1"), 1u);
}

TEST_F(BroadcastDispatcherTest, PartialFailureDropsFailedAndDoesNotCount) {
    registry.Reconcile({ "COM3", "COM5" });
    factory.Device("COM5").fail_write = true;

    DispatchResult result = dispatcher.Dispatch("OPEN_GATE", registry, stats);

    EXPECT_EQ(result.failed, (std::set<std::string>{ "COM5" }));
    EXPECT_EQ(result.delivered, 1u);
    EXPECT_EQ(stats.commands_sent, 0u);
    EXPECT_EQ(stats.device_count, 1u);
    EXPECT_FALSE(registry.Contains("COM5"));
    EXPECT_EQ(factory.Device("COM3").frames, std::vector<std::string>{ "OPEN_GATE\n" });
    EXPECT_EQ(sink.CountLogsContaining("Write Error: COM5 dropped"), 1u);
    EXPECT_EQ(sink.CountLogsContaining("Sent to"), 0u);
}

TEST_F(BroadcastDispatcherTest, EveryRecipientFailing) {
    registry.Reconcile({ "COM3", "COM5" });
    factory.Device("COM3").fail_write = true;
    factory.Device("COM5").fail_write = true;

    DispatchResult result = dispatcher.Dispatch("OPEN_GATE", registry, stats);

    EXPECT_EQ(result.delivered, 0u);
    EXPECT_TRUE(registry.Empty());
    EXPECT_EQ(stats.commands_sent, 0u);
    EXPECT_EQ(stats.device_count, 0u);
    EXPECT_EQ(sink.CountLogsContaining("Write Error:"), 2u);
}

TEST_F(BroadcastDispatcherTest, EmptyRegistryIsNoOp) {
    DispatchResult result = dispatcher.Dispatch("PICK_A1", registry, stats);

    EXPECT_FALSE(result.attempted);
    EXPECT_EQ(stats.commands_sent, 0u);
    EXPECT_TRUE(sink.logs.empty());
}

TEST_F(BroadcastDispatcherTest, EmptyCommandIsNoOp) {
    registry.Reconcile({ "COM3" });
    sink.Clear();

    DispatchResult result = dispatcher.Dispatch("", registry, stats);

    EXPECT_FALSE(result.attempted);
    EXPECT_TRUE(factory.Device("COM3").frames.empty());
    EXPECT_TRUE(sink.logs.empty());
}
