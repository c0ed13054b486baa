#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "EventBus.h"

using namespace std::chrono_literals;

namespace {

template <typename Predicate>
bool WaitFor(Predicate predicate, std::chrono::milliseconds timeout = 3000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}

} // namespace

TEST(EventBusTest, StatusEventEncoding) {
    nlohmann::json j = nlohmann::json::parse(EncodeStatusEvent("api", "ERR 500", StatusColor::ERROR));
    EXPECT_EQ(j["type"], "status");
    EXPECT_EQ(j["key"], "api");
    EXPECT_EQ(j["value"], "ERR 500");
    EXPECT_EQ(j["color"], "error");
}

TEST(EventBusTest, StatusColorsUseDashboardPalette) {
    EXPECT_STREQ(StatusColorHex(StatusColor::SUCCESS), "#27ae60");
    EXPECT_STREQ(StatusColorHex(StatusColor::WARNING), "#f39c12");
    EXPECT_STREQ(StatusColorHex(StatusColor::ERROR), "#e74c3c");
    EXPECT_EQ(ParseStatusColor("warning"), StatusColor::WARNING);
    EXPECT_THROW(ParseStatusColor("blue"), std::invalid_argument);
}

TEST(EventBusTest, ModelStartsWithStartupStatuses) {
    zmq::context_t ctx(1);
    DashboardModel model(ctx, "inproc://event_bus_initial");

    DashboardSnapshot snapshot = model.GetSnapshot();
    EXPECT_EQ(snapshot.statuses[kStatusGateway].value, "STARTING");
    EXPECT_EQ(snapshot.statuses[kStatusSerial].value, "SCANNING...");
    EXPECT_EQ(snapshot.statuses[kStatusApi].value, "WAITING");
    EXPECT_EQ(snapshot.stats.commands_sent, 0u);
    EXPECT_TRUE(snapshot.activity_log.empty());
}

TEST(EventBusTest, ApplyEventUpdatesSnapshot) {
    zmq::context_t ctx(1);
    DashboardModel model(ctx, "inproc://event_bus_apply");

    EXPECT_TRUE(model.ApplyEvent(EncodeStatusEvent(kStatusSerial, "CONNECTED (COM3)", StatusColor::SUCCESS)));
    EXPECT_TRUE(model.ApplyEvent(EncodeLogEvent("12:00:01", "Device connected: COM3")));
    GatewayStats stats;
    stats.commands_sent = 4;
    stats.errors = 2;
    stats.device_count = 1;
    EXPECT_TRUE(model.ApplyEvent(EncodeStatsEvent(stats)));

    DashboardSnapshot snapshot = model.GetSnapshot();
    EXPECT_EQ(snapshot.statuses[kStatusSerial].value, "CONNECTED (COM3)");
    EXPECT_EQ(snapshot.statuses[kStatusSerial].color, StatusColor::SUCCESS);
    ASSERT_EQ(snapshot.activity_log.size(), 1u);
    EXPECT_EQ(snapshot.activity_log[0], "[12:00:01] Device connected: COM3");
    EXPECT_EQ(snapshot.stats.commands_sent, 4u);
    EXPECT_EQ(snapshot.stats.errors, 2u);
    EXPECT_EQ(snapshot.stats.device_count, 1u);
}

TEST(EventBusTest, InvalidUtf8CommandStillReachesActivityLog) {
    zmq::context_t ctx(1);
    DashboardModel model(ctx, "inproc://event_bus_latin1");

    std::string payload;
    ASSERT_NO_THROW(payload = EncodeLogEvent("12:00:00", "Sent to 2 devs: OPEN_GATE_\xE9"));
    ASSERT_NO_THROW(EncodeStatusEvent(kStatusApi, "ERR \xFF", StatusColor::ERROR));
    EXPECT_TRUE(model.ApplyEvent(payload));

    DashboardSnapshot snapshot = model.GetSnapshot();
    ASSERT_EQ(snapshot.activity_log.size(), 1u);
    // The bad byte becomes U+FFFD
    EXPECT_EQ(snapshot.activity_log[0], "[12:00:00] Sent to 2 devs: OPEN_GATE_\xEF\xBF\xBD");
}

TEST(EventBusTest, MalformedEventsAreRejected) {
    zmq::context_t ctx(1);
    DashboardModel model(ctx, "inproc://event_bus_malformed");

    EXPECT_FALSE(model.ApplyEvent("not json"));
    EXPECT_FALSE(model.ApplyEvent(R"({"type":"status","key":"api"})"));
    EXPECT_FALSE(model.ApplyEvent(R"({"type":"status","key":"api","value":"OK","color":"purple"})"));
    EXPECT_FALSE(model.ApplyEvent(R"({"type":"metrics"})"));

    // Rejected status events leave the previous value in place
    EXPECT_EQ(model.GetSnapshot().statuses[kStatusApi].value, "WAITING");
}

TEST(EventBusTest, ActivityLogIsCapped) {
    zmq::context_t ctx(1);
    DashboardModel model(ctx, "inproc://event_bus_cap");

    for (size_t i = 0; i < g_activity_log_max_lines + 25; ++i) {
        model.ApplyEvent(EncodeLogEvent("12:00:00", "line " + std::to_string(i)));
    }

    DashboardSnapshot snapshot = model.GetSnapshot();
    ASSERT_EQ(snapshot.activity_log.size(), g_activity_log_max_lines);
    EXPECT_EQ(snapshot.activity_log.front(), "[12:00:00] line 25");
    EXPECT_EQ(snapshot.activity_log_sequence, g_activity_log_max_lines + 25);

    // Size stays at the cap but the sequence still moves
    model.ApplyEvent(EncodeLogEvent("12:00:01", "one more"));
    DashboardSnapshot next = model.GetSnapshot();
    EXPECT_EQ(next.activity_log.size(), snapshot.activity_log.size());
    EXPECT_EQ(next.activity_log_sequence, snapshot.activity_log_sequence + 1);
    EXPECT_EQ(next.activity_log.back(), "[12:00:01] one more");

    model.ClearActivityLog();
    EXPECT_TRUE(model.GetSnapshot().activity_log.empty());
}

TEST(EventBusTest, SinkEventsReachDashboardOverInproc) {
    zmq::context_t ctx(1);
    DashboardModel model(ctx, "inproc://event_bus_roundtrip");
    model.Start();

    {
        ZmqEventSink sink(ctx, "inproc://event_bus_roundtrip");
        sink.OnStatus(kStatusApi, "OK", StatusColor::SUCCESS);
        sink.OnLog("Sent to 2 devs: PICK_A1");
        GatewayStats stats;
        stats.commands_sent = 1;
        stats.device_count = 2;
        sink.OnStats(stats);
        EXPECT_EQ(sink.GetDroppedCount(), 0u);

        EXPECT_TRUE(WaitFor([&model]() { return model.GetSnapshot().stats.device_count == 2; }));
    }
    model.Stop();

    DashboardSnapshot snapshot = model.GetSnapshot();
    EXPECT_EQ(snapshot.statuses[kStatusApi].value, "OK");
    ASSERT_EQ(snapshot.activity_log.size(), 1u);
    EXPECT_NE(snapshot.activity_log[0].find("Sent to 2 devs: PICK_A1"), std::string::npos);
    EXPECT_EQ(snapshot.stats.commands_sent, 1u);
}
