// EventBus.h
#pragma once

#include <string>
#include <map>
#include <deque>
#include <vector>
#include <mutex>
#include <thread>
#include <atomic>
#include <zmq.hpp> // ZeroMQ C++ Wrapper
#include <nlohmann/json.hpp>

#include "GatewaySink.h"

/*
 * Worker -> Dashboard event path
 *
 *  GatewayLoop --(IGatewaySink)--> ZmqEventSink --PUSH--> inproc://gateway_events
 *                                                              |
 *                              DashboardModel::RunAggregator <--PULL
 *
 * Each event is one JSON message:
 *   {"type":"status","key":"api","value":"ERR 500","color":"error"}
 *   {"type":"log","time":"12:00:01","message":"Device connected: /dev/ttyUSB0"}
 *   {"type":"stats","commands_sent":3,"errors":1,"device_count":2}
 */

extern const char* const kDashboardEndpoint;
extern const int g_zmq_sndhwm; // Max queued events before the sink starts dropping
extern const size_t g_activity_log_max_lines;

std::string EncodeStatusEvent(const std::string& key, const std::string& value, StatusColor color);
std::string EncodeLogEvent(const std::string& time, const std::string& message);
std::string EncodeStatsEvent(const GatewayStats& stats);

// --- ZmqEventSink ---
// Never blocks: sends with dontwait and counts the events dropped at the high-water mark.
class ZmqEventSink : public IGatewaySink {
public:
    ZmqEventSink(zmq::context_t& ctx, const std::string& endpoint = kDashboardEndpoint);
    ~ZmqEventSink() override;

    void OnStatus(const std::string& key, const std::string& value, StatusColor color) override;
    void OnLog(const std::string& message) override;
    void OnStats(const GatewayStats& stats) override;

    uint64_t GetDroppedCount() const { return m_dropped; }

private:
    void Send(const std::string& payload);

    zmq::socket_t m_push_socket;
    std::mutex m_push_mutex;
    std::atomic<uint64_t> m_dropped;
};

struct StatusEntry {
    std::string value;
    StatusColor color = StatusColor::WARNING;
};

struct DashboardSnapshot {
    std::map<std::string, StatusEntry> statuses;
    GatewayStats stats;
    std::vector<std::string> activity_log;
    uint64_t activity_log_sequence = 0; // Lines ever appended; changes on every new line
};

// --- DashboardModel ---
// UI-side view of the gateway, fed only by events.
class DashboardModel {
public:
    DashboardModel(zmq::context_t& ctx, const std::string& endpoint = kDashboardEndpoint);
    ~DashboardModel();

    void Start();
    void Stop();

    // Returns false (and logs) for a malformed event
    bool ApplyEvent(const std::string& payload);

    DashboardSnapshot GetSnapshot() const;
    void ClearActivityLog();

private:
    void RunAggregator();

    std::string m_endpoint;
    zmq::socket_t m_pull_socket;
    std::thread m_aggregator_thread;
    std::atomic<bool> m_aggregator_running;

    mutable std::mutex m_snapshot_mutex;
    std::map<std::string, StatusEntry> m_statuses;
    GatewayStats m_stats;
    std::deque<std::string> m_activity_log;
    uint64_t m_activity_log_sequence = 0;
};
