#include "EventBus.h"
#include "GatewayLog.h"

#include <optional>

const char* const kDashboardEndpoint = "inproc://gateway_events";
const int g_zmq_sndhwm = 10000;
const size_t g_activity_log_max_lines = 500;

namespace {
// Commands arrive as raw HTTP bodies; invalid UTF-8 is replaced with U+FFFD instead of throwing
std::string DumpEvent(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}
} // namespace

std::string EncodeStatusEvent(const std::string& key, const std::string& value, StatusColor color) {
    nlohmann::json j;
    j["type"] = "status";
    j["key"] = key;
    j["value"] = value;
    j["color"] = StatusColorName(color);
    return DumpEvent(j);
}

std::string EncodeLogEvent(const std::string& time, const std::string& message) {
    nlohmann::json j;
    j["type"] = "log";
    j["time"] = time;
    j["message"] = message;
    return DumpEvent(j);
}

std::string EncodeStatsEvent(const GatewayStats& stats) {
    nlohmann::json j;
    j["type"] = "stats";
    j["commands_sent"] = stats.commands_sent;
    j["errors"] = stats.errors;
    j["device_count"] = stats.device_count;
    return DumpEvent(j);
}

// --- ZmqEventSink Implementations ---

ZmqEventSink::ZmqEventSink(zmq::context_t& ctx, const std::string& endpoint)
    : m_push_socket(ctx, zmq::socket_type::push),
    m_dropped(0)
{
    m_push_socket.set(zmq::sockopt::sndhwm, g_zmq_sndhwm);
    m_push_socket.set(zmq::sockopt::linger, 0);
    m_push_socket.connect(endpoint);
}

ZmqEventSink::~ZmqEventSink() {
    m_push_socket.close();
}

void ZmqEventSink::OnStatus(const std::string& key, const std::string& value, StatusColor color) {
    Send(EncodeStatusEvent(key, value, color));
}

void ZmqEventSink::OnLog(const std::string& message) {
    Send(EncodeLogEvent(CurrentTimeString(), message));
}

void ZmqEventSink::OnStats(const GatewayStats& stats) {
    Send(EncodeStatsEvent(stats));
}

void ZmqEventSink::Send(const std::string& payload) {
    std::lock_guard<std::mutex> lock(m_push_mutex);
    zmq::send_result_t sent = m_push_socket.send(zmq::buffer(payload), zmq::send_flags::dontwait);
    if (!sent.has_value()) {
        // High-water mark reached: the dashboard is behind, drop the event
        m_dropped++;
    }
}

// --- DashboardModel Implementations ---

DashboardModel::DashboardModel(zmq::context_t& ctx, const std::string& endpoint)
    : m_endpoint(endpoint),
    m_pull_socket(ctx, zmq::socket_type::pull),
    m_aggregator_running(false)
{
    m_statuses[kStatusGateway] = { "STARTING", StatusColor::WARNING };
    m_statuses[kStatusSerial] = { "SCANNING...", StatusColor::WARNING };
    m_statuses[kStatusApi] = { "WAITING", StatusColor::WARNING };
}

DashboardModel::~DashboardModel() {
    Stop();
}

void DashboardModel::Start() {
    if (m_aggregator_running) return;

    // Bind ONCE here, before any producer connects
    m_pull_socket.set(zmq::sockopt::rcvtimeo, 100);
    m_pull_socket.set(zmq::sockopt::rcvhwm, g_zmq_sndhwm);
    m_pull_socket.bind(m_endpoint);
    AddLog("Dashboard: event bus bound to " + m_endpoint);

    m_aggregator_running = true;
    m_aggregator_thread = std::thread(&DashboardModel::RunAggregator, this);
}

void DashboardModel::Stop() {
    m_aggregator_running = false;
    if (m_aggregator_thread.joinable()) {
        m_aggregator_thread.join();
        m_pull_socket.close();
    }
}

void DashboardModel::RunAggregator() {
    AddLog("Dashboard aggregator thread started.");
    try {
        while (m_aggregator_running) {
            zmq::message_t msg;
            std::optional<size_t> res = m_pull_socket.recv(msg, zmq::recv_flags::none);
            if (!res.has_value()) {
                continue; // Timeout
            }
            ApplyEvent(msg.to_string());
        }
    }
    catch (const zmq::error_t& e) {
        if (m_aggregator_running) AddLog("Dashboard aggregator exception: " + std::string(e.what()), LogType::FAILURE);
    }
    AddLog("Dashboard aggregator thread stopped.");
}

bool DashboardModel::ApplyEvent(const std::string& payload) {
    try {
        const nlohmann::json j = nlohmann::json::parse(payload);
        const std::string type = j.at("type").get<std::string>();

        std::lock_guard<std::mutex> lock(m_snapshot_mutex);
        if (type == "status") {
            StatusEntry entry;
            entry.value = j.at("value").get<std::string>();
            entry.color = ParseStatusColor(j.at("color").get<std::string>());
            m_statuses[j.at("key").get<std::string>()] = entry;
        }
        else if (type == "log") {
            m_activity_log.push_back("[" + j.at("time").get<std::string>() + "] " + j.at("message").get<std::string>());
            m_activity_log_sequence++;
            if (m_activity_log.size() > g_activity_log_max_lines) {
                m_activity_log.pop_front();
            }
        }
        else if (type == "stats") {
            m_stats.commands_sent = j.at("commands_sent").get<uint64_t>();
            m_stats.errors = j.at("errors").get<uint64_t>();
            m_stats.device_count = j.at("device_count").get<size_t>();
        }
        else {
            AddLog("Dashboard: unknown event type '" + type + "'", LogType::WARNING);
            return false;
        }
        return true;
    }
    catch (const nlohmann::json::exception& e) {
        AddLog("Dashboard: malformed event: " + std::string(e.what()), LogType::WARNING);
    }
    catch (const std::invalid_argument& e) {
        AddLog("Dashboard: malformed event: " + std::string(e.what()), LogType::WARNING);
    }
    return false;
}

DashboardSnapshot DashboardModel::GetSnapshot() const {
    std::lock_guard<std::mutex> lock(m_snapshot_mutex);
    DashboardSnapshot snapshot;
    snapshot.statuses = m_statuses;
    snapshot.stats = m_stats;
    snapshot.activity_log.assign(m_activity_log.begin(), m_activity_log.end());
    snapshot.activity_log_sequence = m_activity_log_sequence;
    return snapshot;
}

void DashboardModel::ClearActivityLog() {
    std::lock_guard<std::mutex> lock(m_snapshot_mutex);
    m_activity_log.clear();
}
