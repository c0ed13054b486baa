#include "GatewayLoop.h"
#include "GatewayLog.h"

#include <exception>
#include <functional>
#include <vector>

namespace {

// Longer lists are summarised as "<n> Devices"
const size_t kMaxDeviceListLength = 20;

std::string JoinIdentifiers(const std::vector<std::string>& ids) {
    std::string joined;
    for (const auto& id : ids) {
        if (!joined.empty()) joined += ", ";
        joined += id;
    }
    return joined;
}

} // namespace

GatewayLoop::GatewayLoop(const GatewayConfig& config, CancellationToken token,
    IDeviceEnumerator& enumerator, ISerialPortFactory& port_factory,
    ICommandSource& command_source, IGatewaySink& sink)
    : m_config(config),
    m_token(std::move(token)),
    m_enumerator(enumerator),
    m_command_source(command_source),
    m_matcher(config.device_rules),
    m_notifier(sink),
    m_registry(port_factory, config.baud_rate, sink),
    m_dispatcher(sink),
    m_timer(m_io_context),
    m_running(false)
{
}

GatewayLoop::~GatewayLoop() {
    Stop();
}

void GatewayLoop::Start() {
    if (m_running) return;
    m_running = true;
    boost::asio::post(m_io_context, [this]() {
        EmitStartup();
        OnTimer(boost::system::error_code());
        });
    m_thread = std::thread([this]() {
        try {
            m_io_context.run();
        }
        catch (const std::exception& e) {
            LogError("GATEWAY_THREAD", e.what());
        }
        m_running = false;
        });
    AddLog("Gateway worker thread started.");
}

void GatewayLoop::Stop() {
    m_token.Cancel();
    if (m_thread.joinable()) {
        boost::asio::post(m_io_context, [this]() { m_timer.cancel(); });
    }
    Join();
}

void GatewayLoop::Join() {
    if (m_thread.joinable()) {
        m_thread.join();
        AddLog("Gateway worker thread stopped.");
    }
}

void GatewayLoop::OnTimer(const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted || m_token.IsCancelled()) {
        Shutdown();
        return;
    }

    const std::chrono::milliseconds delay = RunGuardedIteration();

    m_timer.expires_after(delay);
    m_timer.async_wait(std::bind(&GatewayLoop::OnTimer, this, std::placeholders::_1));
}

void GatewayLoop::EmitStartup() {
    m_notifier.Log("Gateway Service Started");
    SetStatus(kStatusGateway, "STARTING", StatusColor::WARNING);
    SetStatus(kStatusSerial, "SCANNING...", StatusColor::WARNING);
    SetStatus(kStatusApi, "WAITING", StatusColor::WARNING);
}

std::chrono::milliseconds GatewayLoop::RunGuardedIteration() {
    try {
        RunIteration();
        return m_config.poll_interval;
    }
    catch (const std::exception& e) {
        LogError("CRITICAL_LOOP", e.what());
        m_notifier.Log("Critical Error: " + std::string(e.what()));
    }
    catch (...) {
        LogError("CRITICAL_LOOP", "non-standard exception");
        m_notifier.Log("Critical Error: unknown exception");
    }

    m_stats.device_count = m_registry.Size();
    m_notifier.Stats(m_stats);
    return m_config.retry_backoff;
}

void GatewayLoop::RunIteration() {
    if (m_token.IsCancelled()) return;

    // 1. Device discovery & management
    if (Clock::now() >= m_next_discovery) {
        RunDiscovery();
        // Only a successful discovery pushes the next one out
        m_next_discovery = Clock::now() + m_config.discovery_interval;
    }
    m_stats.device_count = m_registry.Size();
    UpdateDeviceStatus();
    m_notifier.Stats(m_stats);

    // 2. Command source polling
    if (m_token.IsCancelled()) return;
    PollResult poll = m_command_source.Poll();
    HandlePollResult(poll);

    // 3. Broadcast
    if (poll.command) {
        if (m_registry.Empty()) {
            AddLog("Command '" + *poll.command + "' discarded: no devices connected.", LogType::WARNING);
        }
        else if (!m_token.IsCancelled()) {
            m_dispatcher.Dispatch(*poll.command, m_registry, m_stats);
            UpdateDeviceStatus();
        }
    }

    // 4. Stats
    m_stats.device_count = m_registry.Size();
    m_notifier.Stats(m_stats);
}

void GatewayLoop::RunDiscovery() {
    const std::vector<DeviceRecord> records = m_enumerator.Enumerate();
    m_registry.Reconcile(m_matcher.SelectEligible(records));
}

void GatewayLoop::HandlePollResult(const PollResult& poll) {
    switch (poll.outcome) {
    case PollOutcome::OK:
        SetStatus(kStatusApi, "OK", StatusColor::SUCCESS);
        break;
    case PollOutcome::HTTP_ERROR:
        SetStatus(kStatusApi, "ERR " + std::to_string(poll.http_status), StatusColor::ERROR);
        m_stats.errors++;
        break;
    case PollOutcome::NETWORK_ERROR:
        SetStatus(kStatusApi, "TIMEOUT", StatusColor::ERROR);
        LogError("API_FAIL", poll.error);
        m_stats.errors++;
        break;
    }
}

void GatewayLoop::UpdateDeviceStatus() {
    if (!m_registry.Empty()) {
        SetStatus(kStatusGateway, "RUNNING", StatusColor::SUCCESS);
        std::string port_list = JoinIdentifiers(m_registry.Identifiers());
        if (port_list.size() > kMaxDeviceListLength) {
            port_list = std::to_string(m_registry.Size()) + " Devices";
        }
        SetStatus(kStatusSerial, "CONNECTED (" + port_list + ")", StatusColor::SUCCESS);
    }
    else {
        SetStatus(kStatusGateway, "SCANNING...", StatusColor::WARNING);
        SetStatus(kStatusSerial, "NO DEVICES", StatusColor::ERROR);
    }
}

void GatewayLoop::SetStatus(const std::string& key, const std::string& value, StatusColor color) {
    auto it = m_status_cache.find(key);
    if (it != m_status_cache.end() && it->second.first == value && it->second.second == color) {
        return;
    }
    m_status_cache[key] = std::make_pair(value, color);
    m_notifier.Status(key, value, color);
}

void GatewayLoop::Shutdown() {
    if (m_shutdown_done) return;
    m_shutdown_done = true;

    m_registry.CloseAll();
    m_stats.device_count = m_registry.Size();
    SetStatus(kStatusGateway, "STOPPED", StatusColor::WARNING);
    m_notifier.Stats(m_stats);
    m_notifier.Log("Gateway Service Stopped");
}
