// GatewayLoop.h
#pragma once

#include <string>
#include <map>
#include <memory>
#include <atomic>
#include <thread>
#include <chrono>
#include <utility>
#include <boost/asio.hpp>

#include "GatewayConfig.h"
#include "GatewaySink.h"
#include "DeviceMatcher.h"
#include "DeviceEnumerator.h"
#include "SerialConnection.h"
#include "ConnectionRegistry.h"
#include "CommandSourceClient.h"
#include "BroadcastDispatcher.h"

// --- CancellationToken ---
// Copies share one flag. Checked by the loop at the top of every iteration
// and before each blocking phase; in-flight writes and polls are never interrupted.
class CancellationToken {
public:
    CancellationToken() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    void Cancel() { m_flag->store(true); }
    bool IsCancelled() const { return m_flag->load(); }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

/*
 * GatewayLoop
 *
 * One worker thread runs a private Asio io_context. A steady_timer re-arms
 * after every iteration, so the poll cadence is the iteration cadence:
 *   1. Discovery (only when due, every discovery_interval): enumerate,
 *      classify, reconcile the ConnectionRegistry.
 *   2. Poll the command source, update the API status and error counter.
 *   3. Broadcast the command when one arrived and devices are connected.
 *   4. Push stats to the sink.
 * An exception escaping an iteration is logged and the next iteration is
 * delayed by retry_backoff instead of poll_interval. Only the cancellation
 * token ends the loop; shutdown closes every connection and reports STOPPED.
 *
 * The registry, stats and status cache are confined to the worker thread.
 */
class GatewayLoop {
public:
    using Clock = std::chrono::steady_clock;

    GatewayLoop(const GatewayConfig& config, CancellationToken token,
        IDeviceEnumerator& enumerator, ISerialPortFactory& port_factory,
        ICommandSource& command_source, IGatewaySink& sink);
    ~GatewayLoop();

    GatewayLoop(const GatewayLoop&) = delete;
    GatewayLoop& operator=(const GatewayLoop&) = delete;

    void Start();
    void Stop();
    void Join();
    bool IsRunning() const { return m_running; }

    // Exceptions escape; RunGuardedIteration is the fault boundary
    void RunIteration();

    // Returns the delay before the next iteration: poll_interval, or retry_backoff after a failure
    std::chrono::milliseconds RunGuardedIteration();

    void EmitStartup();
    void Shutdown();

    // Worker thread only (or after Join)
    const GatewayStats& GetStats() const { return m_stats; }
    const ConnectionRegistry& GetRegistry() const { return m_registry; }

private:
    void RunDiscovery();
    void HandlePollResult(const PollResult& poll);
    void UpdateDeviceStatus();
    void SetStatus(const std::string& key, const std::string& value, StatusColor color);
    void OnTimer(const boost::system::error_code& ec);

    GatewayConfig m_config;
    CancellationToken m_token;
    IDeviceEnumerator& m_enumerator;
    ICommandSource& m_command_source;
    DeviceMatcher m_matcher;
    SinkNotifier m_notifier;
    ConnectionRegistry m_registry;
    BroadcastDispatcher m_dispatcher;

    GatewayStats m_stats;
    // Last emitted (value, color) per status key
    std::map<std::string, std::pair<std::string, StatusColor>> m_status_cache;
    Clock::time_point m_next_discovery; // Epoch: due immediately
    bool m_shutdown_done = false;

    boost::asio::io_context m_io_context;
    boost::asio::steady_timer m_timer;
    std::thread m_thread;
    std::atomic<bool> m_running;
};
