// BroadcastDispatcher.h
#pragma once

#include <string>
#include <set>

#include "ConnectionRegistry.h"
#include "GatewaySink.h"

struct DispatchResult {
    bool attempted = false;
    size_t delivered = 0;             // Recipients whose write succeeded
    std::set<std::string> failed;     // Recipients dropped after a failed write
};

// --- BroadcastDispatcher ---
// "Sent" means sent to everyone: commands_sent only moves when no recipient failed,
// even though the healthy recipients did receive the command.
class BroadcastDispatcher {
public:
    explicit BroadcastDispatcher(IGatewaySink& sink) : m_notifier(sink) {}

    // No-op for an empty command or an empty registry
    DispatchResult Dispatch(const std::string& command, ConnectionRegistry& registry, GatewayStats& stats);

private:
    SinkNotifier m_notifier;
};
