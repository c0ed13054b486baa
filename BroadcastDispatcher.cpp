#include "BroadcastDispatcher.h"

DispatchResult BroadcastDispatcher::Dispatch(const std::string& command, ConnectionRegistry& registry, GatewayStats& stats) {
    DispatchResult result;
    if (command.empty() || registry.Empty()) {
        return result;
    }

    result.attempted = true;
    const size_t recipients = registry.Size();
    result.failed = registry.Broadcast(command);
    registry.DropFailed(result.failed);
    result.delivered = recipients - result.failed.size();

    if (result.failed.empty()) {
        stats.commands_sent++;
        m_notifier.Log("Sent to " + std::to_string(result.delivered) + " devs: " + command);
    }
    else {
        for (const auto& identifier : result.failed) {
            m_notifier.Log("Write Error: " + identifier + " dropped");
        }
    }
    stats.device_count = registry.Size();
    return result;
}
