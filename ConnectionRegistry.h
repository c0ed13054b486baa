// ConnectionRegistry.h
#pragma once

#include <string>
#include <map>
#include <set>
#include <vector>
#include <memory>

#include "SerialConnection.h"
#include "GatewaySink.h"

// --- ConnectionRegistry ---
// Sole owner of the open device connections, keyed by identifier.
// Confined to the gateway worker thread; no internal locking.
class ConnectionRegistry {
public:
    ConnectionRegistry(ISerialPortFactory& factory, unsigned int baud_rate, IGatewaySink& sink);
    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    // Opens identifiers not yet present, closes and removes those no longer eligible.
    // An identifier whose open fails stays absent until the next call.
    void Reconcile(const std::set<std::string>& current_eligible);

    // Writes payload + '\n' to every connection. Returns exactly the identifiers whose write failed.
    std::set<std::string> Broadcast(const std::string& payload);

    void DropFailed(const std::set<std::string>& identifiers);
    void CloseAll();

    size_t Size() const { return m_connections.size(); }
    bool Empty() const { return m_connections.empty(); }
    bool Contains(const std::string& identifier) const { return m_connections.count(identifier) > 0; }
    std::vector<std::string> Identifiers() const;

private:
    // Teardown is fire-and-forget: failures go to the diagnostic log only
    void CloseQuietly(ISerialConnection& connection);

    ISerialPortFactory& m_factory;
    unsigned int m_baud_rate;
    SinkNotifier m_notifier;
    std::map<std::string, std::unique_ptr<ISerialConnection>> m_connections;
};
