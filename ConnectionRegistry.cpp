#include "ConnectionRegistry.h"
#include "GatewayLog.h"

#include <exception>
#include <stdexcept>

ConnectionRegistry::ConnectionRegistry(ISerialPortFactory& factory, unsigned int baud_rate, IGatewaySink& sink)
    : m_factory(factory), m_baud_rate(baud_rate), m_notifier(sink) {
}

ConnectionRegistry::~ConnectionRegistry() {
    CloseAll();
}

void ConnectionRegistry::Reconcile(const std::set<std::string>& current_eligible) {
    // A. New devices
    for (const auto& identifier : current_eligible) {
        if (m_connections.count(identifier)) continue;
        try {
            std::unique_ptr<ISerialConnection> connection = m_factory.Open(identifier, m_baud_rate);
            if (!connection) {
                throw std::runtime_error("port factory returned no connection");
            }
            m_connections.emplace(identifier, std::move(connection));
            m_notifier.Log("Device connected: " + identifier);
        }
        catch (const std::exception& e) {
            LogError("CONNECT_FAIL_" + identifier, e.what());
            m_notifier.Log("Connect failed: " + identifier + " (" + e.what() + ")");
        }
    }

    // B. Devices that disappeared
    for (auto it = m_connections.begin(); it != m_connections.end();) {
        if (current_eligible.count(it->first)) {
            ++it;
            continue;
        }
        const std::string identifier = it->first;
        CloseQuietly(*it->second);
        it = m_connections.erase(it);
        m_notifier.Log("Device removed: " + identifier);
    }
}

std::set<std::string> ConnectionRegistry::Broadcast(const std::string& payload) {
    const std::string frame = payload + "\n";
    std::set<std::string> failed;
    for (auto& [identifier, connection] : m_connections) {
        try {
            connection->Write(frame);
        }
        catch (const std::exception& e) {
            LogError("WRITE_FAIL_" + identifier, e.what());
            failed.insert(identifier);
        }
    }
    return failed;
}

void ConnectionRegistry::DropFailed(const std::set<std::string>& identifiers) {
    for (const auto& identifier : identifiers) {
        auto it = m_connections.find(identifier);
        if (it == m_connections.end()) continue;
        CloseQuietly(*it->second);
        m_connections.erase(it);
        m_notifier.Log("Device dropped: " + identifier);
    }
}

void ConnectionRegistry::CloseAll() {
    for (auto& [identifier, connection] : m_connections) {
        CloseQuietly(*connection);
    }
    m_connections.clear();
}

std::vector<std::string> ConnectionRegistry::Identifiers() const {
    std::vector<std::string> ids;
    ids.reserve(m_connections.size());
    for (const auto& [identifier, connection] : m_connections) {
        ids.push_back(identifier);
    }
    return ids;
}

void ConnectionRegistry::CloseQuietly(ISerialConnection& connection) {
    try {
        connection.Close();
    }
    catch (const std::exception& e) {
        AddLog("Close failed for " + connection.GetIdentifier() + ": " + e.what(), LogType::WARNING);
    }
}
