#include "GatewaySink.h"
#include "GatewayLog.h"

#include <exception>
#include <stdexcept>

const char* const kStatusGateway = "gateway";
const char* const kStatusSerial = "serial";
const char* const kStatusApi = "api";

const char* StatusColorHex(StatusColor color) {
    switch (color) {
    case StatusColor::SUCCESS: return "#27ae60";
    case StatusColor::WARNING: return "#f39c12";
    case StatusColor::ERROR:   return "#e74c3c";
    }
    return "#2c3e50";
}

const char* StatusColorName(StatusColor color) {
    switch (color) {
    case StatusColor::SUCCESS: return "success";
    case StatusColor::WARNING: return "warning";
    case StatusColor::ERROR:   return "error";
    }
    return "unknown";
}

StatusColor ParseStatusColor(const std::string& name) {
    if (name == "success") return StatusColor::SUCCESS;
    if (name == "warning") return StatusColor::WARNING;
    if (name == "error") return StatusColor::ERROR;
    throw std::invalid_argument("Unknown status color: " + name);
}

// --- SinkNotifier Implementations ---

void SinkNotifier::Status(const std::string& key, const std::string& value, StatusColor color) noexcept {
    try {
        m_sink.OnStatus(key, value, color);
    }
    catch (const std::exception& e) {
        AddLog("Sink OnStatus(" + key + ") failed: " + std::string(e.what()), LogType::WARNING);
    }
    catch (...) {
        AddLog("Sink OnStatus(" + key + ") failed with a non-standard exception", LogType::WARNING);
    }
}

void SinkNotifier::Log(const std::string& message) noexcept {
    try {
        m_sink.OnLog(message);
    }
    catch (const std::exception& e) {
        AddLog("Sink OnLog failed: " + std::string(e.what()) + " (message: " + message + ")", LogType::WARNING);
    }
    catch (...) {
        AddLog("Sink OnLog failed with a non-standard exception (message: " + message + ")", LogType::WARNING);
    }
}

void SinkNotifier::Stats(const GatewayStats& stats) noexcept {
    try {
        m_sink.OnStats(stats);
    }
    catch (const std::exception& e) {
        AddLog("Sink OnStats failed: " + std::string(e.what()), LogType::WARNING);
    }
    catch (...) {
        AddLog("Sink OnStats failed with a non-standard exception", LogType::WARNING);
    }
}
