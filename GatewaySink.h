// GatewaySink.h
#pragma once

#include <string>
#include <cstdint>

enum class StatusColor {
    SUCCESS,
    WARNING,
    ERROR
};

// Dashboard hex colors
const char* StatusColorHex(StatusColor color);
const char* StatusColorName(StatusColor color);
// Parses a name produced by StatusColorName; throws std::invalid_argument otherwise
StatusColor ParseStatusColor(const std::string& name);

// --- Status Keys ---
extern const char* const kStatusGateway; // "gateway"
extern const char* const kStatusSerial;  // "serial"
extern const char* const kStatusApi;     // "api"

struct GatewayStats {
    uint64_t commands_sent = 0;
    uint64_t errors = 0;
    size_t device_count = 0;
};

// --- IGatewaySink Interface ---
// Implemented by the display layer. Called from the gateway worker thread;
// implementations must not block.
class IGatewaySink {
public:
    virtual ~IGatewaySink() = default;

    virtual void OnStatus(const std::string& key, const std::string& value, StatusColor color) = 0;
    virtual void OnLog(const std::string& message) = 0;
    virtual void OnStats(const GatewayStats& stats) = 0;
};

// --- SinkNotifier ---
// Fire-and-forget wrapper: anything a sink throws is written to the
// diagnostic log and never reaches the caller.
class SinkNotifier {
public:
    explicit SinkNotifier(IGatewaySink& sink) : m_sink(sink) {}

    void Status(const std::string& key, const std::string& value, StatusColor color) noexcept;
    void Log(const std::string& message) noexcept;
    void Stats(const GatewayStats& stats) noexcept;

private:
    IGatewaySink& m_sink;
};
