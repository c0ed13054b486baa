#include "GatewayConfig.h"
#include "GatewayLog.h"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <fstream>
#include <stdexcept>

namespace {

std::chrono::milliseconds ReadMillis(const nlohmann::json& j, const char* key, std::chrono::milliseconds current) {
    if (!j.contains(key)) return current;
    const auto& v = j.at(key);
    if (!v.is_number_integer()) {
        throw std::runtime_error(std::string("Config: '") + key + "' must be an integer (ms)");
    }
    return std::chrono::milliseconds(v.get<long long>());
}

long long ParseEnvInteger(const char* name, const char* value) {
    char* end = nullptr;
    errno = 0;
    long long parsed = std::strtoll(value, &end, 10);
    if (end == value || *end != '\0') {
        throw std::runtime_error(std::string("Config: environment variable ") + name + " is not an integer: " + value);
    }
    if (errno == ERANGE) {
        throw std::runtime_error(std::string("Config: environment variable ") + name + " is out of range: " + value);
    }
    return parsed;
}

unsigned int CheckedBaudRate(const std::string& source, long long baud) {
    if (baud <= 0 || static_cast<unsigned long long>(baud) > std::numeric_limits<unsigned int>::max()) {
        throw std::runtime_error("Config: " + source + " out of range: " + std::to_string(baud));
    }
    return static_cast<unsigned int>(baud);
}

void OverrideMillis(const char* name, std::chrono::milliseconds& target) {
    if (const char* value = std::getenv(name)) {
        target = std::chrono::milliseconds(ParseEnvInteger(name, value));
        AddLog(std::string("Config: ") + name + " override applied.");
    }
}

} // namespace

void ApplyJsonConfig(GatewayConfig& config, const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Config: top-level value must be a JSON object");
    }
    try {
        if (j.contains("api_url")) config.api_url = j.at("api_url").get<std::string>();
        if (j.contains("baud_rate")) {
            const auto& baud = j.at("baud_rate");
            if (!baud.is_number_integer()) throw std::runtime_error("Config: 'baud_rate' must be an integer");
            if (baud.is_number_unsigned() && baud.get<unsigned long long>() > std::numeric_limits<unsigned int>::max()) {
                throw std::runtime_error("Config: 'baud_rate' out of range: " + baud.dump());
            }
            config.baud_rate = CheckedBaudRate("'baud_rate'", baud.get<long long>());
        }
        if (j.contains("error_log_file")) config.error_log_file = j.at("error_log_file").get<std::string>();

        if (j.contains("device_rules")) {
            const auto& rules = j.at("device_rules");
            if (!rules.is_array()) throw std::runtime_error("Config: 'device_rules' must be an array");
            std::vector<MatchRule> parsed;
            for (const auto& r : rules) {
                MatchRule rule;
                rule.substring = r.at("substring").get<std::string>();
                rule.field = ParseMatchField(r.at("field").get<std::string>());
                parsed.push_back(std::move(rule));
            }
            config.device_rules = std::move(parsed);
        }
    }
    catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Config: ") + e.what());
    }
    catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Config: ") + e.what());
    }

    config.poll_interval = ReadMillis(j, "poll_interval_ms", config.poll_interval);
    config.discovery_interval = ReadMillis(j, "discovery_interval_ms", config.discovery_interval);
    config.retry_backoff = ReadMillis(j, "retry_backoff_ms", config.retry_backoff);
    config.request_timeout = ReadMillis(j, "request_timeout_ms", config.request_timeout);
    config.serial_read_timeout = ReadMillis(j, "serial_read_timeout_ms", config.serial_read_timeout);
    config.serial_write_timeout = ReadMillis(j, "serial_write_timeout_ms", config.serial_write_timeout);
}

GatewayConfig LoadConfig(const std::string& path) {
    GatewayConfig config;
    std::ifstream in(path);
    if (!in) {
        AddLog("Config: " + path + " not found, using defaults.");
        return config;
    }

    nlohmann::json j;
    try {
        in >> j;
    }
    catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Config: cannot parse " + path + ": " + e.what());
    }
    ApplyJsonConfig(config, j);
    AddLog("Config: loaded " + path);
    return config;
}

void ApplyEnvironmentOverrides(GatewayConfig& config) {
    if (const char* url = std::getenv("GATEWAY_API_URL")) {
        config.api_url = url;
        AddLog("Config: GATEWAY_API_URL override applied.");
    }
    if (const char* baud = std::getenv("GATEWAY_BAUD_RATE")) {
        config.baud_rate = CheckedBaudRate("GATEWAY_BAUD_RATE", ParseEnvInteger("GATEWAY_BAUD_RATE", baud));
    }
    if (const char* log_file = std::getenv("GATEWAY_ERROR_LOG")) {
        config.error_log_file = log_file;
    }
    OverrideMillis("GATEWAY_POLL_INTERVAL_MS", config.poll_interval);
    OverrideMillis("GATEWAY_DISCOVERY_INTERVAL_MS", config.discovery_interval);
    OverrideMillis("GATEWAY_RETRY_BACKOFF_MS", config.retry_backoff);
    OverrideMillis("GATEWAY_REQUEST_TIMEOUT_MS", config.request_timeout);
    OverrideMillis("GATEWAY_SERIAL_READ_TIMEOUT_MS", config.serial_read_timeout);
    OverrideMillis("GATEWAY_SERIAL_WRITE_TIMEOUT_MS", config.serial_write_timeout);
}

void ValidateConfig(const GatewayConfig& config) {
    if (config.api_url.empty()) throw std::runtime_error("Config: api_url is empty");
    if (config.baud_rate == 0) throw std::runtime_error("Config: baud_rate must be positive");
    if (config.poll_interval.count() <= 0) throw std::runtime_error("Config: poll_interval_ms must be positive");
    if (config.discovery_interval.count() < 0) throw std::runtime_error("Config: discovery_interval_ms must not be negative");
    if (config.retry_backoff.count() <= 0) throw std::runtime_error("Config: retry_backoff_ms must be positive");
    if (config.request_timeout.count() <= 0) throw std::runtime_error("Config: request_timeout_ms must be positive");
    // termios VTIME holds at most 25.5 s
    if (config.serial_read_timeout.count() < 100 || config.serial_read_timeout.count() > 25500) {
        throw std::runtime_error("Config: serial_read_timeout_ms must be between 100 and 25500");
    }
    if (config.serial_write_timeout.count() <= 0) throw std::runtime_error("Config: serial_write_timeout_ms must be positive");
    if (config.device_rules.empty()) throw std::runtime_error("Config: device_rules is empty");
}

nlohmann::json ConfigToJson(const GatewayConfig& config) {
    nlohmann::json rules = nlohmann::json::array();
    for (const auto& rule : config.device_rules) {
        rules.push_back({ { "substring", rule.substring }, { "field", MatchFieldName(rule.field) } });
    }
    return {
        { "api_url", config.api_url },
        { "baud_rate", config.baud_rate },
        { "poll_interval_ms", config.poll_interval.count() },
        { "discovery_interval_ms", config.discovery_interval.count() },
        { "retry_backoff_ms", config.retry_backoff.count() },
        { "request_timeout_ms", config.request_timeout.count() },
        { "serial_read_timeout_ms", config.serial_read_timeout.count() },
        { "serial_write_timeout_ms", config.serial_write_timeout.count() },
        { "error_log_file", config.error_log_file },
        { "device_rules", rules }
    };
}
