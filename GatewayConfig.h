// GatewayConfig.h
#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <nlohmann/json.hpp>

#include "DeviceMatcher.h"

// --- Gateway Configuration ---
// Defaults match the production deployment; every field can be overridden
// from a JSON file and then from GATEWAY_* environment variables.
struct GatewayConfig {
    std::string api_url = "https://rims.r-dev.asia/api/pick-command";
    unsigned int baud_rate = 9600;

    std::chrono::milliseconds poll_interval{ 1000 };
    std::chrono::milliseconds discovery_interval{ 3000 };
    std::chrono::milliseconds retry_backoff{ 1000 };
    std::chrono::milliseconds request_timeout{ 5000 };

    std::chrono::milliseconds serial_read_timeout{ 1000 };
    std::chrono::milliseconds serial_write_timeout{ 1000 };

    std::string error_log_file = "gateway_error.log";

    std::vector<MatchRule> device_rules = DefaultMatchRules();
};

// Overlays the keys present in `j` onto `config`. Throws std::runtime_error on bad types/values.
void ApplyJsonConfig(GatewayConfig& config, const nlohmann::json& j);

// Reads a JSON config file over the defaults. A missing file keeps the defaults.
GatewayConfig LoadConfig(const std::string& path);

// Applies GATEWAY_API_URL, GATEWAY_BAUD_RATE, GATEWAY_POLL_INTERVAL_MS,
// GATEWAY_DISCOVERY_INTERVAL_MS, GATEWAY_RETRY_BACKOFF_MS, GATEWAY_REQUEST_TIMEOUT_MS,
// GATEWAY_SERIAL_READ_TIMEOUT_MS, GATEWAY_SERIAL_WRITE_TIMEOUT_MS and GATEWAY_ERROR_LOG.
void ApplyEnvironmentOverrides(GatewayConfig& config);

// Throws std::runtime_error describing the first invalid field.
void ValidateConfig(const GatewayConfig& config);

nlohmann::json ConfigToJson(const GatewayConfig& config);
