// DeviceMatcher.h
#pragma once

#include <string>
#include <vector>
#include <set>

// --- Enumeration Record ---
// Missing description / hardware id fields are stored as empty strings.
struct DeviceRecord {
    std::string identifier;   // e.g. "/dev/ttyUSB0", "COM3"
    std::string description;  // e.g. "CP2102 USB to UART Bridge Controller"
    std::string hardware_id;  // e.g. "USB VID:PID=10C4:EA60 SER=0001 LOCATION=1-1.2:1.0"
};

enum class MatchField {
    DESCRIPTION,
    HARDWARE_ID
};

struct MatchRule {
    std::string substring; // Compared lowercased
    MatchField field;
};

// Vendor / chip markers for ESP32-class boards and common USB-UART bridges.
std::vector<MatchRule> DefaultMatchRules();

// Parses "description" / "hwid" (also "hardware_id"); throws std::invalid_argument otherwise.
MatchField ParseMatchField(const std::string& name);
std::string MatchFieldName(MatchField field);

// --- DeviceMatcher ---
// Evaluates the rule table in order; the first matching rule wins.
class DeviceMatcher {
public:
    DeviceMatcher();
    explicit DeviceMatcher(std::vector<MatchRule> rules);

    bool Classify(const DeviceRecord& record) const;

    // Identifiers of every eligible record in an enumeration snapshot
    std::set<std::string> SelectEligible(const std::vector<DeviceRecord>& records) const;

    const std::vector<MatchRule>& GetRules() const { return m_rules; }

private:
    std::vector<MatchRule> m_rules;
};
