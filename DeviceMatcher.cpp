#include "DeviceMatcher.h"

#include <stdexcept>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>

std::vector<MatchRule> DefaultMatchRules() {
    return {
        { "cp210",        MatchField::DESCRIPTION },
        { "ch340",        MatchField::DESCRIPTION },
        { "usb serial",   MatchField::DESCRIPTION },
        { "esp",          MatchField::DESCRIPTION },
        { "vid:pid=10c4", MatchField::HARDWARE_ID }, // Silicon Labs
        { "vid:pid=1a86", MatchField::HARDWARE_ID }  // QinHeng CH340
    };
}

MatchField ParseMatchField(const std::string& name) {
    std::string lowered = boost::algorithm::to_lower_copy(name);
    if (lowered == "description") return MatchField::DESCRIPTION;
    if (lowered == "hwid" || lowered == "hardware_id") return MatchField::HARDWARE_ID;
    throw std::invalid_argument("Unknown match field: " + name);
}

std::string MatchFieldName(MatchField field) {
    return field == MatchField::DESCRIPTION ? "description" : "hwid";
}

DeviceMatcher::DeviceMatcher()
    : m_rules(DefaultMatchRules()) {
}

DeviceMatcher::DeviceMatcher(std::vector<MatchRule> rules)
    : m_rules(std::move(rules)) {
    // Rules are stored lowercased so Classify only lowers the record side
    for (auto& rule : m_rules) {
        boost::algorithm::to_lower(rule.substring);
    }
}

bool DeviceMatcher::Classify(const DeviceRecord& record) const {
    const std::string desc = boost::algorithm::to_lower_copy(record.description);
    const std::string hwid = boost::algorithm::to_lower_copy(record.hardware_id);

    for (const auto& rule : m_rules) {
        if (rule.substring.empty()) continue;
        const std::string& target = (rule.field == MatchField::DESCRIPTION) ? desc : hwid;
        if (boost::algorithm::contains(target, rule.substring)) {
            return true;
        }
    }
    return false;
}

std::set<std::string> DeviceMatcher::SelectEligible(const std::vector<DeviceRecord>& records) const {
    std::set<std::string> eligible;
    for (const auto& record : records) {
        if (!record.identifier.empty() && Classify(record)) {
            eligible.insert(record.identifier);
        }
    }
    return eligible;
}
