// DeviceEnumerator.h
#pragma once

#include <string>
#include <vector>

#include "DeviceMatcher.h"

// --- IDeviceEnumerator Interface ---
// Returns every candidate serial device currently attached. May throw;
// the gateway loop treats a throw as an iteration failure.
class IDeviceEnumerator {
public:
    virtual ~IDeviceEnumerator() = default;
    virtual std::vector<DeviceRecord> Enumerate() = 0;
};

// --- SysfsDeviceEnumerator ---
// Linux enumeration through /sys/class/tty. Description and hardware id follow
// the pyserial list_ports format so the default match rules apply unchanged:
//   description: "<product>[ - <interface>]", or the tty name, or "n/a"
//   hardware_id: "USB VID:PID=10C4:EA60 SER=0001 LOCATION=1-1.2:1.0"
class SysfsDeviceEnumerator : public IDeviceEnumerator {
public:
    SysfsDeviceEnumerator(std::string tty_class_dir = "/sys/class/tty", std::string dev_dir = "/dev");

    std::vector<DeviceRecord> Enumerate() override;

private:
    bool IsCandidateName(const std::string& name) const;
    DeviceRecord Describe(const std::string& name, const std::string& device_link) const;

    std::string m_tty_class_dir;
    std::string m_dev_dir;
};
