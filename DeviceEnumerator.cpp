#include "DeviceEnumerator.h"
#include "GatewayLog.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace fs = std::filesystem;

namespace {

const char* const kTtyPrefixes[] = { "ttyUSB", "ttyACM", "ttyS", "ttyAMA", "rfcomm", "ttyAP", "ttyGS" };

// Reads the first line of a sysfs attribute; empty when absent
std::string ReadAttribute(const fs::path& path) {
    std::ifstream in(path);
    if (!in) return "";
    std::string line;
    std::getline(in, line);
    boost::algorithm::trim(line);
    return line;
}

std::string SubsystemOf(const fs::path& device_path) {
    std::error_code ec;
    fs::path subsystem = fs::canonical(device_path / "subsystem", ec);
    if (ec) return "";
    return subsystem.filename().string();
}

std::string FormatHex4(const std::string& hex_text) {
    unsigned long value = 0;
    try {
        value = std::stoul(hex_text, nullptr, 16);
    }
    catch (const std::exception&) {
        return hex_text;
    }
    std::ostringstream ss;
    ss << std::uppercase << std::hex << std::setw(4) << std::setfill('0') << value;
    return ss.str();
}

} // namespace

SysfsDeviceEnumerator::SysfsDeviceEnumerator(std::string tty_class_dir, std::string dev_dir)
    : m_tty_class_dir(std::move(tty_class_dir)), m_dev_dir(std::move(dev_dir)) {
}

bool SysfsDeviceEnumerator::IsCandidateName(const std::string& name) const {
    for (const char* prefix : kTtyPrefixes) {
        if (boost::algorithm::starts_with(name, prefix)) return true;
    }
    return false;
}

std::vector<DeviceRecord> SysfsDeviceEnumerator::Enumerate() {
    std::vector<DeviceRecord> records;

    // Let filesystem_error propagate: a missing /sys/class/tty is an iteration failure
    for (const auto& entry : fs::directory_iterator(m_tty_class_dir)) {
        const std::string name = entry.path().filename().string();
        if (!IsCandidateName(name)) continue;

        const fs::path device_link = entry.path() / "device";
        std::error_code ec;
        if (!fs::exists(device_link, ec)) continue; // Virtual console

        DeviceRecord record = Describe(name, device_link.string());
        if (!record.identifier.empty()) {
            records.push_back(std::move(record));
        }
    }

    std::sort(records.begin(), records.end(),
        [](const DeviceRecord& a, const DeviceRecord& b) { return a.identifier < b.identifier; });
    return records;
}

DeviceRecord SysfsDeviceEnumerator::Describe(const std::string& name, const std::string& device_link) const {
    DeviceRecord record;
    record.identifier = (fs::path(m_dev_dir) / name).string();
    record.description = "n/a";
    record.hardware_id = "n/a";

    std::error_code ec;
    fs::path device_path = fs::canonical(device_link, ec);
    if (ec) {
        AddLog("Enumerator: cannot resolve " + device_link + ": " + ec.message(), LogType::WARNING);
        return record;
    }

    const std::string subsystem = SubsystemOf(device_path);

    // Built-in 8250 UARTs without real hardware behind them
    if (subsystem == "platform" && boost::algorithm::starts_with(name, "ttyS")) {
        return DeviceRecord{};
    }

    fs::path usb_interface_path;
    if (subsystem == "usb-serial") {
        usb_interface_path = device_path.parent_path();
    }
    else if (subsystem == "usb") {
        usb_interface_path = device_path;
    }

    if (!usb_interface_path.empty()) {
        const fs::path usb_device_path = usb_interface_path.parent_path();
        const std::string vid = ReadAttribute(usb_device_path / "idVendor");
        const std::string pid = ReadAttribute(usb_device_path / "idProduct");
        const std::string serial = ReadAttribute(usb_device_path / "serial");
        const std::string product = ReadAttribute(usb_device_path / "product");
        const std::string interface_name = ReadAttribute(usb_interface_path / "interface");

        std::string hwid = "USB VID:PID=" + FormatHex4(vid) + ":" + FormatHex4(pid);
        if (!serial.empty()) hwid += " SER=" + serial;
        hwid += " LOCATION=" + usb_interface_path.filename().string();
        record.hardware_id = hwid;

        if (!interface_name.empty()) {
            record.description = (product.empty() ? name : product) + " - " + interface_name;
        }
        else if (!product.empty()) {
            record.description = product;
        }
        else {
            record.description = name;
        }
    }
    else if (subsystem == "pnp" || subsystem == "amba") {
        record.description = name;
        record.hardware_id = device_path.filename().string();
    }
    return record;
}
