#include <gtest/gtest.h>

#include "DeviceMatcher.h"

namespace {

DeviceRecord Record(const std::string& desc, const std::string& hwid) {
    return DeviceRecord{ "/dev/ttyUSB0", desc, hwid };
}

} // namespace

TEST(DeviceMatcherTest, MatchesDescriptionMarkersCaseInsensitively) {
    DeviceMatcher matcher;
    EXPECT_TRUE(matcher.Classify(Record("CP2102 USB to UART Bridge Controller", "")));
    EXPECT_TRUE(matcher.Classify(Record("USB-SERIAL CH340", "")));
    EXPECT_TRUE(matcher.Classify(Record("Generic USB Serial Device", "")));
    EXPECT_TRUE(matcher.Classify(Record("ESP32-S3 JTAG", "")));
}

TEST(DeviceMatcherTest, MatchesHardwareIdVendors) {
    DeviceMatcher matcher;
    EXPECT_TRUE(matcher.Classify(Record("n/a", "USB VID:PID=10C4:EA60 SER=0001 LOCATION=1-1:1.0")));
    EXPECT_TRUE(matcher.Classify(Record("n/a", "USB VID:PID=1A86:7523 LOCATION=1-2:1.0")));
}

TEST(DeviceMatcherTest, RejectsUnrelatedDevices) {
    DeviceMatcher matcher;
    EXPECT_FALSE(matcher.Classify(Record("ttyS0", "PNP0501")));
    EXPECT_FALSE(matcher.Classify(Record("Arduino Uno", "USB VID:PID=2341:0043")));
}

TEST(DeviceMatcherTest, EmptyFieldsNeverMatch) {
    DeviceMatcher matcher;
    EXPECT_FALSE(matcher.Classify(Record("", "")));
    EXPECT_FALSE(matcher.Classify(DeviceRecord{}));
}

TEST(DeviceMatcherTest, FieldsAreNotInterchangeable) {
    DeviceMatcher matcher;
    // Vendor id in the description and chip name in the hardware id do not count
    EXPECT_FALSE(matcher.Classify(Record("vid:pid=10c4", "")));
    EXPECT_FALSE(matcher.Classify(Record("", "cp210x")));
}

TEST(DeviceMatcherTest, CustomRulesAreLowercased) {
    DeviceMatcher matcher({ { "FTDI", MatchField::DESCRIPTION }, { "VID:PID=0403", MatchField::HARDWARE_ID } });
    EXPECT_TRUE(matcher.Classify(Record("ftdi ft232r", "")));
    EXPECT_TRUE(matcher.Classify(Record("", "usb vid:pid=0403:6001")));
    EXPECT_FALSE(matcher.Classify(Record("CP2102", "")));
}

TEST(DeviceMatcherTest, SelectEligibleKeepsOnlyMatchingIdentifiers) {
    DeviceMatcher matcher;
    std::vector<DeviceRecord> records = {
        { "COM3", "Silicon Labs CP210x USB to UART Bridge", "USB VID:PID=10C4:EA60" },
        { "COM4", "Communications Port", "ACPI\\PNP0501\\1" },
        { "COM5", "USB-SERIAL CH340", "USB VID:PID=1A86:7523" },
        { "", "CP2102", "" }
    };
    EXPECT_EQ(matcher.SelectEligible(records), (std::set<std::string>{ "COM3", "COM5" }));
}

TEST(DeviceMatcherTest, ParsesFieldNames) {
    EXPECT_EQ(ParseMatchField("description"), MatchField::DESCRIPTION);
    EXPECT_EQ(ParseMatchField("HWID"), MatchField::HARDWARE_ID);
    EXPECT_EQ(ParseMatchField("hardware_id"), MatchField::HARDWARE_ID);
    EXPECT_THROW(ParseMatchField("serial"), std::invalid_argument);
}
