// tests/test_DeviceReport.cpp
#include <gtest/gtest.h>
#include "DeviceReport.hpp"
#include "UsbNames.hpp"
#include "FakeDeviceEnumerator.hpp"

namespace usb_handshake {
namespace testing {

namespace {

ConfigurationInfo storageConfiguration() {
    InterfaceInfo intf;
    intf.number = 0;
    intf.interfaceClass = 0x08;
    intf.interfaceSubClass = 0x06;
    intf.interfaceProtocol = 0x50;
    intf.endpoints = {
        EndpointInfo{0x81, 512, TransferType::Bulk},
        EndpointInfo{0x02, 512, TransferType::Bulk}
    };

    ConfigurationInfo config;
    config.value = 1;
    config.totalLength = 32;
    config.numInterfaces = 1;
    config.maxPowerMa = 224;
    config.interfaces = {intf};
    return config;
}

} // namespace

TEST(UsbNamesTest, ClassNames) {
    EXPECT_EQ(className(0x00), "Per Interface");
    EXPECT_EQ(className(0x03), "HID (Human Interface Device)");
    EXPECT_EQ(className(0x08), "Mass Storage");
    EXPECT_EQ(className(0xFF), "Vendor Specific");
    EXPECT_EQ(className(0x42), "Unknown (0x42)");
}

TEST(UsbNamesTest, Formatting) {
    EXPECT_EQ(bcdToString(0x0200), "2.00");
    EXPECT_EQ(bcdToString(0x0310), "3.10");
    EXPECT_EQ(hexByte(0x0a), "0x0a");
    EXPECT_EQ(hexWord(0x46d), "046d");
    EXPECT_EQ(speedToken(DeviceSpeed::Full), "full");
    EXPECT_EQ(speedToken(DeviceSpeed::Unknown), "unknown");
    EXPECT_EQ(transferTypeName(TransferType::Interrupt), "Interrupt");
}

TEST(DeviceReportTest, DeviceTypeLooksAtInterfaces) {
    DeviceDescriptor descriptor = makeDescriptor(0x0781, 0x5581, 1, 3);

    EXPECT_EQ(deviceType(descriptor, {storageConfiguration()}), "Mass Storage Device");
    EXPECT_EQ(deviceType(descriptor, {}), "Other/Unknown Device Type");

    descriptor.deviceClass = 0x09;
    EXPECT_EQ(deviceType(descriptor, {}), "USB Hub");

    descriptor.deviceClass = 0xFF;
    EXPECT_EQ(deviceType(descriptor, {}), "Vendor-Specific (Possible Dongle or Specialized Device)");

    descriptor.deviceClass = 0x03;
    EXPECT_EQ(deviceType(descriptor, {}), "HID (e.g., Keyboard, Mouse, or Dongle)");
}

TEST(DeviceReportTest, ListLineFallsBackToUnknown) {
    DeviceDescriptor descriptor = makeDescriptor(0x046d, 0xc52b, 1, 4);
    EXPECT_EQ(deviceListLine(3, descriptor),
              "3. Unknown - Unknown (VendorID: 046d, ProductID: c52b)");

    descriptor.manufacturer = "Logitech";
    descriptor.product = "USB Receiver";
    EXPECT_EQ(deviceListLine(1, descriptor),
              "1. Logitech - USB Receiver (VendorID: 046d, ProductID: c52b)");
}

TEST(DeviceReportTest, Summary) {
    DeviceDescriptor descriptor = makeDescriptor(0x046d, 0xc52b, 1, 4);
    EXPECT_EQ(deviceSummary(descriptor), "046d:c52b on bus 1 address 4");

    descriptor.manufacturer = "Logitech";
    descriptor.product = "USB Receiver";
    EXPECT_EQ(deviceSummary(descriptor), "046d:c52b on bus 1 address 4 (Logitech USB Receiver)");
}

TEST(DeviceReportTest, ConnectivityCheckLines) {
    EXPECT_EQ(checkDeviceLine(makeDescriptor(0x046d, 0xc52b, 1, 4)), "Device: 046d:c52b");
    EXPECT_EQ(accessErrorLine("Cannot read device descriptor: LIBUSB_ERROR_IO"),
              "Error accessing device: Cannot read device descriptor: LIBUSB_ERROR_IO");
}

TEST(DeviceReportTest, FullReport) {
    DeviceDescriptor descriptor = makeDescriptor(0x0781, 0x5581, 1, 3);
    descriptor.manufacturer = "SanDisk";
    descriptor.product = "Ultra";
    descriptor.deviceVersion = 0x0100;

    std::string report = formatDeviceReport(descriptor, {storageConfiguration()}, "Linux 6.1");

    EXPECT_NE(report.find("Device ID: 0781:5581\n"), std::string::npos);
    EXPECT_NE(report.find("Manufacturer: SanDisk\n"), std::string::npos);
    EXPECT_NE(report.find("Serial Number: Unknown\n"), std::string::npos);
    EXPECT_NE(report.find("Device Class: Per Interface\n"), std::string::npos);
    EXPECT_NE(report.find("Device Type: Mass Storage Device\n"), std::string::npos);
    EXPECT_NE(report.find("Firmware/Product Version: 1.00\n"), std::string::npos);
    EXPECT_NE(report.find("USB Version: 2.00\n"), std::string::npos);
    EXPECT_NE(report.find("Device Speed: High (480 Mbit/s)\n"), std::string::npos);
    EXPECT_NE(report.find("Max Power: 100mA\n"), std::string::npos);
    EXPECT_NE(report.find("\nConfiguration 1:\n"), std::string::npos);
    EXPECT_NE(report.find("      Class: Mass Storage\n"), std::string::npos);
    EXPECT_NE(report.find("      Endpoint Address: 0x81 (IN)\n"), std::string::npos);
    EXPECT_NE(report.find("      Endpoint Address: 0x02 (OUT)\n"), std::string::npos);
    EXPECT_NE(report.find("      Endpoint Type: Bulk\n"), std::string::npos);
    EXPECT_EQ(report.substr(report.size() - std::string("OS: Linux 6.1").size()), "OS: Linux 6.1");
}

} // namespace testing
} // namespace usb_handshake
