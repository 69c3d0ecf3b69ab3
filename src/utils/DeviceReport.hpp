#pragma once
#include <usb-handshake/Types.hpp>
#include <string>
#include <vector>

namespace usb_handshake {

// Coarse classification from the device class and every interface class.
std::string deviceType(const DeviceDescriptor& descriptor,
                       const std::vector<ConfigurationInfo>& configurations);

// "046d:c52b on bus 1 address 4 (Logitech USB Receiver)"
std::string deviceSummary(const DeviceDescriptor& descriptor);

// "3. Logitech - USB Receiver (VendorID: 046d, ProductID: c52b)"
std::string deviceListLine(size_t number, const DeviceDescriptor& descriptor);

// "Device: 046d:c52b"
std::string checkDeviceLine(const DeviceDescriptor& descriptor);

// "Error accessing device: <reason>"
std::string accessErrorLine(const std::string& reason);

// Multi-line report of one device and its configuration tree.
std::string formatDeviceReport(const DeviceDescriptor& descriptor,
                               const std::vector<ConfigurationInfo>& configurations,
                               const std::string& operatingSystem);

}
