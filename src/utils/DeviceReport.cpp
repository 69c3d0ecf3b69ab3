#include "DeviceReport.hpp"
#include "UsbNames.hpp"
#include <sstream>

namespace usb_handshake {

namespace {

const std::string kUnknown = "Unknown";

bool hasInterfaceClass(const std::vector<ConfigurationInfo>& configurations,
                       DeviceClass cls) {
    for (const auto& config : configurations) {
        for (const auto& intf : config.interfaces) {
            if (intf.interfaceClass == static_cast<uint8_t>(cls)) {
                return true;
            }
        }
    }
    return false;
}

bool isClass(const DeviceDescriptor& descriptor,
             const std::vector<ConfigurationInfo>& configurations,
             DeviceClass cls) {
    return descriptor.deviceClass == static_cast<uint8_t>(cls) ||
           hasInterfaceClass(configurations, cls);
}

} // namespace

std::string deviceType(const DeviceDescriptor& descriptor,
                       const std::vector<ConfigurationInfo>& configurations) {
    if (isClass(descriptor, configurations, DeviceClass::MassStorage)) {
        return "Mass Storage Device";
    }
    if (isClass(descriptor, configurations, DeviceClass::HID)) {
        return "HID (e.g., Keyboard, Mouse, or Dongle)";
    }
    if (descriptor.deviceClass == static_cast<uint8_t>(DeviceClass::Hub)) {
        return "USB Hub";
    }
    if (descriptor.deviceClass == static_cast<uint8_t>(DeviceClass::VendorSpecific)) {
        return "Vendor-Specific (Possible Dongle or Specialized Device)";
    }
    return "Other/Unknown Device Type";
}

std::string deviceSummary(const DeviceDescriptor& descriptor) {
    std::stringstream ss;
    ss << hexWord(descriptor.vendorId) << ":" << hexWord(descriptor.productId)
       << " on bus " << static_cast<int>(descriptor.busNumber)
       << " address " << static_cast<int>(descriptor.deviceAddress);

    std::string name;
    if (descriptor.manufacturer) name = *descriptor.manufacturer;
    if (descriptor.product) {
        if (!name.empty()) name += " ";
        name += *descriptor.product;
    }
    if (!name.empty()) {
        ss << " (" << name << ")";
    }
    return ss.str();
}

std::string deviceListLine(size_t number, const DeviceDescriptor& descriptor) {
    std::stringstream ss;
    ss << number << ". "
       << descriptor.manufacturer.value_or(kUnknown) << " - "
       << descriptor.product.value_or(kUnknown)
       << " (VendorID: " << hexWord(descriptor.vendorId)
       << ", ProductID: " << hexWord(descriptor.productId) << ")";
    return ss.str();
}

std::string checkDeviceLine(const DeviceDescriptor& descriptor) {
    return "Device: " + hexWord(descriptor.vendorId) + ":" + hexWord(descriptor.productId);
}

std::string accessErrorLine(const std::string& reason) {
    return "Error accessing device: " + reason;
}

std::string formatDeviceReport(const DeviceDescriptor& descriptor,
                               const std::vector<ConfigurationInfo>& configurations,
                               const std::string& operatingSystem) {
    std::stringstream ss;
    ss << "Device ID: " << hexWord(descriptor.vendorId) << ":"
       << hexWord(descriptor.productId) << "\n"
       << "Bus: " << static_cast<int>(descriptor.busNumber)
       << ", Address: " << static_cast<int>(descriptor.deviceAddress) << "\n"
       << "Manufacturer: " << descriptor.manufacturer.value_or(kUnknown) << "\n"
       << "Product: " << descriptor.product.value_or(kUnknown) << "\n"
       << "Serial Number: " << descriptor.serial.value_or(kUnknown) << "\n"
       << "Device Class: " << className(descriptor.deviceClass) << "\n"
       << "Device Type: " << deviceType(descriptor, configurations) << "\n"
       << "Firmware/Product Version: " << bcdToString(descriptor.deviceVersion) << "\n"
       << "USB Version: " << bcdToString(descriptor.usbVersion) << "\n"
       << "Device Speed: " << speedLabel(descriptor.speed) << "\n";

    if (descriptor.maxPowerMa > 0) {
        ss << "Max Power: " << descriptor.maxPowerMa << "mA\n";
    } else {
        ss << "Max Power: Unknown\n";
    }

    for (const auto& config : configurations) {
        ss << "\nConfiguration " << static_cast<int>(config.value) << ":\n"
           << "  Total Length: " << config.totalLength << " bytes\n"
           << "  Number of Interfaces: " << static_cast<int>(config.numInterfaces) << "\n"
           << "  Max Power: " << config.maxPowerMa << "mA"
           << (config.selfPowered ? " (self-powered" : " (bus-powered")
           << (config.remoteWakeup ? ", remote wakeup)" : ")") << "\n";

        for (const auto& intf : config.interfaces) {
            ss << "    Interface " << static_cast<int>(intf.number);
            if (intf.alternateSetting != 0) {
                ss << " (alternate setting " << static_cast<int>(intf.alternateSetting) << ")";
            }
            ss << ":\n"
               << "      Class: " << className(intf.interfaceClass) << "\n"
               << "      Subclass: " << hexByte(intf.interfaceSubClass) << "\n"
               << "      Protocol: " << hexByte(intf.interfaceProtocol) << "\n";

            for (const auto& ep : intf.endpoints) {
                ss << "      Endpoint Address: " << hexByte(ep.address)
                   << (ep.isInput() ? " (IN)" : " (OUT)") << "\n"
                   << "      Max Packet Size: " << ep.maxPacketSize << " bytes\n"
                   << "      Endpoint Type: " << transferTypeName(ep.type) << "\n";
            }
        }
    }

    ss << "\nOS: " << operatingSystem;
    return ss.str();
}

} // namespace usb_handshake
