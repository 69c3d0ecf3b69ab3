#include "UsbNames.hpp"
#include <cstdio>
#include <map>

namespace usb_handshake {

std::string className(uint8_t classCode) {
    static const std::map<uint8_t, std::string> usbClasses = {
        {0x00, "Per Interface"},
        {0x01, "Audio"},
        {0x02, "Communications"},
        {0x03, "HID (Human Interface Device)"},
        {0x05, "Physical"},
        {0x06, "Image"},
        {0x07, "Printer"},
        {0x08, "Mass Storage"},
        {0x09, "Hub"},
        {0x0A, "CDC-Data"},
        {0x0B, "Smart Card"},
        {0x0D, "Content Security"},
        {0x0E, "Video"},
        {0x0F, "Personal Healthcare"},
        {0x10, "Audio/Video Devices"},
        {0x11, "Billboard Device"},
        {0x12, "USB Type-C Bridge"},
        {0xDC, "Diagnostic Device"},
        {0xE0, "Wireless Controller"},
        {0xEF, "Miscellaneous"},
        {0xFE, "Application Specific"},
        {0xFF, "Vendor Specific"}
    };

    auto it = usbClasses.find(classCode);
    if (it != usbClasses.end()) {
        return it->second;
    }
    return "Unknown (" + hexByte(classCode) + ")";
}

std::string speedToken(DeviceSpeed speed) {
    switch (speed) {
        case DeviceSpeed::Low:       return "low";
        case DeviceSpeed::Full:      return "full";
        case DeviceSpeed::High:      return "high";
        case DeviceSpeed::Super:     return "super";
        case DeviceSpeed::SuperPlus: return "super_plus";
        default:                     return "unknown";
    }
}

std::string speedLabel(DeviceSpeed speed) {
    switch (speed) {
        case DeviceSpeed::Low:       return "Low (1.5 Mbit/s)";
        case DeviceSpeed::Full:      return "Full (12 Mbit/s)";
        case DeviceSpeed::High:      return "High (480 Mbit/s)";
        case DeviceSpeed::Super:     return "Super (5 Gbit/s)";
        case DeviceSpeed::SuperPlus: return "Super+ (10 Gbit/s)";
        default:                     return "Unknown";
    }
}

std::string transferTypeName(TransferType type) {
    switch (type) {
        case TransferType::Control:     return "Control";
        case TransferType::Isochronous: return "Isochronous";
        case TransferType::Bulk:        return "Bulk";
        case TransferType::Interrupt:   return "Interrupt";
        default:                        return "Unknown";
    }
}

std::string bcdToString(uint16_t bcd) {
    char buffer[8];
    snprintf(buffer, sizeof(buffer), "%x.%02x", bcd >> 8, bcd & 0xFF);
    return buffer;
}

std::string hexByte(uint8_t value) {
    char buffer[8];
    snprintf(buffer, sizeof(buffer), "0x%02x", value);
    return buffer;
}

std::string hexWord(uint16_t value) {
    char buffer[8];
    snprintf(buffer, sizeof(buffer), "%04x", value);
    return buffer;
}

} // namespace usb_handshake
