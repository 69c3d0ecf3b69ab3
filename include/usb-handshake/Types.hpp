#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace usb_handshake {

// Identity of one physical connection. The address changes on replug,
// which turns the same hardware into a new key.
struct DeviceIdentifier {
    uint16_t vendorId{0};
    uint16_t productId{0};
    uint8_t busNumber{0};
    uint8_t deviceAddress{0};

    bool operator==(const DeviceIdentifier& other) const {
        return vendorId == other.vendorId &&
               productId == other.productId &&
               busNumber == other.busNumber &&
               deviceAddress == other.deviceAddress;
    }

    bool operator!=(const DeviceIdentifier& other) const {
        return !(*this == other);
    }

    bool operator<(const DeviceIdentifier& other) const {
        return std::tie(vendorId, productId, busNumber, deviceAddress) <
               std::tie(other.vendorId, other.productId,
                        other.busNumber, other.deviceAddress);
    }
};

using KnownDeviceSet = std::set<DeviceIdentifier>;

enum class DeviceSpeed {
    Unknown,
    Low,        // 1.5 Mbit/s
    Full,       // 12 Mbit/s
    High,       // 480 Mbit/s
    Super,      // 5 Gbit/s
    SuperPlus   // 10 Gbit/s
};

enum class DeviceClass {
    Unspecified = 0x00,
    Audio = 0x01,
    CDC = 0x02,
    HID = 0x03,
    Physical = 0x05,
    Image = 0x06,
    Printer = 0x07,
    MassStorage = 0x08,
    Hub = 0x09,
    CDC_Data = 0x0A,
    SmartCard = 0x0B,
    ContentSecurity = 0x0D,
    Video = 0x0E,
    PersonalHealthcare = 0x0F,
    AudioVideo = 0x10,
    Billboard = 0x11,
    TypeCBridge = 0x12,
    Diagnostic = 0xDC,
    Wireless = 0xE0,
    Miscellaneous = 0xEF,
    ApplicationSpecific = 0xFE,
    VendorSpecific = 0xFF
};

struct DeviceDescriptor {
    uint16_t vendorId{0};
    uint16_t productId{0};
    uint8_t busNumber{0};
    uint8_t deviceAddress{0};
    std::optional<std::string> serial;
    std::optional<std::string> manufacturer;
    std::optional<std::string> product;
    uint8_t deviceClass{0};
    uint8_t deviceSubClass{0};
    uint8_t deviceProtocol{0};
    uint16_t usbVersion{0};     // bcdUSB
    uint16_t deviceVersion{0};  // bcdDevice
    DeviceSpeed speed{DeviceSpeed::Unknown};
    uint16_t maxPowerMa{0};
    std::chrono::system_clock::time_point capturedAt{};

    DeviceIdentifier identifier() const {
        return {vendorId, productId, busNumber, deviceAddress};
    }
};

enum class TransferType {
    Control = 0,
    Isochronous = 1,
    Bulk = 2,
    Interrupt = 3
};

struct EndpointInfo {
    uint8_t address{0};
    uint16_t maxPacketSize{0};
    TransferType type{TransferType::Control};

    bool isInput() const { return (address & 0x80) != 0; }
};

struct InterfaceInfo {
    uint8_t number{0};
    uint8_t alternateSetting{0};
    uint8_t interfaceClass{0};
    uint8_t interfaceSubClass{0};
    uint8_t interfaceProtocol{0};
    std::vector<EndpointInfo> endpoints;
};

struct ConfigurationInfo {
    uint8_t value{0};
    uint16_t totalLength{0};
    uint8_t numInterfaces{0};
    uint16_t maxPowerMa{0};
    bool selfPowered{false};
    bool remoteWakeup{false};
    std::vector<InterfaceInfo> interfaces;
};

}
