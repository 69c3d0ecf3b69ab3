#pragma once
#include <usb-handshake/Types.hpp>
#include <cstdint>
#include <string>

namespace usb_handshake {

// Human readable USB class name, "Unknown (0xNN)" for unassigned codes.
std::string className(uint8_t classCode);

// Lowercase token used in the handshake log: "low", "super_plus", ...
std::string speedToken(DeviceSpeed speed);

// "High (480 Mbit/s)"
std::string speedLabel(DeviceSpeed speed);

std::string transferTypeName(TransferType type);

// BCD release number as "2.00"
std::string bcdToString(uint16_t bcd);

// "0x08"
std::string hexByte(uint8_t value);

// "046d"
std::string hexWord(uint16_t value);

}
