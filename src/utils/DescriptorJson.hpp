#pragma once
#include <usb-handshake/Types.hpp>
#include <QJsonObject>
#include <optional>

namespace usb_handshake {

// One handshake log record. Optional strings are omitted when absent.
QJsonObject descriptorToJson(const DeviceDescriptor& descriptor);

// Identity key of a log record, std::nullopt if any of vendor_id,
// product_id, bus or address is missing or out of range. IDs are accepted
// as integers or as hex strings ("0x046d").
std::optional<DeviceIdentifier> identifierFromJson(const QJsonObject& json);

}
