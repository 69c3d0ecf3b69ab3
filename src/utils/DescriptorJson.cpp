#include "DescriptorJson.hpp"
#include "UsbNames.hpp"
#include <QDateTime>
#include <QJsonValue>
#include <QString>
#include <cmath>
#include <limits>

namespace usb_handshake {

namespace {

std::optional<unsigned> unsignedFromJson(const QJsonValue& value, unsigned maxValue,
                                         bool allowHexString) {
    if (value.isDouble()) {
        double number = value.toDouble();
        if (number < 0 || number > maxValue || std::floor(number) != number) {
            return std::nullopt;
        }
        return static_cast<unsigned>(number);
    }

    if (allowHexString && value.isString()) {
        QString text = value.toString().trimmed();
        if (text.startsWith("0x", Qt::CaseInsensitive)) {
            text = text.mid(2);
        }
        bool ok = false;
        uint number = text.toUInt(&ok, 16);
        if (!ok || number > maxValue) {
            return std::nullopt;
        }
        return number;
    }

    return std::nullopt;
}

QString isoTimestamp(std::chrono::system_clock::time_point tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
    return QDateTime::fromMSecsSinceEpoch(ms).toUTC().toString(Qt::ISODateWithMs);
}

} // namespace

QJsonObject descriptorToJson(const DeviceDescriptor& descriptor) {
    QJsonObject json;
    json["vendor_id"] = descriptor.vendorId;
    json["product_id"] = descriptor.productId;
    json["bus"] = descriptor.busNumber;
    json["address"] = descriptor.deviceAddress;

    if (descriptor.serial) {
        json["serial"] = QString::fromStdString(*descriptor.serial);
    }
    if (descriptor.manufacturer) {
        json["manufacturer"] = QString::fromStdString(*descriptor.manufacturer);
    }
    if (descriptor.product) {
        json["product"] = QString::fromStdString(*descriptor.product);
    }

    json["device_class"] = QString::fromStdString(hexByte(descriptor.deviceClass));
    json["device_subclass"] = QString::fromStdString(hexByte(descriptor.deviceSubClass));
    json["device_protocol"] = QString::fromStdString(hexByte(descriptor.deviceProtocol));
    json["usb_version"] = QString::fromStdString(bcdToString(descriptor.usbVersion));
    json["speed"] = QString::fromStdString(speedToken(descriptor.speed));
    json["max_power_ma"] = descriptor.maxPowerMa;
    json["captured_at"] = isoTimestamp(descriptor.capturedAt);
    return json;
}

std::optional<DeviceIdentifier> identifierFromJson(const QJsonObject& json) {
    constexpr unsigned maxWord = std::numeric_limits<uint16_t>::max();
    constexpr unsigned maxByte = std::numeric_limits<uint8_t>::max();

    auto vendorId = unsignedFromJson(json.value("vendor_id"), maxWord, true);
    auto productId = unsignedFromJson(json.value("product_id"), maxWord, true);
    auto bus = unsignedFromJson(json.value("bus"), maxByte, false);
    auto address = unsignedFromJson(json.value("address"), maxByte, false);

    if (!vendorId || !productId || !bus || !address) {
        return std::nullopt;
    }

    DeviceIdentifier id;
    id.vendorId = static_cast<uint16_t>(*vendorId);
    id.productId = static_cast<uint16_t>(*productId);
    id.busNumber = static_cast<uint8_t>(*bus);
    id.deviceAddress = static_cast<uint8_t>(*address);
    return id;
}

} // namespace usb_handshake
