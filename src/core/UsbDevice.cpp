#include "UsbDevice.hpp"
#include "Logger.hpp"
#include <usb-handshake/Constants.hpp>
#include <usb-handshake/Errors.hpp>
#include <optional>

namespace usb_handshake {

namespace {

struct ConfigDescriptorDeleter {
    void operator()(libusb_config_descriptor* config) const {
        libusb_free_config_descriptor(config);
    }
};

using ConfigDescriptorPtr =
    std::unique_ptr<libusb_config_descriptor, ConfigDescriptorDeleter>;

DeviceSpeed toDeviceSpeed(int speed) {
    switch (speed) {
        case LIBUSB_SPEED_LOW:   return DeviceSpeed::Low;
        case LIBUSB_SPEED_FULL:  return DeviceSpeed::Full;
        case LIBUSB_SPEED_HIGH:  return DeviceSpeed::High;
        case LIBUSB_SPEED_SUPER: return DeviceSpeed::Super;
#if defined(LIBUSB_API_VERSION) && LIBUSB_API_VERSION >= 0x01000106
        case LIBUSB_SPEED_SUPER_PLUS: return DeviceSpeed::SuperPlus;
#endif
        default: return DeviceSpeed::Unknown;
    }
}

// bMaxPower is in 2mA units, 8mA units at SuperSpeed and above.
uint16_t maxPowerMilliamps(const libusb_config_descriptor& config, DeviceSpeed speed) {
    const unsigned unit = (speed == DeviceSpeed::Super ||
                           speed == DeviceSpeed::SuperPlus) ? 8 : 2;
    return static_cast<uint16_t>(config.MaxPower * unit);
}

std::string deviceLabel(const DeviceIdentifier& id) {
    return "bus " + std::to_string(id.busNumber) +
           " address " + std::to_string(id.deviceAddress);
}

} // namespace

class UsbDevice::Private {
public:
    libusb_device* device{nullptr};
    libusb_device_handle* handle{nullptr};
    libusb_device_descriptor descriptor{};
    DeviceIdentifier identifier{};
    DeviceSpeed speed{DeviceSpeed::Unknown};

    void updateIdentifier() {
        identifier.busNumber = libusb_get_bus_number(device);
        identifier.deviceAddress = libusb_get_device_address(device);
        identifier.vendorId = descriptor.idVendor;
        identifier.productId = descriptor.idProduct;
    }

    std::optional<std::string> getStringDescriptor(uint8_t index) {
        if (!handle || index == 0) return std::nullopt;

        unsigned char buffer[MAX_STRING_LENGTH];
        int ret = libusb_get_string_descriptor_ascii(
            handle, index, buffer, sizeof(buffer));

        if (ret < 0) {
            LOG_DEBUG("String descriptor " + std::to_string(index) + " of " +
                      deviceLabel(identifier) + " unavailable: " +
                      libusb_error_name(ret));
            return std::nullopt;
        }
        return std::string(reinterpret_cast<char*>(buffer), ret);
    }

    ConfigDescriptorPtr powerConfig() const {
        libusb_config_descriptor* config = nullptr;
        if (libusb_get_active_config_descriptor(device, &config) == LIBUSB_SUCCESS) {
            return ConfigDescriptorPtr(config);
        }
        // Unconfigured devices still report their first configuration.
        if (descriptor.bNumConfigurations > 0 &&
            libusb_get_config_descriptor(device, 0, &config) == LIBUSB_SUCCESS) {
            return ConfigDescriptorPtr(config);
        }
        return nullptr;
    }
};

UsbDevice::UsbDevice(libusb_device* device)
    : d(std::make_unique<Private>()) {

    d->device = device;
    libusb_ref_device(device);

    int ret = libusb_get_device_descriptor(device, &d->descriptor);
    if (ret != LIBUSB_SUCCESS) {
        libusb_unref_device(device);
        d->device = nullptr;
        throw DeviceQueryError("Failed to read device descriptor: " +
                               std::string(libusb_error_name(ret)), ret);
    }
    d->updateIdentifier();
    d->speed = toDeviceSpeed(libusb_get_device_speed(device));
}

UsbDevice::~UsbDevice() {
    close();
    if (d->device) {
        libusb_unref_device(d->device);
    }
}

DeviceDescriptor UsbDevice::descriptor() {
    DeviceDescriptor result;
    result.vendorId = d->identifier.vendorId;
    result.productId = d->identifier.productId;
    result.busNumber = d->identifier.busNumber;
    result.deviceAddress = d->identifier.deviceAddress;
    result.deviceClass = d->descriptor.bDeviceClass;
    result.deviceSubClass = d->descriptor.bDeviceSubClass;
    result.deviceProtocol = d->descriptor.bDeviceProtocol;
    result.usbVersion = d->descriptor.bcdUSB;
    result.deviceVersion = d->descriptor.bcdDevice;
    result.speed = d->speed;
    result.capturedAt = std::chrono::system_clock::now();

    if (auto config = d->powerConfig()) {
        result.maxPowerMa = maxPowerMilliamps(*config, d->speed);
    }

    const bool wasOpen = isOpen();
    if (wasOpen || open()) {
        result.manufacturer = d->getStringDescriptor(d->descriptor.iManufacturer);
        result.product = d->getStringDescriptor(d->descriptor.iProduct);
        result.serial = d->getStringDescriptor(d->descriptor.iSerialNumber);
        if (!wasOpen) {
            close();
        }
    }

    return result;
}

std::vector<ConfigurationInfo> UsbDevice::configurations() const {
    std::vector<ConfigurationInfo> result;

    for (uint8_t i = 0; i < d->descriptor.bNumConfigurations; ++i) {
        libusb_config_descriptor* raw = nullptr;
        int ret = libusb_get_config_descriptor(d->device, i, &raw);
        if (ret != LIBUSB_SUCCESS) {
            LOG_WARNING("Configuration " + std::to_string(i) + " of " +
                        deviceLabel(d->identifier) + " unreadable: " +
                        libusb_error_name(ret));
            continue;
        }
        ConfigDescriptorPtr config(raw);

        ConfigurationInfo info;
        info.value = config->bConfigurationValue;
        info.totalLength = config->wTotalLength;
        info.numInterfaces = config->bNumInterfaces;
        info.maxPowerMa = maxPowerMilliamps(*config, d->speed);
        info.selfPowered = (config->bmAttributes & 0x40) != 0;
        info.remoteWakeup = (config->bmAttributes & 0x20) != 0;

        for (int n = 0; n < config->bNumInterfaces; ++n) {
            const libusb_interface& iface = config->interface[n];
            for (int alt = 0; alt < iface.num_altsetting; ++alt) {
                const libusb_interface_descriptor& setting = iface.altsetting[alt];

                InterfaceInfo intf;
                intf.number = setting.bInterfaceNumber;
                intf.alternateSetting = setting.bAlternateSetting;
                intf.interfaceClass = setting.bInterfaceClass;
                intf.interfaceSubClass = setting.bInterfaceSubClass;
                intf.interfaceProtocol = setting.bInterfaceProtocol;

                for (int e = 0; e < setting.bNumEndpoints; ++e) {
                    const libusb_endpoint_descriptor& ep = setting.endpoint[e];
                    EndpointInfo endpoint;
                    endpoint.address = ep.bEndpointAddress;
                    endpoint.maxPacketSize = ep.wMaxPacketSize;
                    endpoint.type = static_cast<TransferType>(
                        ep.bmAttributes & LIBUSB_TRANSFER_TYPE_MASK);
                    intf.endpoints.push_back(endpoint);
                }
                info.interfaces.push_back(std::move(intf));
            }
        }
        result.push_back(std::move(info));
    }

    return result;
}

bool UsbDevice::open() {
    if (d->handle) return true;

    int ret = libusb_open(d->device, &d->handle);
    if (ret != LIBUSB_SUCCESS) {
        d->handle = nullptr;
        LOG_DEBUG("Cannot open " + deviceLabel(d->identifier) + ": " +
                  libusb_error_name(ret) + ", string descriptors unavailable");
        return false;
    }
    return true;
}

void UsbDevice::close() {
    if (d->handle) {
        libusb_close(d->handle);
        d->handle = nullptr;
    }
}

bool UsbDevice::isOpen() const {
    return d->handle != nullptr;
}

} // namespace usb_handshake
