#include "LibusbEnumerator.hpp"
#include "UsbDevice.hpp"
#include "Logger.hpp"
#include <usb-handshake/Errors.hpp>
#include <libusb-1.0/libusb.h>
#include <string>

namespace usb_handshake {

namespace {

struct DeviceListDeleter {
    void operator()(libusb_device** list) const {
        libusb_free_device_list(list, 1);
    }
};

using DeviceListPtr = std::unique_ptr<libusb_device*, DeviceListDeleter>;

} // namespace

class LibusbEnumerator::Private {
public:
    libusb_context* context{nullptr};
};

LibusbEnumerator::LibusbEnumerator()
    : d(std::make_unique<Private>()) {

    int ret = libusb_init(&d->context);
    if (ret != LIBUSB_SUCCESS) {
        d->context = nullptr;
        throw BackendUnavailable("Failed to initialize libusb: " +
                                 std::string(libusb_error_name(ret)), ret);
    }

    const libusb_version* version = libusb_get_version();
    LOG_DEBUG("libusb " + std::to_string(version->major) + "." +
              std::to_string(version->minor) + "." +
              std::to_string(version->micro) + " initialized");
}

LibusbEnumerator::~LibusbEnumerator() {
    if (d->context) {
        libusb_exit(d->context);
        d->context = nullptr;
    }
}

std::vector<std::unique_ptr<UsbDevice>> LibusbEnumerator::devices(std::vector<SkippedDevice>* skipped) {
    libusb_device** raw = nullptr;
    ssize_t count = libusb_get_device_list(d->context, &raw);
    if (count < 0) {
        int status = static_cast<int>(count);
        throw BackendUnavailable("Failed to get device list: " +
                                 std::string(libusb_error_name(status)), status);
    }
    DeviceListPtr list(raw);

    std::vector<std::unique_ptr<UsbDevice>> result;
    result.reserve(static_cast<size_t>(count));

    for (ssize_t i = 0; i < count; i++) {
        libusb_device* device = list.get()[i];
        try {
            result.push_back(std::make_unique<UsbDevice>(device));
        } catch (const DeviceQueryError& e) {
            const uint8_t bus = libusb_get_bus_number(device);
            const uint8_t address = libusb_get_device_address(device);
            LOG_WARNING("Error accessing device on bus " + std::to_string(bus) +
                        " address " + std::to_string(address) + ": " + e.what());
            if (skipped) {
                skipped->push_back({bus, address, e.what()});
            }
        }
    }

    return result;
}

std::vector<DeviceDescriptor> LibusbEnumerator::enumerate() {
    std::vector<DeviceDescriptor> result;
    for (const auto& device : devices()) {
        result.push_back(device->descriptor());
    }
    return result;
}

} // namespace usb_handshake
