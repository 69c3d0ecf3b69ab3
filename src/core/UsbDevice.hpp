#pragma once
#include <usb-handshake/Types.hpp>
#include <libusb-1.0/libusb.h>
#include <memory>
#include <string>
#include <vector>

namespace usb_handshake {

class UsbDevice {
public:
    // Takes a reference on the device. Throws DeviceQueryError when the
    // device descriptor cannot be read.
    explicit UsbDevice(libusb_device* device);
    ~UsbDevice();

    UsbDevice(const UsbDevice&) = delete;
    UsbDevice& operator=(const UsbDevice&) = delete;

    // Snapshot of the device. String fields stay empty when the device
    // cannot be opened or does not report them.
    DeviceDescriptor descriptor();

    std::vector<ConfigurationInfo> configurations() const;

    bool open();
    void close();
    bool isOpen() const;

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
