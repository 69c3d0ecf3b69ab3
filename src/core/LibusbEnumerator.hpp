#pragma once
#include "DeviceEnumerator.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct libusb_context;

namespace usb_handshake {

class UsbDevice;

// A device that was listed but whose device descriptor could not be read.
struct SkippedDevice {
    uint8_t busNumber;
    uint8_t deviceAddress;
    std::string reason;
};

// DeviceEnumerator backed by a private libusb context.
class LibusbEnumerator : public DeviceEnumerator {
public:
    // Throws BackendUnavailable when libusb cannot be initialised.
    LibusbEnumerator();
    ~LibusbEnumerator() override;

    LibusbEnumerator(const LibusbEnumerator&) = delete;
    LibusbEnumerator& operator=(const LibusbEnumerator&) = delete;

    std::vector<DeviceDescriptor> enumerate() override;

    // Attached devices in backend order. Devices whose descriptor cannot be
    // read are logged and left out; they are also added to skipped when it
    // is given.
    std::vector<std::unique_ptr<UsbDevice>> devices(std::vector<SkippedDevice>* skipped = nullptr);

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
