#pragma once
#include <usb-handshake/Types.hpp>
#include <vector>

namespace usb_handshake {

// Source of device snapshots for the differ.
class DeviceEnumerator {
public:
    virtual ~DeviceEnumerator() = default;

    // Descriptors of every attached device, in backend order. An empty
    // vector means no devices are attached; a backend that cannot be
    // reached throws BackendUnavailable instead.
    virtual std::vector<DeviceDescriptor> enumerate() = 0;
};

}
