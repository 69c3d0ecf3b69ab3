#pragma once
#include <usb-handshake/Types.hpp>
#include <vector>

namespace usb_handshake {

class DeviceEnumerator;

struct PollResult {
    std::vector<DeviceDescriptor> newlyDetected;
    KnownDeviceSet knownKeys;
};

// Enumerates once and reports the devices whose identity is not yet in
// knownKeys, in enumeration order. The returned set is knownKeys plus the
// new identities. Throws BackendUnavailable if enumeration fails, in which
// case nothing is consumed.
PollResult pollOnce(DeviceEnumerator& enumerator, KnownDeviceSet knownKeys);

}
