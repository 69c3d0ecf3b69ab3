#include "DeviceSnapshotDiffer.hpp"
#include "DeviceEnumerator.hpp"

namespace usb_handshake {

PollResult pollOnce(DeviceEnumerator& enumerator, KnownDeviceSet knownKeys) {
    auto current = enumerator.enumerate();

    PollResult result;
    for (auto& descriptor : current) {
        // insert() also collapses duplicates within one enumeration
        if (knownKeys.insert(descriptor.identifier()).second) {
            result.newlyDetected.push_back(std::move(descriptor));
        }
    }
    result.knownKeys = std::move(knownKeys);
    return result;
}

} // namespace usb_handshake
