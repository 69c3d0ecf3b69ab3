#pragma once
#include <stdexcept>
#include <string>

namespace usb_handshake {

class UsbHandshakeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The USB subsystem cannot be reached: libusb failed to initialise or to
// produce a device list. status() holds the libusb error code, 0 if none.
class BackendUnavailable : public UsbHandshakeError {
public:
    explicit BackendUnavailable(const std::string& message, int status = 0)
        : UsbHandshakeError(message)
        , m_status(status) {}

    int status() const { return m_status; }

private:
    int m_status;
};

class PersistenceReadError : public UsbHandshakeError {
public:
    using UsbHandshakeError::UsbHandshakeError;
};

// The file was read but its contents are not a JSON array.
class PersistenceFormatError : public PersistenceReadError {
public:
    using PersistenceReadError::PersistenceReadError;
};

class PersistenceWriteError : public UsbHandshakeError {
public:
    using UsbHandshakeError::UsbHandshakeError;
};

// One device could not be queried. Callers degrade that device instead of
// failing the whole enumeration.
class DeviceQueryError : public UsbHandshakeError {
public:
    DeviceQueryError(const std::string& message, int status)
        : UsbHandshakeError(message)
        , m_status(status) {}

    int status() const { return m_status; }

private:
    int m_status;
};

}
