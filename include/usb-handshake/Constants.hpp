#pragma once

namespace usb_handshake {

constexpr const char* APPLICATION_VERSION = "1.0.0";

constexpr int MAX_STRING_LENGTH = 256;

constexpr int POLLING_INTERVAL = 1000; // ms
constexpr const char* DEFAULT_HANDSHAKE_FILE = "usb_handshake.json";

namespace ExitCodes {
    constexpr int SUCCESS = 0;
    constexpr int FAILURE = 1;
    constexpr int BACKEND_ABORT = 2;
}

}
