#pragma once
#include <usb-handshake/Types.hpp>
#include <QJsonArray>
#include <string>
#include <vector>

namespace usb_handshake {

// The persisted handshake log: one JSON array of descriptor records.
// Not guarded against other processes writing the same file.
class HandshakeLog {
public:
    explicit HandshakeLog(std::string path);

    const std::string& path() const;

    // Current records. A missing or blank file is an empty log. A file that
    // cannot be opened throws PersistenceReadError, one that is not a JSON
    // array throws PersistenceFormatError.
    QJsonArray read() const;

    // Identities of every well-formed record. Read errors are logged and
    // yield an empty set.
    KnownDeviceSet knownKeys() const;

    // Appends the descriptors after the existing records and rewrites the
    // file atomically. A corrupt file is moved aside first. Throws
    // PersistenceWriteError if the existing file cannot be opened or the new
    // contents cannot be committed.
    void append(const std::vector<DeviceDescriptor>& descriptors);

private:
    void quarantineCorruptFile() const;

    std::string m_path;
};

}
