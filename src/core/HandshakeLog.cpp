#include "HandshakeLog.hpp"
#include "DescriptorJson.hpp"
#include "Logger.hpp"
#include <usb-handshake/Errors.hpp>
#include <QDateTime>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>

namespace usb_handshake {

HandshakeLog::HandshakeLog(std::string path)
    : m_path(std::move(path)) {
}

const std::string& HandshakeLog::path() const {
    return m_path;
}

QJsonArray HandshakeLog::read() const {
    QFile file(QString::fromStdString(m_path));
    if (!file.exists()) {
        return {};
    }

    if (!file.open(QIODevice::ReadOnly)) {
        throw PersistenceReadError("Cannot open handshake log " + m_path + ": " +
                                   file.errorString().toStdString());
    }

    const QByteArray data = file.readAll();
    if (data.trimmed().isEmpty()) {
        return {};
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        throw PersistenceFormatError("Handshake log " + m_path + " is not valid JSON (offset " +
                                   std::to_string(parseError.offset) + "): " +
                                   parseError.errorString().toStdString());
    }
    if (!doc.isArray()) {
        throw PersistenceFormatError("Handshake log " + m_path + " is not a JSON array");
    }

    return doc.array();
}

KnownDeviceSet HandshakeLog::knownKeys() const {
    QJsonArray entries;
    try {
        entries = read();
    } catch (const PersistenceReadError& e) {
        LOG_WARNING(std::string(e.what()) + ", starting with no known devices");
        return {};
    }

    KnownDeviceSet keys;
    int index = 0;
    for (const QJsonValue& entry : entries) {
        auto id = entry.isObject() ? identifierFromJson(entry.toObject())
                                   : std::nullopt;
        if (id) {
            keys.insert(*id);
        } else {
            LOG_DEBUG("Skipping record " + std::to_string(index) +
                      " without a device identity");
        }
        ++index;
    }
    return keys;
}

void HandshakeLog::append(const std::vector<DeviceDescriptor>& descriptors) {
    if (descriptors.empty()) {
        return;
    }

    QJsonArray entries;
    try {
        entries = read();
    } catch (const PersistenceFormatError& e) {
        LOG_WARNING(std::string(e.what()) + ", starting a new log");
        quarantineCorruptFile();
    } catch (const PersistenceReadError& e) {
        throw PersistenceWriteError(e.what());
    }

    for (const auto& descriptor : descriptors) {
        entries.append(descriptorToJson(descriptor));
    }

    const QByteArray data = QJsonDocument(entries).toJson(QJsonDocument::Indented);

    // QSaveFile discards the temporary copy unless commit() succeeds.
    QSaveFile file(QString::fromStdString(m_path));
    if (!file.open(QIODevice::WriteOnly)) {
        throw PersistenceWriteError("Cannot open handshake log " + m_path +
                                    " for writing: " + file.errorString().toStdString());
    }

    if (file.write(data) != data.size()) {
        const std::string reason = file.errorString().toStdString();
        file.cancelWriting();
        throw PersistenceWriteError("Failed to write handshake log " + m_path + ": " + reason);
    }

    if (!file.commit()) {
        throw PersistenceWriteError("Failed to commit handshake log " + m_path + ": " +
                                    file.errorString().toStdString());
    }

    LOG_DEBUG("Handshake log " + m_path + " now holds " +
              std::to_string(entries.size()) + " records");
}

void HandshakeLog::quarantineCorruptFile() const {
    const QString source = QString::fromStdString(m_path);
    const QString target = source + ".corrupt-" +
        QDateTime::currentDateTime().toString("yyyyMMdd_HHmmss");

    if (QFile::rename(source, target)) {
        LOG_WARNING("Moved unreadable handshake log to " + target.toStdString());
    } else {
        LOG_WARNING("Could not move unreadable handshake log aside, it will be overwritten");
    }
}

} // namespace usb_handshake
