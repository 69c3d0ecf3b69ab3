#pragma once
#include <memory>
#include <string>
#include <variant>

namespace usb_handshake {

using ConfigValue = std::variant<int, std::string>;

class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    int getInt(const std::string& key, int defaultValue = 0) const;
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    void setInt(const std::string& key, int value);
    void setString(const std::string& key, const std::string& value);

    // Reads {"global": {...}}. Values whose JSON type does not match the
    // setting's type are ignored with a warning. Returns false if the file
    // cannot be opened or is not a JSON object.
    bool loadFromFile(const std::string& filename);

    // Writes every setting as {"global": {...}}.
    bool saveToFile(const std::string& filename) const;

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
