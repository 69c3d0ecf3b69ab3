#include "ConfigManager.hpp"
#include "Logger.hpp"
#include <usb-handshake/Constants.hpp>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <cmath>
#include <map>
#include <optional>

namespace usb_handshake {

template<class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

class ConfigManager::Private {
public:
    std::map<std::string, ConfigValue> globalSettings;

    QJsonValue toJsonValue(const ConfigValue& value) const {
        return std::visit(overloaded{
            [](int i) -> QJsonValue { return i; },
            [](const std::string& s) -> QJsonValue { return QString::fromStdString(s); }
        }, value);
    }

    // Converts json to the alternative held by current, if compatible.
    std::optional<ConfigValue> fromJsonValue(const QJsonValue& json,
                                             const ConfigValue& current) const {
        return std::visit(overloaded{
            [&](int) -> std::optional<ConfigValue> {
                if (json.isDouble() && std::floor(json.toDouble()) == json.toDouble()) {
                    return ConfigValue{json.toInt()};
                }
                return std::nullopt;
            },
            [&](const std::string&) -> std::optional<ConfigValue> {
                if (json.isString()) return ConfigValue{json.toString().toStdString()};
                return std::nullopt;
            }
        }, current);
    }

    void setDefaults() {
        globalSettings = {
            {"pollInterval", POLLING_INTERVAL},
            {"handshakeFile", std::string(DEFAULT_HANDSHAKE_FILE)},
            {"backendFailurePolicy", std::string("retry")},
            {"maxBackendFailures", 0},
            {"logLevel", 1}
        };
    }
};

ConfigManager::ConfigManager()
    : d(std::make_unique<Private>()) {
    d->setDefaults();
}

ConfigManager::~ConfigManager() = default;

int ConfigManager::getInt(const std::string& key, int defaultValue) const {
    auto it = d->globalSettings.find(key);
    if (it != d->globalSettings.end()) {
        if (std::holds_alternative<int>(it->second)) {
            return std::get<int>(it->second);
        }
    }
    return defaultValue;
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    auto it = d->globalSettings.find(key);
    if (it != d->globalSettings.end()) {
        if (std::holds_alternative<std::string>(it->second)) {
            return std::get<std::string>(it->second);
        }
    }
    return defaultValue;
}

void ConfigManager::setInt(const std::string& key, int value) {
    d->globalSettings[key] = value;
}

void ConfigManager::setString(const std::string& key, const std::string& value) {
    d->globalSettings[key] = value;
}

bool ConfigManager::loadFromFile(const std::string& filename) {
    QFile file(QString::fromStdString(filename));
    if (!file.open(QIODevice::ReadOnly)) {
        return false;
    }

    QJsonDocument doc = QJsonDocument::fromJson(file.readAll());
    if (!doc.isObject()) {
        return false;
    }

    QJsonObject globals = doc.object().value("global").toObject();
    for (auto it = globals.begin(); it != globals.end(); ++it) {
        std::string key = it.key().toStdString();

        auto current = d->globalSettings.find(key);
        if (current == d->globalSettings.end()) {
            LOG_WARNING("Ignoring unknown setting '" + key + "' in " + filename);
            continue;
        }

        auto value = d->fromJsonValue(it.value(), current->second);
        if (!value) {
            LOG_WARNING("Ignoring setting '" + key + "' in " + filename +
                        ": unexpected value type");
            continue;
        }

        current->second = std::move(*value);
    }

    return true;
}

bool ConfigManager::saveToFile(const std::string& filename) const {
    QJsonObject globals;
    for (const auto& [key, value] : d->globalSettings) {
        globals[QString::fromStdString(key)] = d->toJsonValue(value);
    }

    QJsonObject root;
    root["global"] = globals;

    QFile file(QString::fromStdString(filename));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }

    QByteArray data = QJsonDocument(root).toJson(QJsonDocument::Indented);
    return file.write(data) == data.size();
}

}
