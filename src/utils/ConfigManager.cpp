#include "ConfigManager.hpp"
#include "../core/Logger.hpp"
#include <tray-notifier/Constants.hpp>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <cmath>
#include <optional>

namespace tray_notifier {

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

    std::optional<ConfigValue> fromJsonValue(const QJsonValue& json) const {
        switch (json.type()) {
            case QJsonValue::Double: {
                double value = json.toDouble();
                if (std::trunc(value) == value) {
                    return json.toInt();
                }
                return std::nullopt;
            }
            case QJsonValue::String:
                return json.toString().toStdString();
            default:
                return std::nullopt;
        }
    }

    void setDefaults() {
        globalSettings = {
            {"port", DEFAULT_PORT},
            {"defaultIcon", std::string(DEFAULT_ICON)},
            {"soundProperty", std::string(DEFAULT_SOUND_PROPERTY)},
            {"bindAddress", std::string(DEFAULT_BIND_ADDRESS)},
            {"iconRoot", std::string(DEFAULT_ICON_ROOT)},
            {"workerThreads", DEFAULT_WORKER_THREADS},
            {"stopGracePeriodMs", STOP_GRACE_PERIOD},
            {"logLevel", 1},
            {"logMaxFileSize", DEFAULT_LOG_MAX_FILE_SIZE}
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

bool ConfigManager::contains(const std::string& key) const {
    return d->globalSettings.find(key) != d->globalSettings.end();
}

void ConfigManager::setInt(const std::string& key, int value) {
    d->globalSettings[key] = value;
}

void ConfigManager::setString(const std::string& key, const std::string& value) {
    d->globalSettings[key] = value;
}

NotifierConfig ConfigManager::notifierConfig() const {
    NotifierConfig config{
        getInt("port", DEFAULT_PORT),
        getString("defaultIcon", DEFAULT_ICON),
        getString("soundProperty", DEFAULT_SOUND_PROPERTY),
        getString("bindAddress", DEFAULT_BIND_ADDRESS),
        getString("iconRoot", DEFAULT_ICON_ROOT),
        getInt("workerThreads", DEFAULT_WORKER_THREADS),
        std::chrono::milliseconds(getInt("stopGracePeriodMs", STOP_GRACE_PERIOD))
    };
    return config.normalized();
}

bool ConfigManager::loadFromFile(const std::string& filename) {
    QFile file(QString::fromStdString(filename));
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARNING("Cannot open configuration file " + filename);
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (doc.isNull() || !doc.isObject()) {
        LOG_WARNING("Invalid configuration file " + filename + ": " +
                    parseError.errorString().toStdString());
        return false;
    }

    QJsonObject globals = doc.object()["global"].toObject();
    for (auto it = globals.begin(); it != globals.end(); ++it) {
        std::string key = it.key().toStdString();
        d->globalSettings[key] = d->fromJsonValue(it.value());
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
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }

    return file.write(QJsonDocument(root).toJson()) >= 0;
}

void ConfigManager::resetToDefaults() {
    d->setDefaults();
}

}
