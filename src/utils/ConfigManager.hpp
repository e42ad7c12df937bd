#pragma once
#include <memory>
#include <string>
#include <variant>
#include <map>

#include <tray-notifier/Types.hpp>

namespace tray_notifier {

using ConfigValue = std::variant<int, std::string>;

class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // Configuration access
    int getInt(const std::string& key, int defaultValue = 0) const;
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;
    bool contains(const std::string& key) const;

    void setInt(const std::string& key, int value);
    void setString(const std::string& key, const std::string& value);

    // Snapshot of the notifier settings, with fallbacks applied
    NotifierConfig notifierConfig() const;

    // File operations
    bool loadFromFile(const std::string& filename);
    bool saveToFile(const std::string& filename) const;

    void resetToDefaults();

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
