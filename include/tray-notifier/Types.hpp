#pragma once
#include <QImage>
#include <QString>
#include <chrono>
#include <string>

namespace tray_notifier {

struct NotifierConfig {
    int port;
    std::string defaultIcon;
    std::string soundProperty;
    std::string bindAddress;
    std::string iconRoot;
    int workerThreads;
    std::chrono::milliseconds stopGracePeriod;

    // Values that fall back to the built-in defaults when absent or invalid
    static NotifierConfig make(int port,
                               const std::string& defaultIcon = "",
                               const std::string& soundProperty = "");
    NotifierConfig normalized() const;
};

// Resolved, ready-to-display icon
struct TrayImage {
    QString name;
    QString path;
    QImage image;

    bool operator==(const TrayImage& other) const {
        return path == other.path;
    }
    bool operator!=(const TrayImage& other) const {
        return !(*this == other);
    }
};

enum class ClickAction {
    None,
    Reset,
    Shutdown
};

enum class LifecycleState {
    Stopped,
    Starting,
    Running,
    Stopping
};

}
