#include <tray-notifier/Types.hpp>
#include <tray-notifier/Constants.hpp>

namespace tray_notifier {

NotifierConfig NotifierConfig::make(int port,
                                    const std::string& defaultIcon,
                                    const std::string& soundProperty) {
    NotifierConfig config{
        port,
        defaultIcon,
        soundProperty,
        DEFAULT_BIND_ADDRESS,
        DEFAULT_ICON_ROOT,
        DEFAULT_WORKER_THREADS,
        std::chrono::milliseconds(STOP_GRACE_PERIOD)
    };
    return config.normalized();
}

NotifierConfig NotifierConfig::normalized() const {
    NotifierConfig config = *this;
    if (config.port <= 0 || config.port > 65535) {
        config.port = DEFAULT_PORT;
    }
    if (config.defaultIcon.empty()) {
        config.defaultIcon = DEFAULT_ICON;
    }
    if (config.soundProperty.empty()) {
        config.soundProperty = DEFAULT_SOUND_PROPERTY;
    }
    if (config.bindAddress.empty()) {
        config.bindAddress = DEFAULT_BIND_ADDRESS;
    }
    if (config.iconRoot.empty()) {
        config.iconRoot = DEFAULT_ICON_ROOT;
    }
    if (config.workerThreads <= 0) {
        config.workerThreads = DEFAULT_WORKER_THREADS;
    }
    if (config.stopGracePeriod.count() <= 0) {
        config.stopGracePeriod = std::chrono::milliseconds(STOP_GRACE_PERIOD);
    }
    return config;
}

}
