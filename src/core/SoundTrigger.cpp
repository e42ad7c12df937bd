#include "SoundTrigger.hpp"
#include "Logger.hpp"
#include <QApplication>
#include <QMetaObject>
#include <map>

#ifdef Q_OS_WIN
#include <windows.h>
#endif

namespace tray_notifier {

namespace {

class BeepSoundTrigger : public SoundTrigger {
public:
    // Widgets are GUI-thread only; workers post the beep there
    void play() override {
        auto* app = qobject_cast<QApplication*>(QCoreApplication::instance());
        if (!app) {
            LOG_DEBUG("No GUI application instance, beep skipped");
            return;
        }
        if (!QMetaObject::invokeMethod(app, []() { QApplication::beep(); }, Qt::QueuedConnection)) {
            LOG_WARNING("Failed to post beep to the GUI thread");
        }
    }
    std::string name() const override { return "qt.beep"; }
};

#ifdef Q_OS_WIN
class MessageBeepSoundTrigger : public SoundTrigger {
public:
    MessageBeepSoundTrigger(std::string property, UINT type)
        : property_(std::move(property)), type_(type) {}

    void play() override {
        if (!MessageBeep(type_)) {
            LOG_DEBUG("MessageBeep failed for " + property_);
        }
    }
    std::string name() const override { return property_; }

private:
    std::string property_;
    UINT type_;
};

const std::map<std::string, UINT>& windowsSoundProperties() {
    static const std::map<std::string, UINT> properties = {
        {"win.sound.asterisk", MB_ICONASTERISK},
        {"win.sound.default", MB_OK},
        {"win.sound.exclamation", MB_ICONEXCLAMATION},
        {"win.sound.hand", MB_ICONHAND},
        {"win.sound.question", MB_ICONQUESTION}
    };
    return properties;
}
#endif

}

std::unique_ptr<SoundTrigger> resolveSoundTrigger(const std::string& property) {
    if (property == "qt.beep") {
        return std::make_unique<BeepSoundTrigger>();
    }

#ifdef Q_OS_WIN
    const auto& properties = windowsSoundProperties();
    auto it = properties.find(property);
    if (it != properties.end()) {
        return std::make_unique<MessageBeepSoundTrigger>(it->first, it->second);
    }
#endif

    LOG_INFO("Desktop sound property '" + property + "' is not available, notifications will be silent");
    return std::make_unique<NullSoundTrigger>();
}

}
