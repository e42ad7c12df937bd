#pragma once
#include <memory>
#include <string>

namespace tray_notifier {

class SoundTrigger {
public:
    virtual ~SoundTrigger() = default;

    virtual void play() = 0;
    virtual bool isAvailable() const { return true; }
    virtual std::string name() const = 0;
};

// Used when the desktop property is absent or unsupported
class NullSoundTrigger : public SoundTrigger {
public:
    void play() override {}
    bool isAvailable() const override { return false; }
    std::string name() const override { return "none"; }
};

// Looks the property up once; never returns null
std::unique_ptr<SoundTrigger> resolveSoundTrigger(const std::string& property);

}
