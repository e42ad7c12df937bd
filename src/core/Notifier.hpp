#pragma once
#include "SoundTrigger.hpp"
#include "../gui/TrayBackend.hpp"
#include <tray-notifier/Types.hpp>
#include <QString>
#include <functional>
#include <iostream>
#include <memory>

namespace tray_notifier {

class AssetResolver;
class LifecycleController;
class NotificationSurface;
class RequestHandler;

// HTTP-to-tray notification relay. The configuration is fixed for the
// lifetime of the instance.
class Notifier {
public:
    using ExitHandler = std::function<void(int exitCode)>;

    // Throws ConfigurationError when the tray is unsupported or the default
    // icon cannot be resolved. A null sound resolves config.soundProperty;
    // a null exit handler exits the Qt event loop.
    Notifier(const NotifierConfig& config,
             std::unique_ptr<TrayBackend> backend,
             std::unique_ptr<SoundTrigger> sound = nullptr,
             ExitHandler exitHandler = nullptr,
             std::ostream& out = std::cout);
    ~Notifier();

    Notifier(const Notifier&) = delete;
    Notifier& operator=(const Notifier&) = delete;

    void start();
    void stop();

    // Double click on the tray icon: stop and exit with code 0
    void shutdown();

    const NotifierConfig& config() const { return config_; }
    const AssetResolver& resolver() const { return *resolver_; }
    NotificationSurface& surface() { return *surface_; }
    RequestHandler& handler() { return *handler_; }
    LifecycleController& controller() { return *controller_; }
    const SoundTrigger& sound() const { return *sound_; }

    static QString toolTipFor(int port);

private:
    const NotifierConfig config_;
    ExitHandler exitHandler_;

    std::unique_ptr<AssetResolver> resolver_;
    std::unique_ptr<SoundTrigger> sound_;
    std::unique_ptr<NotificationSurface> surface_;
    std::unique_ptr<RequestHandler> handler_;
    std::unique_ptr<LifecycleController> controller_;
};

}
