#pragma once
#include <tray-notifier/Types.hpp>
#include <memory>

namespace tray_notifier {

class NotificationSurface;
class RequestHandler;

// Starts/stops the HTTP listener and attaches/detaches the tray icon as one
// transition: the surface is attached exactly while the listener serves.
class LifecycleController {
public:
    LifecycleController(const NotifierConfig& config,
                        RequestHandler& handler,
                        NotificationSurface& surface);
    ~LifecycleController();

    LifecycleController(const LifecycleController&) = delete;
    LifecycleController& operator=(const LifecycleController&) = delete;

    // Restarts when already running. Throws BindError or TraySetupError,
    // leaving the controller stopped.
    void start();
    // No-op when stopped
    void stop();

    LifecycleState state() const;
    bool isRunning() const;

private:
    void stopLocked();
    void closeListenerLocked();

    class Private;
    std::unique_ptr<Private> d;
};

const char* toString(LifecycleState state);

}
