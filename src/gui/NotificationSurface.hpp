#pragma once
#include "TrayBackend.hpp"
#include <tray-notifier/Types.hpp>
#include <QString>
#include <functional>
#include <memory>
#include <mutex>

namespace tray_notifier {

class SoundTrigger;

// Owns the tray icon state (image, attachment) behind one mutex shared by
// request workers, tray clicks and the lifecycle controller.
class NotificationSurface {
public:
    NotificationSurface(std::unique_ptr<TrayBackend> backend,
                        TrayImage defaultImage,
                        const QString& toolTip);
    ~NotificationSurface();

    NotificationSurface(const NotificationSurface&) = delete;
    NotificationSurface& operator=(const NotificationSurface&) = delete;

    void attach();
    void detach();
    bool isAttached() const;

    void display(const QString& title, const QString& message);
    void setImage(const TrayImage& image);
    void reset();

    // display -> setImage -> sound, applied as one unit
    void notify(const QString& title,
                const QString& message,
                const TrayImage& image,
                SoundTrigger& sound);

    TrayImage currentImage() const;
    const TrayImage& defaultImage() const { return defaultImage_; }

    static ClickAction actionForClickCount(int clickCount);
    void handleClick(int clickCount);
    void setShutdownHandler(std::function<void()> handler);

private:
    void displayLocked(const QString& title, const QString& message);
    void setImageLocked(const TrayImage& image);

    std::unique_ptr<TrayBackend> backend_;
    const TrayImage defaultImage_;

    mutable std::mutex mutex_;
    TrayImage current_;
    bool attached_{false};
    std::function<void()> shutdownHandler_;
};

}
