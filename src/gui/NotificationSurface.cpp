#include "NotificationSurface.hpp"
#include "../core/Logger.hpp"
#include "../core/SoundTrigger.hpp"
#include <tray-notifier/Errors.hpp>

namespace tray_notifier {

NotificationSurface::NotificationSurface(std::unique_ptr<TrayBackend> backend,
                                         TrayImage defaultImage,
                                         const QString& toolTip)
    : backend_(std::move(backend))
    , defaultImage_(std::move(defaultImage))
    , current_(defaultImage_) {

    backend_->setImage(defaultImage_.image);
    backend_->setToolTip(toolTip);
    backend_->setClickHandler([this](int clickCount) {
        handleClick(clickCount);
    });
}

NotificationSurface::~NotificationSurface() {
    backend_->setClickHandler(nullptr);
    try {
        detach();
    } catch (const std::exception& e) {
        LOG_WARNING(std::string("Failed to remove tray icon: ") + e.what());
    }
}

void NotificationSurface::attach() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (attached_) {
        return;
    }
    if (!backend_->isAvailable()) {
        throw TraySetupError("System tray is not available");
    }
    backend_->show();
    attached_ = true;
    LOG_DEBUG("Tray icon attached");
}

void NotificationSurface::detach() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!attached_) {
        return;
    }
    backend_->hide();
    attached_ = false;
    LOG_DEBUG("Tray icon detached");
}

bool NotificationSurface::isAttached() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attached_;
}

void NotificationSurface::display(const QString& title, const QString& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    displayLocked(title, message);
}

void NotificationSurface::setImage(const TrayImage& image) {
    std::lock_guard<std::mutex> lock(mutex_);
    setImageLocked(image);
}

void NotificationSurface::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    setImageLocked(defaultImage_);
}

void NotificationSurface::notify(const QString& title,
                                 const QString& message,
                                 const TrayImage& image,
                                 SoundTrigger& sound) {
    std::lock_guard<std::mutex> lock(mutex_);
    displayLocked(title, message);
    setImageLocked(image);

    try {
        sound.play();
    } catch (const std::exception& e) {
        LOG_WARNING("Sound " + sound.name() + " failed: " + e.what());
    }
}

TrayImage NotificationSurface::currentImage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

ClickAction NotificationSurface::actionForClickCount(int clickCount) {
    if (clickCount == 2) {
        return ClickAction::Shutdown;
    }
    if (clickCount > 0) {
        return ClickAction::Reset;
    }
    return ClickAction::None;
}

void NotificationSurface::handleClick(int clickCount) {
    switch (actionForClickCount(clickCount)) {
        case ClickAction::Reset:
            reset();
            break;

        case ClickAction::Shutdown: {
            std::function<void()> handler;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                handler = shutdownHandler_;
            }
            // Shutdown detaches the surface, so it runs outside the lock
            if (handler) {
                handler();
            }
            break;
        }

        case ClickAction::None:
            break;
    }
}

void NotificationSurface::setShutdownHandler(std::function<void()> handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdownHandler_ = std::move(handler);
}

void NotificationSurface::displayLocked(const QString& title, const QString& message) {
    try {
        backend_->showMessage(title, message);
    } catch (const std::exception& e) {
        LOG_WARNING(std::string("Failed to display notification: ") + e.what());
    }
}

void NotificationSurface::setImageLocked(const TrayImage& image) {
    backend_->setImage(image.image);
    current_ = image;
}

}
