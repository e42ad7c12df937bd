#pragma once
#include <QImage>
#include <QString>
#include <functional>

namespace tray_notifier {

// Platform tray capability as seen by NotificationSurface
class TrayBackend {
public:
    // Receives the toolkit's click count (1 = single, 2 = double)
    using ClickHandler = std::function<void(int clickCount)>;

    virtual ~TrayBackend() = default;

    virtual bool isAvailable() const = 0;
    virtual bool supportsMessages() const = 0;

    // Throws TraySetupError when the platform rejects the icon
    virtual void show() = 0;
    virtual void hide() = 0;

    virtual void setImage(const QImage& image) = 0;
    virtual void setToolTip(const QString& toolTip) = 0;
    virtual void showMessage(const QString& title, const QString& message) = 0;

    virtual void setClickHandler(ClickHandler handler) = 0;
};

}
