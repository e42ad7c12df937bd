#include "SystemTrayBackend.hpp"
#include "../core/Logger.hpp"
#include <tray-notifier/Constants.hpp>
#include <tray-notifier/Errors.hpp>
#include <QIcon>
#include <QMetaObject>
#include <QPixmap>
#include <QThread>
#include <mutex>

namespace tray_notifier {

class SystemTrayBackend::Private {
public:
    QSystemTrayIcon* trayIcon{nullptr};
    std::mutex handlerMutex;
    ClickHandler clickHandler;
};

SystemTrayBackend::SystemTrayBackend(QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {

    d->trayIcon = new QSystemTrayIcon(this);

    connect(d->trayIcon, &QSystemTrayIcon::activated,
            this, &SystemTrayBackend::handleActivated);
}

SystemTrayBackend::~SystemTrayBackend() = default;

bool SystemTrayBackend::isAvailable() const {
    return QSystemTrayIcon::isSystemTrayAvailable();
}

bool SystemTrayBackend::supportsMessages() const {
    return QSystemTrayIcon::supportsMessages();
}

void SystemTrayBackend::show() {
    if (!isAvailable()) {
        throw TraySetupError("System tray is not available");
    }
    runOnOwnerThread([this]() {
        d->trayIcon->show();
    });
}

void SystemTrayBackend::hide() {
    runOnOwnerThread([this]() {
        d->trayIcon->hide();
    });
}

void SystemTrayBackend::setImage(const QImage& image) {
    runOnOwnerThread([this, image]() {
        d->trayIcon->setIcon(QIcon(QPixmap::fromImage(image)));
    });
}

void SystemTrayBackend::setToolTip(const QString& toolTip) {
    runOnOwnerThread([this, toolTip]() {
        d->trayIcon->setToolTip(toolTip);
    });
}

void SystemTrayBackend::showMessage(const QString& title, const QString& message) {
    if (!supportsMessages()) {
        LOG_DEBUG("Tray messages are not supported on this platform");
        return;
    }
    runOnOwnerThread([this, title, message]() {
        d->trayIcon->showMessage(title, message, QSystemTrayIcon::Information, MESSAGE_TIMEOUT);
    });
}

void SystemTrayBackend::setClickHandler(ClickHandler handler) {
    std::lock_guard<std::mutex> lock(d->handlerMutex);
    d->clickHandler = std::move(handler);
}

void SystemTrayBackend::handleActivated(QSystemTrayIcon::ActivationReason reason) {
    int clickCount = 0;
    switch (reason) {
        case QSystemTrayIcon::Trigger:
            clickCount = 1;
            break;
        case QSystemTrayIcon::DoubleClick:
            clickCount = 2;
            break;
        default:
            return;
    }

    ClickHandler handler;
    {
        std::lock_guard<std::mutex> lock(d->handlerMutex);
        handler = d->clickHandler;
    }
    if (handler) {
        handler(clickCount);
    }
}

void SystemTrayBackend::runOnOwnerThread(std::function<void()> task) {
    if (QThread::currentThread() == thread()) {
        task();
        return;
    }
    // Queued calls keep their posting order on the receiver's event queue
    if (!QMetaObject::invokeMethod(this, std::move(task), Qt::QueuedConnection)) {
        LOG_WARNING("Failed to post tray update to the GUI thread");
    }
}

}
