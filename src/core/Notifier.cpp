#include "Notifier.hpp"
#include "AssetResolver.hpp"
#include "LifecycleController.hpp"
#include "Logger.hpp"
#include "RequestHandler.hpp"
#include "SoundTrigger.hpp"
#include "../gui/NotificationSurface.hpp"
#include "../gui/TrayBackend.hpp"
#include <tray-notifier/Errors.hpp>
#include <QCoreApplication>

namespace tray_notifier {

Notifier::Notifier(const NotifierConfig& config,
                   std::unique_ptr<TrayBackend> backend,
                   std::unique_ptr<SoundTrigger> sound,
                   ExitHandler exitHandler,
                   std::ostream& out)
    : config_(config.normalized())
    , exitHandler_(std::move(exitHandler)) {

    if (!backend || !backend->isAvailable()) {
        throw ConfigurationError("System tray not supported!");
    }

    resolver_ = std::make_unique<AssetResolver>(QString::fromStdString(config_.iconRoot));
    auto defaultImage = resolver_->resolve(QString::fromStdString(config_.defaultIcon));
    if (!defaultImage) {
        throw ConfigurationError("Wrong default icon - " + config_.defaultIcon);
    }

    sound_ = sound ? std::move(sound) : resolveSoundTrigger(config_.soundProperty);

    if (!exitHandler_) {
        exitHandler_ = [](int exitCode) {
            QCoreApplication::exit(exitCode);
        };
    }

    surface_ = std::make_unique<NotificationSurface>(
        std::move(backend), *defaultImage, toolTipFor(config_.port));
    handler_ = std::make_unique<RequestHandler>(*resolver_, *surface_, *sound_, out);
    controller_ = std::make_unique<LifecycleController>(config_, *handler_, *surface_);

    surface_->setShutdownHandler([this]() {
        shutdown();
    });
}

Notifier::~Notifier() {
    surface_->setShutdownHandler(nullptr);
}

void Notifier::start() {
    controller_->start();
}

void Notifier::stop() {
    controller_->stop();
}

void Notifier::shutdown() {
    LOG_INFO("Shutdown requested from the tray icon");
    controller_->stop();
    exitHandler_(0);
}

QString Notifier::toolTipFor(int port) {
    return QStringLiteral("Notifier on port %1"
                          "\n- click to remove events"
                          "\n- double-click to exit").arg(port);
}

}
