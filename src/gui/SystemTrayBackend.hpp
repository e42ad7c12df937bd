#pragma once
#include "TrayBackend.hpp"
#include <QObject>
#include <QSystemTrayIcon>
#include <memory>

namespace tray_notifier {

// QSystemTrayIcon wrapper. Must be created on the GUI thread; calls made from
// other threads are posted to it.
class SystemTrayBackend : public QObject, public TrayBackend {
    Q_OBJECT

public:
    explicit SystemTrayBackend(QObject* parent = nullptr);
    ~SystemTrayBackend() override;

    bool isAvailable() const override;
    bool supportsMessages() const override;

    void show() override;
    void hide() override;

    void setImage(const QImage& image) override;
    void setToolTip(const QString& toolTip) override;
    void showMessage(const QString& title, const QString& message) override;

    void setClickHandler(ClickHandler handler) override;

private slots:
    void handleActivated(QSystemTrayIcon::ActivationReason reason);

private:
    void runOnOwnerThread(std::function<void()> task);

    class Private;
    std::unique_ptr<Private> d;
};

}
