#pragma once
#include <tray-notifier/Types.hpp>
#include <QString>
#include <optional>

namespace tray_notifier {

// Maps icon names to PNG images below a fixed root (a directory or a Qt
// resource prefix such as ":/icons"). Stateless; safe to call from any thread.
class AssetResolver {
public:
    explicit AssetResolver(QString root);

    std::optional<TrayImage> resolve(const QString& name) const;
    bool contains(const QString& name) const;

    QString keyFor(const QString& name) const;
    const QString& root() const { return root_; }

private:
    QString root_;
};

}
