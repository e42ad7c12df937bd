#include "AssetResolver.hpp"
#include <tray-notifier/Constants.hpp>
#include <QFileInfo>
#include <QImageReader>
#include <QRegularExpression>

namespace tray_notifier {

AssetResolver::AssetResolver(QString root)
    : root_(std::move(root)) {
    while (root_.size() > 1 && root_.endsWith(QLatin1Char('/'))) {
        root_.chop(1);
    }
}

QString AssetResolver::keyFor(const QString& name) const {
    int start = 0;
    while (start < name.size() && name.at(start) == QLatin1Char('/')) {
        ++start;
    }
    return root_ + QLatin1Char('/') + name.mid(start) + QLatin1String(ICON_SUFFIX);
}

std::optional<TrayImage> AssetResolver::resolve(const QString& name) const {
    if (name.isEmpty()) {
        return std::nullopt;
    }

    // Names stay inside the icon root
    static const QRegularExpression separators(QStringLiteral("[/\\\\]"));
    if (name.split(separators).contains(QStringLiteral(".."))) {
        return std::nullopt;
    }

    const QString key = keyFor(name);
    QFileInfo info(key);
    if (!info.exists() || !info.isFile()) {
        return std::nullopt;
    }

    QImageReader reader(key);
    QImage image = reader.read();
    if (image.isNull()) {
        return std::nullopt;
    }

    return TrayImage{name, key, image};
}

bool AssetResolver::contains(const QString& name) const {
    return resolve(name).has_value();
}

}
