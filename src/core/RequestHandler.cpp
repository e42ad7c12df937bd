#include "RequestHandler.hpp"
#include "AssetResolver.hpp"
#include "Logger.hpp"
#include "SoundTrigger.hpp"
#include "../gui/NotificationSurface.hpp"
#include "../utils/TimeFormat.hpp"
#include <tray-notifier/Constants.hpp>
#include <QByteArray>
#include <QRegularExpression>
#include <QStringList>
#include <QTime>

namespace tray_notifier {

RequestHandler::RequestHandler(const AssetResolver& resolver,
                               NotificationSurface& surface,
                               SoundTrigger& sound,
                               std::ostream& out)
    : resolver_(resolver)
    , surface_(surface)
    , sound_(sound)
    , out_(out) {
}

QString RequestHandler::decodeMessage(const std::string& body) {
    // Invalid sequences become U+FFFD
    const QString text = QString::fromUtf8(QByteArray::fromStdString(body));

    static const QRegularExpression lineBreak(QStringLiteral("\r\n|\r|\n"));
    QStringList lines = text.split(lineBreak);

    // A trailing terminator does not start another line
    if (!lines.isEmpty() && lines.last().isEmpty()) {
        lines.removeLast();
    }

    QString message = lines.join(QLatin1Char('\n'));
    if (message.isEmpty()) {
        return QString::fromLatin1(PLACEHOLDER_MESSAGE);
    }
    return message;
}

int RequestHandler::handle(const std::string& path, const std::string& body) {
    const auto image = resolver_.resolve(QString::fromStdString(path));
    if (!image) {
        LOG_DEBUG("No icon for path " + path);
        return StatusCodes::NOT_FOUND;
    }

    try {
        const QString message = decodeMessage(body);
        const QString time = formatMediumTime(QTime::currentTime());

        {
            std::lock_guard<std::mutex> lock(outMutex_);
            out_ << (time + QLatin1Char(' ') + message).toStdString() << std::endl;
        }

        surface_.notify(QStringLiteral("Notification ") + time, message, *image, sound_);
    } catch (const std::exception& e) {
        LOG_ERROR("Notification for " + path + " failed: " + e.what());
    }

    return StatusCodes::OK;
}

}
