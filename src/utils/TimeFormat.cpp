#include "TimeFormat.hpp"
#include <QRegularExpression>

namespace tray_notifier {

QString mediumTimeFormat(const QLocale& locale) {
    QString format = locale.timeFormat(QLocale::LongFormat);

    // Long formats carry the zone ("t" ... "tttt"); drop it and the separator before it
    static const QRegularExpression zone(QStringLiteral("\\s*\\(?t+\\)?"));
    format.remove(zone);
    format = format.trimmed();

    if (format.isEmpty()) {
        return QStringLiteral("HH:mm:ss");
    }
    return format;
}

QString formatMediumTime(const QTime& time, const QLocale& locale) {
    return locale.toString(time, mediumTimeFormat(locale));
}

}
