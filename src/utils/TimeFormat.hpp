#pragma once
#include <QDateTime>
#include <QLocale>
#include <QString>

namespace tray_notifier {

// Time-of-day format with seconds but without the zone name
QString mediumTimeFormat(const QLocale& locale = QLocale::system());

QString formatMediumTime(const QTime& time, const QLocale& locale = QLocale::system());

}
