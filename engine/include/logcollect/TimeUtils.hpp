// Small time helpers shared by the CLI, the config loader and the tests.
#pragma once
#include "logcollect/FileEnumerator.hpp"
#include <QDate>
#include <QDateTime>
#include <QLocale>
#include <QString>
#include <QStringList>
#include <optional>

namespace logcollect {

// Format epoch seconds for user-facing display in LOCAL time (short format),
// using system locale so 12/24h and date formats match OS preferences.
inline QString localShortTime(quint64 secs) {
    if (secs == 0) return QStringLiteral("-");
    const QDateTime dt = QDateTime::fromSecsSinceEpoch((qint64)secs);
    if (!dt.isValid()) return QStringLiteral("-");
    return QLocale::system().toString(dt, QLocale::ShortFormat);
}

// "0 B", "512 B", "1.5 KB", ... up to TB, one decimal above bytes.
inline QString formatBytes(quint64 size) {
    static const char* kUnits[] = {"B", "KB", "MB", "GB", "TB"};
    if (size == 0) return QStringLiteral("0 B");
    double v = (double)size;
    int unit = 0;
    while (v >= 1024.0 && unit < 4) {
        v /= 1024.0;
        ++unit;
    }
    if (unit == 0) return QStringLiteral("%1 B").arg(size);
    return QStringLiteral("%1 %2").arg(v, 0, 'f', 1).arg(QLatin1String(kUnits[unit]));
}

// Parses a local date/time in one of the accepted layouts and returns epoch
// seconds. Date-only inputs mean midnight.
inline std::optional<qint64> parseTimeString(const QString& text) {
    const QString s = text.trimmed();
    if (s.isEmpty()) return std::nullopt;
    static const QStringList kDateTimeFormats = {
        QStringLiteral("yyyy-MM-dd HH:mm:ss"), QStringLiteral("yyyy-MM-dd HH:mm"),
        QStringLiteral("dd/MM/yyyy HH:mm:ss"), QStringLiteral("dd/MM/yyyy HH:mm"),
        QStringLiteral("MM/dd/yyyy HH:mm:ss"), QStringLiteral("MM/dd/yyyy HH:mm"),
        QStringLiteral("dd-MM-yyyy HH:mm"),    QStringLiteral("dd-MM-yyyy HH:mm:ss"),
    };
    static const QStringList kDateFormats = {
        QStringLiteral("yyyy-MM-dd"), QStringLiteral("dd/MM/yyyy"), QStringLiteral("MM/dd/yyyy"),
        QStringLiteral("yyyyMMdd"),   QStringLiteral("dd-MM-yyyy"),
    };
    for (const QString& fmt : kDateTimeFormats) {
        const QDateTime dt = QDateTime::fromString(s, fmt);
        if (dt.isValid()) return dt.toSecsSinceEpoch();
    }
    for (const QString& fmt : kDateFormats) {
        const QDate d = QDate::fromString(s, fmt);
        if (d.isValid()) return d.startOfDay().toSecsSinceEpoch();
    }
    return std::nullopt;
}

inline QStringList timePresetNames() {
    return {QStringLiteral("1h"), QStringLiteral("6h"),  QStringLiteral("12h"),
            QStringLiteral("24h"), QStringLiteral("3d"), QStringLiteral("7d"),
            QStringLiteral("30d")};
}

// "Last N hours/days" as an open-ended range starting N before `now`.
inline std::optional<TimeRange> presetRange(const QString& name, const QDateTime& now) {
    const QString n = name.trimmed().toLower();
    if (!timePresetNames().contains(n)) return std::nullopt;
    bool ok = false;
    const qint64 amount = n.left(n.size() - 1).toLongLong(&ok);
    if (!ok) return std::nullopt;
    const qint64 secs = n.endsWith(QLatin1Char('h')) ? amount * 3600 : amount * 86400;
    TimeRange r;
    r.start = now.toSecsSinceEpoch() - secs;
    return r;
}

// Rejects a closed range whose start is not before its end.
inline bool validateTimeRange(const TimeRange& r, QString& err) {
    if (r.start && r.end && *r.start >= *r.end) {
        err = QStringLiteral("start time must be before end time");
        return false;
    }
    return true;
}

} // namespace logcollect
