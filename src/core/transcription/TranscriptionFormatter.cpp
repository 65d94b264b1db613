#include "TranscriptionFormatter.hpp"

namespace Scribe {

QString toTimestamp(qint64 ticks, bool comma) {
    qint64 msec = ticks * 10;
    const qint64 hr = msec / (1000 * 60 * 60);
    msec -= hr * (1000 * 60 * 60);
    const qint64 min = msec / (1000 * 60);
    msec -= min * (1000 * 60);
    const qint64 sec = msec / 1000;
    msec -= sec * 1000;

    return QStringLiteral("%1:%2:%3%4%5")
        .arg(hr, 2, 10, QLatin1Char('0'))
        .arg(min, 2, 10, QLatin1Char('0'))
        .arg(sec, 2, 10, QLatin1Char('0'))
        .arg(QChar(comma ? ',' : '.'))
        .arg(msec, 3, 10, QLatin1Char('0'));
}

QString TranscriptionFormatter::format(const QList<TranscriptionSegment>& segments, bool withTimestamps) {
    QString text;
    for (const TranscriptionSegment& segment : segments) {
        if (withTimestamps) {
            text += QStringLiteral("[%1 --> %2]: %3\n")
                        .arg(toTimestamp(segment.t0), toTimestamp(segment.t1), segment.text);
        } else {
            text += segment.text;
        }
    }
    return text;
}

} // namespace Scribe
