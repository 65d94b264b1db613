#pragma once

#include "TranscriptionTypes.hpp"

#include <QtCore/QList>
#include <QtCore/QString>

namespace Scribe {

// Renders a native tick count (10 ms units) as HH:MM:SS.mmm, or HH:MM:SS,mmm with comma set.
QString toTimestamp(qint64 ticks, bool comma = false);

class TranscriptionFormatter {
public:
    // "[start --> end]: text\n" per segment with timestamps, bare concatenation without.
    // Segments are emitted in the order given.
    static QString format(const QList<TranscriptionSegment>& segments, bool withTimestamps);
};

} // namespace Scribe
