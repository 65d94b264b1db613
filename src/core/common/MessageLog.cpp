#include "MessageLog.hpp"
#include "Logger.hpp"

#include <QtCore/QMutexLocker>

namespace Scribe {

void MessageLog::append(const QString& line) {
    SCRIBE_DEBUG("MessageLog: {}", line.toStdString());
    QMutexLocker locker(&mutex_);
    text_.append(line);
}

QString MessageLog::text() const {
    QMutexLocker locker(&mutex_);
    return text_;
}

void MessageLog::clear() {
    QMutexLocker locker(&mutex_);
    text_.clear();
}

bool MessageLog::isEmpty() const {
    QMutexLocker locker(&mutex_);
    return text_.isEmpty();
}

} // namespace Scribe
