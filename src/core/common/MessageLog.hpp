#pragma once

#include <QtCore/QMutex>
#include <QtCore/QString>

namespace Scribe {

// Append-only diagnostic trail shared by concurrent tasks.
class MessageLog {
public:
    MessageLog() = default;

    void append(const QString& line);
    QString text() const;
    void clear();
    bool isEmpty() const;

private:
    mutable QMutex mutex_;
    QString text_;
};

} // namespace Scribe
