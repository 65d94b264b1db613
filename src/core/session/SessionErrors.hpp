#pragma once

#include <QtCore/QMetaType>
#include <QtCore/QString>

namespace Scribe {

// Failures of a model load attempt. Terminal for that attempt.
struct LoadError {
    enum class Kind {
        PathEmpty,
        ModelNotFound,
        UnableToLoad
    };

    Kind kind = Kind::UnableToLoad;
    QString details;
    QString cause;

    static LoadError pathEmpty();
    static LoadError modelNotFound(const QString& path);
    static LoadError unableToLoad(const QString& details, const QString& cause = QString());

    QString message() const;

    bool operator==(const LoadError& other) const { return kind == other.kind; }
    bool operator!=(const LoadError& other) const { return !(*this == other); }
};

// Failures reported through the session's events.
struct OperationError {
    enum class Kind {
        MissingRecordedFile,
        MicPermissionDenied,
        ModelNotLoaded,
        RecordingFailed,
        TranscriptionFailed
    };

    Kind kind = Kind::TranscriptionFailed;
    QString details;
    QString cause;

    static OperationError missingRecordedFile();
    static OperationError micPermissionDenied();
    static OperationError modelNotLoaded();
    static OperationError recordingFailed(const QString& cause = QString());
    static OperationError transcriptionFailed(const QString& details, const QString& cause = QString());

    QString message() const;

    bool operator==(const OperationError& other) const { return kind == other.kind; }
    bool operator!=(const OperationError& other) const { return !(*this == other); }
};

} // namespace Scribe

Q_DECLARE_METATYPE(Scribe::LoadError)
Q_DECLARE_METATYPE(Scribe::OperationError)
