#include "SessionErrors.hpp"

namespace Scribe {

LoadError LoadError::pathEmpty() {
    return LoadError{Kind::PathEmpty, QString(), QString()};
}

LoadError LoadError::modelNotFound(const QString& path) {
    return LoadError{Kind::ModelNotFound, path, QString()};
}

LoadError LoadError::unableToLoad(const QString& details, const QString& cause) {
    return LoadError{Kind::UnableToLoad, details, cause};
}

QString LoadError::message() const {
    switch (kind) {
        case Kind::PathEmpty:
            return QStringLiteral("Path to the model file is empty.");
        case Kind::ModelNotFound:
            return details.isEmpty()
                ? QStringLiteral("Model file not found at the specified path.")
                : QStringLiteral("Model file not found: %1").arg(details);
        case Kind::UnableToLoad:
            return cause.isEmpty()
                ? QStringLiteral("Unable to load model: %1").arg(details)
                : QStringLiteral("Unable to load model: %1 (%2)").arg(details, cause);
    }
    return QStringLiteral("Unknown load error.");
}

OperationError OperationError::missingRecordedFile() {
    return OperationError{Kind::MissingRecordedFile, QString(), QString()};
}

OperationError OperationError::micPermissionDenied() {
    return OperationError{Kind::MicPermissionDenied, QString(), QString()};
}

OperationError OperationError::modelNotLoaded() {
    return OperationError{Kind::ModelNotLoaded, QString(), QString()};
}

OperationError OperationError::recordingFailed(const QString& cause) {
    return OperationError{Kind::RecordingFailed, QString(), cause};
}

OperationError OperationError::transcriptionFailed(const QString& details, const QString& cause) {
    return OperationError{Kind::TranscriptionFailed, details, cause};
}

QString OperationError::message() const {
    switch (kind) {
        case Kind::MissingRecordedFile:
            return QStringLiteral("No recorded audio file found.");
        case Kind::MicPermissionDenied:
            return QStringLiteral("Microphone access denied.");
        case Kind::ModelNotLoaded:
            return QStringLiteral("Model has not been loaded for transcription.");
        case Kind::RecordingFailed:
            return cause.isEmpty()
                ? QStringLiteral("Audio recording failed.")
                : QStringLiteral("Audio recording failed: %1").arg(cause);
        case Kind::TranscriptionFailed:
            return QStringLiteral("Transcription failed: %1").arg(details);
    }
    return QStringLiteral("Unknown operation error.");
}

} // namespace Scribe
