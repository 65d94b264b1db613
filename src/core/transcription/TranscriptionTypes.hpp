#pragma once

#include <QtCore/QString>
#include <QtCore/QtGlobal>

namespace Scribe {

// Opaque id of one native engine context. 0 means "no context".
using ContextId = quintptr;

enum class EngineError {
    InitializationFailed,
    ModelLoadFailed,
    InvalidInput,
    InferenceFailed,
    InvalidThreadCount,
    Released
};

inline QString toString(EngineError error) {
    switch (error) {
        case EngineError::InitializationFailed: return QStringLiteral("engine initialization failed");
        case EngineError::ModelLoadFailed: return QStringLiteral("model could not be loaded");
        case EngineError::InvalidInput: return QStringLiteral("invalid input for the engine");
        case EngineError::InferenceFailed: return QStringLiteral("engine failed to run the model");
        case EngineError::InvalidThreadCount: return QStringLiteral("thread count must be at least 1");
        case EngineError::Released: return QStringLiteral("engine handle has been released");
    }
    return QStringLiteral("unknown engine error");
}

// One recognized span; t0/t1 are in native ticks of 10 ms.
struct TranscriptionSegment {
    qint64 t0 = 0;
    qint64 t1 = 0;
    QString text;
};

} // namespace Scribe
