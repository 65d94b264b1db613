#pragma once

#include "TranscriptionTypes.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <memory>
#include <vector>

namespace Scribe {

struct WhisperRunParams {
    int threads = 4;
    QString language = "en";
};

/**
 * @brief Capability boundary to the native speech engine.
 *
 * A context returned by initFromFile/initFromBuffer must never be used from
 * two threads at once; EngineHandle enforces that. Implementations only
 * translate calls, they hold no session state.
 */
class WhisperBackend {
public:
    virtual ~WhisperBackend() = default;

    virtual ContextId initFromFile(const QString& modelPath) = 0;
    virtual ContextId initFromBuffer(const QByteArray& modelData) = 0;
    virtual void free(ContextId context) = 0;

    // Returns 0 on success, the engine's error code otherwise.
    virtual int fullTranscribe(ContextId context,
                               const std::vector<float>& samples,
                               const WhisperRunParams& params) = 0;
    virtual int segmentCount(ContextId context) = 0;
    virtual QString segmentText(ContextId context, int index) = 0;
    virtual qint64 segmentT0(ContextId context, int index) = 0;
    virtual qint64 segmentT1(ContextId context, int index) = 0;

    virtual QString systemInfo() = 0;
    virtual QString benchMemcpy(int threads) = 0;
    virtual QString benchMulMat(int threads) = 0;

    // whisper.cpp implementation. Process-wide engine setup runs once, on first call.
    static std::shared_ptr<WhisperBackend> createDefault();
};

} // namespace Scribe
