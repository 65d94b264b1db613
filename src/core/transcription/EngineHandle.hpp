#pragma once

#include "TranscriptionTypes.hpp"
#include "WhisperBackend.hpp"
#include "../common/Expected.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QFuture>
#include <QtCore/QString>
#include <QtCore/QThreadPool>
#include <atomic>
#include <memory>
#include <vector>

namespace Scribe {

/**
 * @brief One loaded model instance inside the native engine.
 *
 * Every operation is queued onto a private single-thread pool, so calls on one
 * handle never overlap and run in submission order. release() is idempotent;
 * operations queued after it fail with EngineError::Released.
 */
class EngineHandle {
public:
    static Expected<std::shared_ptr<EngineHandle>, EngineError> createFromFile(
        const QString& modelPath, std::shared_ptr<WhisperBackend> backend);
    static Expected<std::shared_ptr<EngineHandle>, EngineError> createFromBuffer(
        const QByteArray& modelData, std::shared_ptr<WhisperBackend> backend);

    ~EngineHandle();

    EngineHandle(const EngineHandle&) = delete;
    EngineHandle& operator=(const EngineHandle&) = delete;

    QFuture<Expected<QString, EngineError>> transcribe(std::vector<float> samples,
                                                       int threads,
                                                       bool withTimestamps,
                                                       const QString& language = "en");
    QFuture<Expected<QString, EngineError>> benchMemory(int threads);
    QFuture<Expected<QString, EngineError>> benchMatMul(int threads);
    QFuture<void> release();

    bool isReleased() const;

private:
    EngineHandle(ContextId context, std::shared_ptr<WhisperBackend> backend);

    Expected<QString, EngineError> runTranscription(const std::vector<float>& samples,
                                                    int threads,
                                                    bool withTimestamps,
                                                    const QString& language);
    void freeContext();

    std::shared_ptr<WhisperBackend> backend_;
    ContextId context_;                  // touched only from worker_
    std::atomic<bool> releaseRequested_{false};
    QThreadPool worker_;
};

} // namespace Scribe
