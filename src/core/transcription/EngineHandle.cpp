#include "EngineHandle.hpp"
#include "TranscriptionFormatter.hpp"
#include "../common/Logger.hpp"

#include <QtConcurrent/QtConcurrent>
#include <QtCore/QElapsedTimer>

namespace Scribe {

Expected<std::shared_ptr<EngineHandle>, EngineError> EngineHandle::createFromFile(
    const QString& modelPath, std::shared_ptr<WhisperBackend> backend) {
    if (!backend) {
        return makeUnexpected(EngineError::InitializationFailed);
    }
    if (modelPath.isEmpty()) {
        return makeUnexpected(EngineError::InvalidInput);
    }

    Logger::instance().info("EngineHandle: loading model from {}", modelPath.toStdString());
    const ContextId context = backend->initFromFile(modelPath);
    if (context == 0) {
        return makeUnexpected(EngineError::ModelLoadFailed);
    }
    return std::shared_ptr<EngineHandle>(new EngineHandle(context, std::move(backend)));
}

Expected<std::shared_ptr<EngineHandle>, EngineError> EngineHandle::createFromBuffer(
    const QByteArray& modelData, std::shared_ptr<WhisperBackend> backend) {
    if (!backend) {
        return makeUnexpected(EngineError::InitializationFailed);
    }
    if (modelData.isEmpty()) {
        return makeUnexpected(EngineError::InvalidInput);
    }

    Logger::instance().info("EngineHandle: loading model from {} byte buffer", modelData.size());
    const ContextId context = backend->initFromBuffer(modelData);
    if (context == 0) {
        return makeUnexpected(EngineError::ModelLoadFailed);
    }
    return std::shared_ptr<EngineHandle>(new EngineHandle(context, std::move(backend)));
}

EngineHandle::EngineHandle(ContextId context, std::shared_ptr<WhisperBackend> backend)
    : backend_(std::move(backend))
    , context_(context) {
    worker_.setMaxThreadCount(1);
    worker_.setExpiryTimeout(-1);
    worker_.setObjectName(QStringLiteral("EngineHandleWorker"));
}

EngineHandle::~EngineHandle() {
    worker_.waitForDone();
    if (context_ != 0) {
        Logger::instance().warn("EngineHandle: destroyed without release, freeing context");
        freeContext();
    }
}

QFuture<Expected<QString, EngineError>> EngineHandle::transcribe(std::vector<float> samples,
                                                                 int threads,
                                                                 bool withTimestamps,
                                                                 const QString& language) {
    return QtConcurrent::run(&worker_, [this, samples = std::move(samples), threads, withTimestamps, language]() {
        return runTranscription(samples, threads, withTimestamps, language);
    });
}

Expected<QString, EngineError> EngineHandle::runTranscription(const std::vector<float>& samples,
                                                              int threads,
                                                              bool withTimestamps,
                                                              const QString& language) {
    if (context_ == 0) {
        return makeUnexpected(EngineError::Released);
    }
    if (samples.empty()) {
        Logger::instance().error("EngineHandle: no samples to transcribe");
        return makeUnexpected(EngineError::InvalidInput);
    }
    if (threads < 1) {
        return makeUnexpected(EngineError::InvalidThreadCount);
    }

    QElapsedTimer timer;
    timer.start();

    WhisperRunParams params;
    params.threads = threads;
    params.language = language;

    const int rc = backend_->fullTranscribe(context_, samples, params);
    if (rc != 0) {
        Logger::instance().error("EngineHandle: full transcription failed with code {}", rc);
        return makeUnexpected(EngineError::InferenceFailed);
    }

    const int count = backend_->segmentCount(context_);
    QList<TranscriptionSegment> segments;
    segments.reserve(count);
    for (int i = 0; i < count; ++i) {
        TranscriptionSegment segment;
        segment.text = backend_->segmentText(context_, i);
        if (withTimestamps) {
            segment.t0 = backend_->segmentT0(context_, i);
            segment.t1 = backend_->segmentT1(context_, i);
        }
        segments.append(segment);
    }

    Logger::instance().info("EngineHandle: {} segments from {} samples in {} ms",
                            count, samples.size(), timer.elapsed());
    return TranscriptionFormatter::format(segments, withTimestamps);
}

QFuture<Expected<QString, EngineError>> EngineHandle::benchMemory(int threads) {
    return QtConcurrent::run(&worker_, [this, threads]() -> Expected<QString, EngineError> {
        if (context_ == 0) {
            return makeUnexpected(EngineError::Released);
        }
        if (threads < 1) {
            return makeUnexpected(EngineError::InvalidThreadCount);
        }
        return backend_->benchMemcpy(threads);
    });
}

QFuture<Expected<QString, EngineError>> EngineHandle::benchMatMul(int threads) {
    return QtConcurrent::run(&worker_, [this, threads]() -> Expected<QString, EngineError> {
        if (context_ == 0) {
            return makeUnexpected(EngineError::Released);
        }
        if (threads < 1) {
            return makeUnexpected(EngineError::InvalidThreadCount);
        }
        return backend_->benchMulMat(threads);
    });
}

QFuture<void> EngineHandle::release() {
    releaseRequested_.store(true);
    return QtConcurrent::run(&worker_, [this]() {
        freeContext();
    });
}

bool EngineHandle::isReleased() const {
    return releaseRequested_.load();
}

void EngineHandle::freeContext() {
    if (context_ == 0) {
        return;
    }
    backend_->free(context_);
    context_ = 0;
    Logger::instance().info("EngineHandle: context released");
}

} // namespace Scribe
