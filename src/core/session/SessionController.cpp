#include "SessionController.hpp"
#include "../common/Config.hpp"
#include "../common/Logger.hpp"
#include "../transcription/CpuConfig.hpp"

#include <QtConcurrent/QtConcurrent>
#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QElapsedTimer>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QMutexLocker>
#include <QtCore/QPromise>
#include <QtCore/QTemporaryFile>
#include <QtCore/QThread>

#if QT_VERSION >= QT_VERSION_CHECK(6, 5, 0)
#include <QtCore/QPermissions>
#endif

#include <exception>

namespace Scribe {

namespace {

constexpr int kSessionWorkerThreads = 4;

template<typename T>
QFuture<T> readyFuture(T value) {
    QPromise<T> promise;
    QFuture<T> future = promise.future();
    promise.start();
    promise.addResult(std::move(value));
    promise.finish();
    return future;
}

QFuture<void> readyFuture() {
    QPromise<void> promise;
    QFuture<void> future = promise.future();
    promise.start();
    promise.finish();
    return future;
}

int transcriptionThreads() {
    const int configured = Config::instance().getTranscriptionSettings().threads;
    return configured > 0 ? configured : CpuConfig::preferredThreadCount();
}

} // namespace

SessionController::SessionController(QObject* parent)
    : SessionController(Dependencies{}, parent) {
}

SessionController::SessionController(Dependencies dependencies, QObject* parent)
    : QObject(parent)
    , backend_(std::move(dependencies.backend))
    , capture_(std::move(dependencies.capture))
    , decoder_(std::move(dependencies.decoder))
    , player_(std::move(dependencies.player))
    , permissionProbe_(std::move(dependencies.permissionProbe))
    , scratchDirectory_(std::move(dependencies.scratchDirectory)) {
    qRegisterMetaType<Scribe::OperationError>("Scribe::OperationError");
    qRegisterMetaType<Scribe::LoadError>("Scribe::LoadError");

    const Config& config = Config::instance();
    if (!backend_) {
        backend_ = WhisperBackend::createDefault();
    }
    if (!capture_) {
        const auto recording = config.getRecordingSettings();
        AudioCapture::Timeouts timeouts;
        timeouts.restartJoinMs = recording.restartJoinTimeoutMs;
        timeouts.stopJoinMs = recording.stopJoinTimeoutMs;
        capture_ = std::make_unique<AudioCapture>(AudioCapture::defaultDeviceFactory(), timeouts,
                                                  recording.sampleRate);
    }
    if (!decoder_) {
        decoder_ = std::make_unique<DefaultAudioDecoder>();
    }
    if (!player_) {
        player_ = std::make_unique<QtAudioPlayer>();
    }
    if (!permissionProbe_) {
        permissionProbe_ = &SessionController::systemMicPermission;
    }
    if (scratchDirectory_.isEmpty()) {
        scratchDirectory_ = config.getRecordingSettings().scratchDirectory;
    }

    playbackEnabled_ = config.getPlaybackSettings().enabled;
    pool_.setMaxThreadCount(kSessionWorkerThreads);
    pool_.setObjectName(QStringLiteral("SessionWorkers"));

    Logger::instance().info("SessionController: created, scratch directory {}", scratchDirectory_.toStdString());
}

SessionController::~SessionController() {
    cleanup();
}

bool SessionController::isModelLoaded() const {
    QMutexLocker locker(&stateMutex_);
    return modelLoaded_;
}

bool SessionController::canTranscribe() const {
    QMutexLocker locker(&stateMutex_);
    return canTranscribe_;
}

bool SessionController::isRecording() const {
    QMutexLocker locker(&stateMutex_);
    return recording_;
}

bool SessionController::isMicPermissionGranted() const {
    QMutexLocker locker(&stateMutex_);
    return micPermissionGranted_;
}

bool SessionController::isPlaybackEnabled() const {
    QMutexLocker locker(&stateMutex_);
    return playbackEnabled_;
}

QString SessionController::recordedFile() const {
    QMutexLocker locker(&stateMutex_);
    return recordedFile_;
}

QString SessionController::messageLog() const {
    return log_.text();
}

// ---------------------------------------------------------------------------
// Model loading

QFuture<Expected<void, LoadError>> SessionController::rejectLoad(const LoadError& error, bool logEnabled) {
    if (logEnabled) {
        log_.append(QStringLiteral("Error: %1\n").arg(error.message()));
    }
    return readyFuture<Expected<void, LoadError>>(makeUnexpected(error));
}

QFuture<Expected<void, LoadError>> SessionController::loadModelFromPath(const QString& path, bool logEnabled) {
    if (path.isEmpty()) {
        Logger::instance().warn("SessionController: model path is empty");
        return rejectLoad(LoadError::pathEmpty(), logEnabled);
    }

    const QFileInfo info(path);
    if (!info.exists() || !info.isFile()) {
        Logger::instance().warn("SessionController: model not found at {}", path.toStdString());
        return rejectLoad(LoadError::modelNotFound(path), logEnabled);
    }

    const QString label = info.fileName();
    auto backend = backend_;
    return QtConcurrent::run(&pool_, [this, path, label, logEnabled, backend]() {
        return installEngine([path, backend]() -> Expected<std::shared_ptr<EngineHandle>, LoadError> {
            auto created = EngineHandle::createFromFile(path, backend);
            if (created.hasError()) {
                return makeUnexpected(LoadError::unableToLoad(path, toString(created.error())));
            }
            return created.value();
        }, label, logEnabled);
    });
}

QFuture<Expected<void, LoadError>> SessionController::loadModelFromAsset(const QString& assetName, bool logEnabled) {
    if (assetName.isEmpty()) {
        Logger::instance().warn("SessionController: model asset name is empty");
        return rejectLoad(LoadError::pathEmpty(), logEnabled);
    }

    const QString resolved = resolveAssetPath(assetName);
    if (!QFile::exists(resolved)) {
        Logger::instance().warn("SessionController: model asset {} not found", resolved.toStdString());
        return rejectLoad(LoadError::modelNotFound(resolved), logEnabled);
    }

    auto backend = backend_;
    return QtConcurrent::run(&pool_, [this, resolved, assetName, logEnabled, backend]() {
        return installEngine([resolved, backend]() -> Expected<std::shared_ptr<EngineHandle>, LoadError> {
            QFile asset(resolved);
            if (!asset.open(QIODevice::ReadOnly)) {
                return makeUnexpected(LoadError::modelNotFound(resolved));
            }
            const QByteArray bytes = asset.readAll();
            auto created = EngineHandle::createFromBuffer(bytes, backend);
            if (created.hasError()) {
                return makeUnexpected(LoadError::unableToLoad(resolved, toString(created.error())));
            }
            return created.value();
        }, assetName, logEnabled);
    });
}

QString SessionController::resolveAssetPath(const QString& assetName) const {
    if (assetName.startsWith(QLatin1String(":/")) || QDir::isAbsolutePath(assetName)) {
        return assetName;
    }
    QString root = Config::instance().getModelSettings().assetRoot;
    if (root.endsWith(QLatin1Char('/'))) {
        root.chop(1);
    }
    return root + QLatin1Char('/') + assetName;
}

Expected<void, LoadError> SessionController::installEngine(const EngineFactory& factory,
                                                           const QString& label,
                                                           bool logEnabled) {
    QMutexLocker loadLocker(&loadMutex_);

    std::shared_ptr<EngineHandle> previous;
    {
        QMutexLocker locker(&stateMutex_);
        if (shuttingDown_) {
            return makeUnexpected(LoadError::unableToLoad(label, QStringLiteral("session is shutting down")));
        }
        previous = std::move(engine_);
        modelLoaded_ = false;
        refreshCanTranscribeLocked();
    }
    post([this]() { emit stateChanged(); });

    if (logEnabled) {
        log_.append(QStringLiteral("Loading model...\n"));
    }

    if (previous) {
        Logger::instance().info("SessionController: releasing previous model");
        previous->release().waitForFinished();
        previous.reset();
    }

    Expected<std::shared_ptr<EngineHandle>, LoadError> created =
        makeUnexpected(LoadError::unableToLoad(label));
    try {
        created = factory();
    } catch (const std::exception& e) {
        created = makeUnexpected(LoadError::unableToLoad(label, QString::fromUtf8(e.what())));
    }

    if (created.hasError()) {
        const LoadError error = created.error();
        Logger::instance().error("SessionController: {}", error.message().toStdString());
        if (logEnabled) {
            log_.append(error.message() + QLatin1Char('\n'));
        }
        {
            QMutexLocker locker(&stateMutex_);
            modelLoaded_ = false;
            refreshCanTranscribeLocked();
        }
        post([this]() { emit stateChanged(); });
        return makeUnexpected(error);
    }

    std::shared_ptr<EngineHandle> engine = created.value();
    {
        QMutexLocker locker(&stateMutex_);
        if (shuttingDown_) {
            locker.unlock();
            engine->release().waitForFinished();
            return makeUnexpected(LoadError::unableToLoad(label, QStringLiteral("session is shutting down")));
        }
        engine_ = engine;
        modelLoaded_ = true;
        refreshCanTranscribeLocked();
    }
    post([this]() { emit stateChanged(); });

    Logger::instance().info("SessionController: model {} loaded", label.toStdString());
    if (logEnabled) {
        log_.append(QStringLiteral("Loaded model %1.\n").arg(label));
    }
    return {};
}

// ---------------------------------------------------------------------------
// Recording

void SessionController::startRecording() {
    if (!isMicPermissionGranted()) {
        Logger::instance().warn("SessionController: recording refused, microphone permission not granted");
        emitFailure(OperationError::micPermissionDenied(), true);
        return;
    }

    quint64 generation = 0;
    QString previousFile;
    {
        QMutexLocker locker(&stateMutex_);
        if (shuttingDown_) {
            return;
        }
        if (recording_) {
            Logger::instance().debug("SessionController: already recording");
            return;
        }
        if (busy_) {
            Logger::instance().info("SessionController: recording refused, an engine operation is in progress");
            return;
        }
        if (!modelLoaded_) {
            Logger::instance().warn("SessionController: recording not started, no model loaded");
            return;
        }
        // Claim the recording slot before any I/O so the busy gate stays closed.
        recording_ = true;
        refreshCanTranscribeLocked();
        generation = ++recordingGeneration_;
        previousFile = lastRecording_;
        lastRecording_.clear();
    }

    stopPlayback();
    if (!previousFile.isEmpty()) {
        QFile::remove(previousFile);
    }

    auto file = allocateRecordingFile();
    Expected<void, CaptureError> started = makeUnexpected(CaptureError::ThreadStartFailed);
    QString failure;
    if (file.hasError()) {
        failure = file.error();
    } else {
        started = capture_->start(file.value(), [this, generation](CaptureError error, const QString& details) {
            QMetaObject::invokeMethod(this, [this, generation, error, details]() {
                handleCaptureError(generation, error, details);
            }, Qt::QueuedConnection);
        });
        if (started.hasError()) {
            failure = toString(started.error());
        }
    }

    if (!failure.isEmpty()) {
        Logger::instance().error("SessionController: failed to start recording: {}", failure.toStdString());
        {
            QMutexLocker locker(&stateMutex_);
            recording_ = false;
            recordedFile_.clear();
            refreshCanTranscribeLocked();
        }
        if (file.hasValue()) {
            QFile::remove(file.value());
        }
        emitFailure(OperationError::recordingFailed(failure), true);
        return;
    }

    {
        QMutexLocker locker(&stateMutex_);
        recordedFile_ = file.value();
    }
    Logger::instance().info("SessionController: recording started");
    post([this]() {
        emit recordingStarted();
        emit stateChanged();
    });
}

Expected<QString, QString> SessionController::allocateRecordingFile() {
    if (!QDir().mkpath(scratchDirectory_)) {
        return makeUnexpected(QStringLiteral("cannot create %1").arg(scratchDirectory_));
    }
    QTemporaryFile file(QDir(scratchDirectory_).filePath(QStringLiteral("recording-XXXXXX.wav")));
    file.setAutoRemove(false);
    if (!file.open()) {
        return makeUnexpected(file.errorString());
    }
    const QString path = file.fileName();
    file.close();
    return path;
}

void SessionController::handleCaptureError(quint64 generation, CaptureError error, const QString& details) {
    QString abandonedFile;
    {
        QMutexLocker locker(&stateMutex_);
        // A stop in progress reports the failure itself.
        if (generation != recordingGeneration_ || !recording_ || stopping_) {
            return;
        }
        recording_ = false;
        abandonedFile = recordedFile_;
        recordedFile_.clear();
        refreshCanTranscribeLocked();
    }

    auto joined = capture_->stop();
    if (joined.hasError()) {
        Logger::instance().debug("SessionController: capture joined with '{}'", toString(joined.error()).toStdString());
    }
    discardRecording(abandonedFile, joined);

    Logger::instance().error("SessionController: recording failed: {} ({})",
                             toString(error).toStdString(), details.toStdString());
    emitFailure(OperationError::recordingFailed(details.isEmpty() ? toString(error) : details), true);
}

QFuture<void> SessionController::stopRecording() {
    quint64 generation = 0;
    {
        QMutexLocker locker(&stateMutex_);
        if (!recording_ || stopping_ || shuttingDown_) {
            return readyFuture();
        }
        stopping_ = true;
        generation = recordingGeneration_;
    }
    return QtConcurrent::run(&pool_, [this, generation]() { finishRecording(generation); });
}

void SessionController::finishRecording(quint64 generation) {
    auto stopped = capture_->stop();
    if (stopped.hasError()) {
        Logger::instance().warn("SessionController: capture did not stop cleanly: {}",
                                toString(stopped.error()).toStdString());
    }

    QString file;
    bool modelLoaded = false;
    std::shared_ptr<EngineHandle> engine;
    {
        QMutexLocker locker(&stateMutex_);
        if (generation != recordingGeneration_) {
            // Reset while stopping; nothing left to report.
            stopping_ = false;
            return;
        }
        recording_ = false;
        stopping_ = false;
        file = recordedFile_;
        modelLoaded = modelLoaded_;
        // The follow-up transcription takes the gate in the same step that ends the recording.
        if (stopped.hasValue() && modelLoaded_ && engine_ && !busy_ && !shuttingDown_) {
            busy_ = true;
            engine = engine_;
        }
        refreshCanTranscribeLocked();
    }
    Logger::instance().info("SessionController: recording stopped");
    post([this]() {
        emit recordingStopped();
        emit stateChanged();
    });

    if (stopped.hasError()) {
        emitFailure(OperationError::recordingFailed(toString(stopped.error())), false);
    } else if (!modelLoaded) {
        emitFailure(OperationError::modelNotLoaded(), false);
    } else if (!engine) {
        Logger::instance().warn("SessionController: recorded file left untranscribed, no engine available");
        emitFailure(OperationError::modelNotLoaded(), false);
    } else if (file.isEmpty() || !QFileInfo::exists(file)) {
        releaseGate();
        emitFailure(OperationError::missingRecordedFile(), false);
    } else {
        const bool withTimestamps = Config::instance().getTranscriptionSettings().withTimestamps;
        performTranscription(engine, file, true, withTimestamps);
    }

    QMutexLocker locker(&stateMutex_);
    if (recordedFile_ == file) {
        recordedFile_.clear();
    }
    lastRecording_ = file;
}

// ---------------------------------------------------------------------------
// Transcription and benchmark

Expected<std::shared_ptr<EngineHandle>, SessionController::GateRejection> SessionController::acquireEngine() {
    QMutexLocker locker(&stateMutex_);
    if (shuttingDown_) {
        return makeUnexpected(GateRejection::ShuttingDown);
    }
    if (!modelLoaded_) {
        return makeUnexpected(GateRejection::ModelNotLoaded);
    }
    if (!engine_) {
        Logger::instance().error("SessionController: model flagged as loaded but no engine is held");
        return makeUnexpected(GateRejection::ModelNotLoaded);
    }
    if (!canTranscribe_) {
        return makeUnexpected(GateRejection::Busy);
    }
    busy_ = true;
    refreshCanTranscribeLocked();
    return engine_;
}

void SessionController::releaseGate() {
    {
        QMutexLocker locker(&stateMutex_);
        busy_ = false;
        refreshCanTranscribeLocked();
    }
    post([this]() { emit stateChanged(); });
}

void SessionController::refreshCanTranscribeLocked() {
    canTranscribe_ = modelLoaded_ && engine_ && !recording_ && !busy_;
}

QFuture<void> SessionController::transcribeAudioFile(const QString& filePath, bool logEnabled, bool withTimestamps) {
    auto engine = acquireEngine();
    if (engine.hasError()) {
        switch (engine.error()) {
            case GateRejection::ModelNotLoaded:
                Logger::instance().warn("SessionController: transcription refused, no model loaded");
                emitFailure(OperationError::modelNotLoaded(), false);
                break;
            case GateRejection::Busy:
                Logger::instance().info("SessionController: transcription refused, engine busy");
                break;
            case GateRejection::ShuttingDown:
                break;
        }
        return readyFuture();
    }
    post([this]() { emit stateChanged(); });

    std::shared_ptr<EngineHandle> handle = engine.value();
    return QtConcurrent::run(&pool_, [this, handle, filePath, logEnabled, withTimestamps]() {
        performTranscription(handle, filePath, logEnabled, withTimestamps);
    });
}

void SessionController::performTranscription(const std::shared_ptr<EngineHandle>& engine,
                                             const QString& filePath,
                                             bool logEnabled,
                                             bool withTimestamps) {
    // The gate taken by acquireEngine() is returned on every path out of here.
    struct GateRelease {
        SessionController* owner;
        ~GateRelease() { owner->releaseGate(); }
    } gateRelease{this};

    {
        QMutexLocker locker(&stateMutex_);
        if (shuttingDown_) {
            return;
        }
    }

    try {
        stopPlayback();
        if (logEnabled) {
            log_.append(QStringLiteral("Reading wave samples... "));
        }

        auto samples = decoder_->decode(filePath);
        if (samples.hasError()) {
            const QString reason = toString(samples.error());
            Logger::instance().error("SessionController: decoding {} failed: {}",
                                     filePath.toStdString(), reason.toStdString());
            if (logEnabled) {
                log_.append(QStringLiteral("failed: %1\n").arg(reason));
            }
            emitFailure(OperationError::transcriptionFailed(
                            QStringLiteral("Failed to read audio: %1").arg(reason), reason), false);
            return;
        }

        if (isPlaybackEnabled()) {
            startPlayback(filePath);
        }

        const std::size_t sampleCount = samples.value().size();
        if (logEnabled) {
            log_.append(QStringLiteral("%1 samples\nTranscribing data...\n").arg(sampleCount));
        }

        QElapsedTimer timer;
        timer.start();
        const QString language = Config::instance().getTranscriptionSettings().language;
        QFuture<Expected<QString, EngineError>> pending =
            engine->transcribe(std::move(samples).value(), transcriptionThreads(), withTimestamps, language);
        pending.waitForFinished();
        const Expected<QString, EngineError> text = pending.result();

        if (text.hasError()) {
            const QString reason = toString(text.error());
            Logger::instance().error("SessionController: transcription of {} failed: {}",
                                     filePath.toStdString(), reason.toStdString());
            if (logEnabled) {
                log_.append(QStringLiteral("Transcription failed: %1\n").arg(reason));
            }
            emitFailure(OperationError::transcriptionFailed(reason), false);
            return;
        }

        const qint64 elapsed = timer.elapsed();
        Logger::instance().info("SessionController: transcribed {} samples in {} ms", sampleCount, elapsed);
        if (logEnabled) {
            log_.append(QStringLiteral("Done (%1 ms): \n%2\n").arg(elapsed).arg(text.value()));
        }
        const QString result = text.value();
        post([this, result]() { emit transcribed(result); });
    } catch (const std::exception& e) {
        Logger::instance().error("SessionController: transcription aborted: {}", e.what());
        emitFailure(OperationError::transcriptionFailed(QString::fromUtf8(e.what()), QString::fromUtf8(e.what())),
                    false);
    }
}

QFuture<void> SessionController::benchmarkCurrentModel() {
    auto engine = acquireEngine();
    if (engine.hasError()) {
        Logger::instance().info("SessionController: benchmark skipped, {}",
                                engine.error() == GateRejection::Busy ? "engine busy" : "no model loaded");
        if (engine.error() == GateRejection::ModelNotLoaded) {
            log_.append(QStringLiteral("Model not loaded. Cannot benchmark.\n"));
        }
        return readyFuture();
    }
    log_.append(QStringLiteral("Running benchmark. This will take minutes...\n"));
    post([this]() { emit stateChanged(); });

    std::shared_ptr<EngineHandle> handle = engine.value();
    return QtConcurrent::run(&pool_, [this, handle]() { performBenchmark(handle); });
}

void SessionController::performBenchmark(const std::shared_ptr<EngineHandle>& engine) {
    struct GateRelease {
        SessionController* owner;
        ~GateRelease() { owner->releaseGate(); }
    } gateRelease{this};

    const int threads = CpuConfig::benchmarkThreadCount();
    Logger::instance().info("SessionController: benchmarking with {} threads", threads);

    try {
        QFuture<Expected<QString, EngineError>> memory = engine->benchMemory(threads);
        memory.waitForFinished();
        const auto memoryResult = memory.result();
        if (memoryResult.hasError()) {
            log_.append(QStringLiteral("Memory benchmark failed: %1\n").arg(toString(memoryResult.error())));
            return;
        }
        log_.append(memoryResult.value());
        log_.append(QStringLiteral("\n"));

        QFuture<Expected<QString, EngineError>> mulMat = engine->benchMatMul(threads);
        mulMat.waitForFinished();
        const auto mulMatResult = mulMat.result();
        if (mulMatResult.hasError()) {
            log_.append(QStringLiteral("Matrix multiply benchmark failed: %1\n").arg(toString(mulMatResult.error())));
            return;
        }
        log_.append(mulMatResult.value());
    } catch (const std::exception& e) {
        Logger::instance().error("SessionController: benchmark aborted: {}", e.what());
        log_.append(QStringLiteral("Benchmark failed: %1\n").arg(QString::fromUtf8(e.what())));
    }
}

// ---------------------------------------------------------------------------
// Reset and shutdown

void SessionController::discardRecording(const QString& file, const Expected<void, CaptureError>& stopped) {
    if (file.isEmpty()) {
        return;
    }
    if (stopped.hasError() && stopped.error() == CaptureError::StopTimeout) {
        // The capture thread may still write the file; the next recording cycle removes it.
        QMutexLocker locker(&stateMutex_);
        lastRecording_ = file;
        return;
    }
    if (QFile::exists(file) && !QFile::remove(file)) {
        Logger::instance().warn("SessionController: could not remove {}", file.toStdString());
    }
}

void SessionController::resetState() {
    std::shared_ptr<EngineHandle> engine;
    bool wasRecording = false;
    QString abandonedFile;
    {
        QMutexLocker locker(&stateMutex_);
        engine = std::move(engine_);
        wasRecording = recording_;
        if (recording_ || stopping_) {
            abandonedFile = recordedFile_;
        }
        modelLoaded_ = false;
        recording_ = false;
        stopping_ = false;
        recordedFile_.clear();
        ++recordingGeneration_;
        refreshCanTranscribeLocked();
    }

    stopPlayback();
    log_.clear();

    if (wasRecording) {
        // Joined here, before returning, so that a later start() cannot be stopped by this reset.
        auto stopped = capture_->stop();
        if (stopped.hasError()) {
            Logger::instance().warn("SessionController: capture stop during reset: {}",
                                    toString(stopped.error()).toStdString());
        }
        discardRecording(abandonedFile, stopped);
    }

    if (engine) {
        // The handle is dropped on the pool so a running transcription never blocks the caller.
        pool_.start([engine]() mutable {
            engine->release().waitForFinished();
            engine.reset();
        });
    }

    Logger::instance().info("SessionController: state reset");
    post([this]() { emit stateChanged(); });
}

void SessionController::cleanup() {
    std::shared_ptr<EngineHandle> engine;
    {
        QMutexLocker locker(&stateMutex_);
        if (shuttingDown_) {
            return;
        }
        shuttingDown_ = true;
        engine = std::move(engine_);
        modelLoaded_ = false;
        recording_ = false;
        stopping_ = false;
        recordedFile_.clear();
        ++recordingGeneration_;
        refreshCanTranscribeLocked();
    }

    if (player_) {
        player_->stop();
    }
    log_.clear();

    auto stopped = capture_->stop();
    if (stopped.hasError()) {
        Logger::instance().warn("SessionController: capture stop during cleanup: {}",
                                toString(stopped.error()).toStdString());
    }

    if (engine) {
        engine->release().waitForFinished();
        engine.reset();
    }

    pool_.waitForDone();

    QString lastRecording;
    {
        QMutexLocker locker(&stateMutex_);
        lastRecording = lastRecording_;
        lastRecording_.clear();
    }
    if (!lastRecording.isEmpty()) {
        QFile::remove(lastRecording);
    }

    Logger::instance().info("SessionController: cleaned up");
}

// ---------------------------------------------------------------------------
// Permissions, playback, diagnostics

bool SessionController::systemMicPermission() {
#if QT_VERSION >= QT_VERSION_CHECK(6, 5, 0) && QT_CONFIG(permissions)
    if (QCoreApplication::instance()
        && QCoreApplication::instance()->checkPermission(QMicrophonePermission{}) != Qt::PermissionStatus::Granted) {
        return false;
    }
#endif
    return QtAudioInputDevice::hasInputDevice();
}

bool SessionController::refreshAndCheckSystemMicPermission() {
    const bool granted = permissionProbe_ ? permissionProbe_() : false;
    updateInternalMicPermissionStatus(granted);
    return granted;
}

bool SessionController::requestMicPermission() {
    if (refreshAndCheckSystemMicPermission()) {
        return true;
    }
    Logger::instance().info("SessionController: microphone permission needed");
    post([this]() { emit permissionRequestNeeded(); });
    return false;
}

void SessionController::updateInternalMicPermissionStatus(bool granted) {
    {
        QMutexLocker locker(&stateMutex_);
        if (micPermissionGranted_ == granted) {
            return;
        }
        micPermissionGranted_ = granted;
    }
    Logger::instance().info("SessionController: microphone permission {}", granted ? "granted" : "not granted");
    post([this]() { emit stateChanged(); });
}

void SessionController::setAudioPlaybackEnabled(bool enabled) {
    {
        QMutexLocker locker(&stateMutex_);
        playbackEnabled_ = enabled;
    }
    if (!enabled) {
        stopPlayback();
    }
}

QString SessionController::getSystemInfo(bool logEnabled) {
    QString info;
    try {
        info = backend_->systemInfo();
    } catch (const std::exception& e) {
        info = QStringLiteral("Error retrieving system info: %1").arg(QString::fromUtf8(e.what()));
        Logger::instance().error("SessionController: {}", info.toStdString());
    }
    if (logEnabled) {
        log_.append(QStringLiteral("System Info: %1\n").arg(info));
    }
    return info;
}

void SessionController::stopPlayback() {
    if (QThread::currentThread() == thread()) {
        player_->stop();
    } else {
        post([this]() { player_->stop(); });
    }
}

void SessionController::startPlayback(const QString& filePath) {
    post([this, filePath]() { player_->play(filePath); });
}

void SessionController::emitFailure(const OperationError& error, bool recording) {
    if (recording) {
        post([this, error]() {
            emit recordingFailed(error);
            emit stateChanged();
        });
    } else {
        post([this, error]() {
            emit transcriptionFailed(error);
            emit stateChanged();
        });
    }
}

} // namespace Scribe
