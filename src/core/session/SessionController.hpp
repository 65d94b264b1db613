#pragma once

#include "SessionErrors.hpp"
#include "../audio/AudioCapture.hpp"
#include "../audio/AudioDecoder.hpp"
#include "../audio/AudioPlayer.hpp"
#include "../common/Expected.hpp"
#include "../common/MessageLog.hpp"
#include "../transcription/EngineHandle.hpp"
#include "../transcription/WhisperBackend.hpp"

#include <QtCore/QFuture>
#include <QtCore/QMutex>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QThreadPool>
#include <functional>
#include <memory>

namespace Scribe {

/**
 * @brief Orchestrates model loading, recording and transcription for one session.
 *
 * Owns at most one EngineHandle and one AudioCapture. The canTranscribe flag is
 * the busy gate shared by transcription and benchmarking: an operation that
 * finds it closed returns without touching the engine. All flag writes happen
 * under stateMutex_ inside the public operations; events are always emitted on
 * the thread this object lives in, in the order they were posted.
 *
 * Background work runs on a private thread pool; engine calls are further
 * serialized by the EngineHandle itself.
 */
class SessionController : public QObject {
    Q_OBJECT

public:
    using PermissionProbe = std::function<bool()>;

    // Collaborators. Any member left empty is replaced with the system default.
    struct Dependencies {
        std::shared_ptr<WhisperBackend> backend;
        std::unique_ptr<AudioCapture> capture;
        std::unique_ptr<AudioDecoder> decoder;
        std::unique_ptr<AudioPlayer> player;
        PermissionProbe permissionProbe;
        QString scratchDirectory;
    };

    explicit SessionController(QObject* parent = nullptr);
    explicit SessionController(Dependencies dependencies, QObject* parent = nullptr);
    ~SessionController() override;

    bool isModelLoaded() const;
    bool canTranscribe() const;
    bool isRecording() const;
    bool isMicPermissionGranted() const;
    bool isPlaybackEnabled() const;
    QString recordedFile() const;

    // Path checks fail immediately; the load itself runs in the background.
    QFuture<Expected<void, LoadError>> loadModelFromPath(const QString& path, bool logEnabled = true);
    // assetName is resolved under models/assetRoot unless it is already a resource or absolute path.
    QFuture<Expected<void, LoadError>> loadModelFromAsset(const QString& assetName, bool logEnabled = true);

    void startRecording();
    QFuture<void> stopRecording();
    QFuture<void> transcribeAudioFile(const QString& filePath, bool logEnabled = true, bool withTimestamps = false);
    QFuture<void> benchmarkCurrentModel();

    void resetState();
    // Resets and stops all background work. The controller is inert afterwards.
    void cleanup();

    bool refreshAndCheckSystemMicPermission();
    // Refreshes the permission; when it is missing, asks the host for it through permissionRequestNeeded.
    bool requestMicPermission();
    void updateInternalMicPermissionStatus(bool granted);
    void setAudioPlaybackEnabled(bool enabled);

    QString getSystemInfo(bool logEnabled = true);
    QString messageLog() const;

    static bool systemMicPermission();

signals:
    void transcribed(const QString& text);
    void recordingFailed(const Scribe::OperationError& error);
    void transcriptionFailed(const Scribe::OperationError& error);
    void permissionRequestNeeded();
    void recordingStarted();
    void recordingStopped();
    void stateChanged();

private:
    enum class GateRejection {
        ModelNotLoaded,
        Busy,
        ShuttingDown
    };

    using EngineFactory = std::function<Expected<std::shared_ptr<EngineHandle>, LoadError>()>;

    QFuture<Expected<void, LoadError>> rejectLoad(const LoadError& error, bool logEnabled);
    Expected<void, LoadError> installEngine(const EngineFactory& factory, const QString& label, bool logEnabled);
    QString resolveAssetPath(const QString& assetName) const;

    Expected<std::shared_ptr<EngineHandle>, GateRejection> acquireEngine();
    void releaseGate();
    void refreshCanTranscribeLocked();

    void finishRecording(quint64 generation);
    void discardRecording(const QString& file, const Expected<void, CaptureError>& stopped);
    void handleCaptureError(quint64 generation, CaptureError error, const QString& details);
    void performTranscription(const std::shared_ptr<EngineHandle>& engine,
                              const QString& filePath,
                              bool logEnabled,
                              bool withTimestamps);
    void performBenchmark(const std::shared_ptr<EngineHandle>& engine);
    Expected<QString, QString> allocateRecordingFile();

    template<typename Fn>
    void post(Fn&& fn) {
        QMetaObject::invokeMethod(this, std::forward<Fn>(fn), Qt::QueuedConnection);
    }
    void stopPlayback();
    void startPlayback(const QString& filePath);
    void emitFailure(const OperationError& error, bool recording);

    std::shared_ptr<WhisperBackend> backend_;
    std::unique_ptr<AudioCapture> capture_;
    std::unique_ptr<AudioDecoder> decoder_;
    std::unique_ptr<AudioPlayer> player_;
    PermissionProbe permissionProbe_;
    QString scratchDirectory_;

    mutable QMutex stateMutex_;
    std::shared_ptr<EngineHandle> engine_;
    bool modelLoaded_ = false;
    bool canTranscribe_ = false;
    bool recording_ = false;
    bool stopping_ = false;
    bool busy_ = false;
    bool micPermissionGranted_ = false;
    bool playbackEnabled_ = true;
    bool shuttingDown_ = false;
    quint64 recordingGeneration_ = 0;
    QString recordedFile_;
    QString lastRecording_;

    QMutex loadMutex_;  // one load at a time, so two handles never coexist
    MessageLog log_;
    QThreadPool pool_;
};

} // namespace Scribe
