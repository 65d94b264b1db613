#pragma once

#include <QtCore/QObject>
#include <QtCore/QString>
#include "../../core/session/SessionController.hpp"
#include "../../core/session/SessionErrors.hpp"

namespace Scribe {

/**
 * @brief Host-facing facade over SessionController.
 *
 * Forwards the session's events, exposes its flags as properties and keeps
 * the microphone permission bookkeeping that the host drives.
 */
class DictationController : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool modelLoaded READ isModelLoaded NOTIFY stateChanged)
    Q_PROPERTY(bool canTranscribe READ canTranscribe NOTIFY stateChanged)
    Q_PROPERTY(bool recording READ isRecording NOTIFY stateChanged)
    Q_PROPERTY(bool micPermissionGranted READ isMicPermissionGranted NOTIFY stateChanged)

public:
    explicit DictationController(QObject* parent = nullptr);
    // Takes ownership of session.
    explicit DictationController(SessionController* session, QObject* parent = nullptr);
    ~DictationController() override;

    bool isModelLoaded() const;
    bool canTranscribe() const;
    bool isRecording() const;
    bool isMicPermissionGranted() const;

    SessionController* session() const { return session_; }

public slots:
    void initializeModel(const QString& modelPath, bool log = true);
    void initializeModelFromAsset(const QString& assetName, bool log = true);

    void callRequestRecordPermission();
    void onRecordPermissionResult(bool granted);

    void startRecording();
    void stopRecording();
    void toggleRecording();

    void transcribeAudioFile(const QString& filePath, bool log = true, bool withTimestamps = false);
    void enablePlayback(bool enabled);
    void benchmark();
    void reset();
    void cleanup();

    QString getMessageLogs() const;
    QString getSystemInfo();

signals:
    void stateChanged();
    void modelLoadFinished(bool ok, const QString& message);

    void transcribed(const QString& text);
    void recordingFailed(const Scribe::OperationError& error);
    void transcriptionFailed(const Scribe::OperationError& error);
    void permissionRequestNeeded();
    void recordingStarted();
    void recordingStopped();

private:
    void connectSessionSignals();
    void watchLoad(QFuture<Expected<void, LoadError>> future, const QString& label);

    SessionController* session_ = nullptr;
};

} // namespace Scribe
