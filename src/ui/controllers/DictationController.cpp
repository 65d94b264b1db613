#include "DictationController.hpp"
#include "../../core/common/Logger.hpp"

#include <QtCore/QFileInfo>
#include <QtCore/QFutureWatcher>

namespace Scribe {

DictationController::DictationController(QObject* parent)
    : DictationController(new SessionController(), parent) {
}

DictationController::DictationController(SessionController* session, QObject* parent)
    : QObject(parent)
    , session_(session) {
    session_->setParent(this);
    connectSessionSignals();
    Logger::instance().info("DictationController created");
}

DictationController::~DictationController() {
    cleanup();
}

void DictationController::connectSessionSignals() {
    connect(session_, &SessionController::stateChanged, this, &DictationController::stateChanged);
    connect(session_, &SessionController::transcribed, this, &DictationController::transcribed);
    connect(session_, &SessionController::recordingFailed, this, &DictationController::recordingFailed);
    connect(session_, &SessionController::transcriptionFailed, this, &DictationController::transcriptionFailed);
    connect(session_, &SessionController::permissionRequestNeeded, this, &DictationController::permissionRequestNeeded);
    connect(session_, &SessionController::recordingStarted, this, &DictationController::recordingStarted);
    connect(session_, &SessionController::recordingStopped, this, &DictationController::recordingStopped);
}

bool DictationController::isModelLoaded() const {
    return session_->isModelLoaded();
}

bool DictationController::canTranscribe() const {
    return session_->canTranscribe();
}

bool DictationController::isRecording() const {
    return session_->isRecording();
}

bool DictationController::isMicPermissionGranted() const {
    return session_->isMicPermissionGranted();
}

void DictationController::initializeModel(const QString& modelPath, bool log) {
    watchLoad(session_->loadModelFromPath(modelPath, log), modelPath);
}

void DictationController::initializeModelFromAsset(const QString& assetName, bool log) {
    watchLoad(session_->loadModelFromAsset(assetName, log), assetName);
}

void DictationController::watchLoad(QFuture<Expected<void, LoadError>> future, const QString& label) {
    auto watcher = new QFutureWatcher<Expected<void, LoadError>>(this);
    connect(watcher, &QFutureWatcher<Expected<void, LoadError>>::finished,
            [this, watcher, label]() {
        const auto result = watcher->result();
        watcher->deleteLater();

        if (result.hasValue()) {
            Logger::instance().info("DictationController: model {} ready", label.toStdString());
            emit modelLoadFinished(true, QString());
        } else {
            const QString message = result.error().message();
            Logger::instance().error("DictationController: {}", message.toStdString());
            emit modelLoadFinished(false, message);
        }
    });
    watcher->setFuture(future);
}

void DictationController::callRequestRecordPermission() {
    if (session_->requestMicPermission()) {
        Logger::instance().debug("DictationController: microphone permission already granted");
    }
}

void DictationController::onRecordPermissionResult(bool granted) {
    session_->updateInternalMicPermissionStatus(granted);
}

void DictationController::startRecording() {
    session_->startRecording();
}

void DictationController::stopRecording() {
    session_->stopRecording();
}

void DictationController::toggleRecording() {
    if (session_->isRecording()) {
        stopRecording();
    } else {
        startRecording();
    }
}

void DictationController::transcribeAudioFile(const QString& filePath, bool log, bool withTimestamps) {
    if (!QFileInfo::exists(filePath)) {
        Logger::instance().warn("DictationController: audio file {} does not exist", filePath.toStdString());
        emit transcriptionFailed(OperationError::missingRecordedFile());
        return;
    }
    session_->transcribeAudioFile(filePath, log, withTimestamps);
}

void DictationController::enablePlayback(bool enabled) {
    session_->setAudioPlaybackEnabled(enabled);
}

void DictationController::benchmark() {
    if (!session_->isModelLoaded()) {
        Logger::instance().warn("DictationController: benchmark needs a loaded model");
        return;
    }
    session_->benchmarkCurrentModel();
}

void DictationController::reset() {
    session_->resetState();
}

void DictationController::cleanup() {
    session_->cleanup();
}

QString DictationController::getMessageLogs() const {
    return session_->messageLog();
}

QString DictationController::getSystemInfo() {
    return session_->getSystemInfo(true);
}

} // namespace Scribe
