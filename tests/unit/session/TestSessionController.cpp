#include <QtTest/QtTest>
#include <QtTest/QSignalSpy>
#include <QtCore/QDir>
#include <QtCore/QFileInfo>

#include "../../../src/core/session/SessionController.hpp"
#include "../../utils/TestUtils.hpp"
#include "../../utils/MockComponents.hpp"

using namespace Scribe;
using namespace Scribe::Test;

class TestSessionController : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // Model loading
    void testLoadEmptyPathLeavesEngineUntouched();
    void testLoadMissingModelReportsNotFound();
    void testLoadSuccessOpensGate();
    void testLoadFailureClosesGate();
    void testReloadReleasesPreviousEngineFirst();
    void testLoadFromAsset();

    // Recording
    void testRecordingRefusedWithoutPermission();
    void testRecordingFlagSpansStartToStop();
    void testStartWithoutModelIsSilent();
    void testStartWhileRecordingIsIgnored();
    void testStopWhenIdleIsPureNoOp();
    void testCaptureFailureEndsRecording();
    void testModelLostDuringRecording();
    void testNextRecordingRemovesPreviousFile();
    void testStopKeepsGateForRecordedTake();

    // Transcription
    void testConcurrentTranscriptionsRunEngineOnce();
    void testTranscribeWithoutModel();
    void testDecodeFailureReopensGate();
    void testEngineFailureReopensGate();
    void testTranscribeWithTimestamps();
    void testPlaybackFollowsToggle();

    // Benchmark
    void testBenchmarkAppendsResults();
    void testBenchmarkWithoutModelIsSkipped();
    void testBenchmarkSharesBusyGate();

    // Lifecycle
    void testResetClearsState();
    void testResetWhileRecordingJoinsCapture();
    void testCleanupTwiceMatchesOnce();
    void testPermissionBookkeeping();
    void testSystemInfoIsLogged();

private:
    void createSession();
    bool loadModel();
    QString writeModelFile(const QString& name);

    QStringList scratchRecordings() const {
        return QDir(tempDir_ + "/scratch").entryList({"recording-*.wav"}, QDir::Files);
    }

    static OperationError::Kind kindAt(const QSignalSpy& spy, int index) {
        return spy.at(index).at(0).value<OperationError>().kind;
    }

    QString tempDir_;
    QString modelPath_;
    std::shared_ptr<MockWhisperBackend> backend_;
    std::shared_ptr<FakeMicrophoneState> mic_;
    FakeAudioDecoder* decoder_ = nullptr;
    RecordingAudioPlayer* player_ = nullptr;
    std::atomic<bool> permission_{true};
    std::unique_ptr<SessionController> session_;
};

void TestSessionController::init() {
    tempDir_ = TestUtils::createTempDirectory("session");
    QVERIFY(!tempDir_.isEmpty());
    modelPath_ = writeModelFile("ggml-tiny.en.bin");

    backend_ = std::make_shared<MockWhisperBackend>();
    mic_ = std::make_shared<FakeMicrophoneState>();
    permission_ = true;
    createSession();
}

void TestSessionController::cleanup() {
    session_.reset();
    decoder_ = nullptr;
    player_ = nullptr;
}

void TestSessionController::createSession() {
    SessionController::Dependencies dependencies;
    dependencies.backend = backend_;
    dependencies.capture = std::make_unique<AudioCapture>(FakeAudioInputDevice::factory(mic_));

    auto decoder = std::make_unique<FakeAudioDecoder>();
    decoder_ = decoder.get();
    dependencies.decoder = std::move(decoder);

    auto player = std::make_unique<RecordingAudioPlayer>();
    player_ = player.get();
    dependencies.player = std::move(player);

    dependencies.permissionProbe = [this]() { return permission_.load(); };
    dependencies.scratchDirectory = tempDir_ + "/scratch";

    session_ = std::make_unique<SessionController>(std::move(dependencies));
}

QString TestSessionController::writeModelFile(const QString& name) {
    return TestUtils::createTestTextFile(tempDir_, "ggml", name);
}

bool TestSessionController::loadModel() {
    auto result = TestUtils::waitForFuture(session_->loadModelFromPath(modelPath_));
    return result.hasValue();
}

// ---------------------------------------------------------------------------

void TestSessionController::testLoadEmptyPathLeavesEngineUntouched() {
    QVERIFY(loadModel());
    backend_->resetCounters();

    auto result = TestUtils::waitForFuture(session_->loadModelFromPath(""));
    QVERIFY(result.hasError());
    QCOMPARE(result.error().kind, LoadError::Kind::PathEmpty);
    QVERIFY(session_->messageLog().contains("Error: " + LoadError::pathEmpty().message()));

    QVERIFY(session_->isModelLoaded());
    QVERIFY(session_->canTranscribe());
    QCOMPARE(backend_->getInitCount(), 0);
    QCOMPARE(backend_->getFreeCount(), 0);
}

void TestSessionController::testLoadMissingModelReportsNotFound() {
    auto result = TestUtils::waitForFuture(session_->loadModelFromPath(tempDir_ + "/missing.bin"));
    QVERIFY(result.hasError());
    QCOMPARE(result.error().kind, LoadError::Kind::ModelNotFound);
    QVERIFY(!session_->isModelLoaded());
    QVERIFY(!session_->canTranscribe());

    // A directory is not a model file either.
    auto directory = TestUtils::waitForFuture(session_->loadModelFromPath(tempDir_));
    QCOMPARE(directory.error().kind, LoadError::Kind::ModelNotFound);
    QCOMPARE(backend_->getInitCount(), 0);
}

void TestSessionController::testLoadSuccessOpensGate() {
    QSignalSpy changed(session_.get(), &SessionController::stateChanged);

    QVERIFY(loadModel());
    QVERIFY(session_->isModelLoaded());
    QVERIFY(session_->canTranscribe());
    QVERIFY(!session_->isRecording());
    QTRY_VERIFY(changed.count() > 0);
    QVERIFY(session_->messageLog().contains("Loaded model ggml-tiny.en.bin"));
}

void TestSessionController::testLoadFailureClosesGate() {
    QVERIFY(loadModel());
    backend_->setFailInit(true);

    auto result = TestUtils::waitForFuture(session_->loadModelFromPath(modelPath_));
    QVERIFY(result.hasError());
    QCOMPARE(result.error().kind, LoadError::Kind::UnableToLoad);
    QVERIFY(!result.error().cause.isEmpty());

    QVERIFY(!session_->isModelLoaded());
    QVERIFY(!session_->canTranscribe());
    // The previous engine was released before the failed attempt.
    QCOMPARE(backend_->getFreeCount(), 1);
    QCOMPARE(backend_->getLiveContexts(), 0);
}

void TestSessionController::testReloadReleasesPreviousEngineFirst() {
    QVERIFY(loadModel());
    QVERIFY(loadModel());
    QVERIFY(loadModel());

    QCOMPARE(backend_->getInitCount(), 3);
    QCOMPARE(backend_->getFreeCount(), 2);
    QCOMPARE(backend_->getMaxLiveContexts(), 1);
    QVERIFY(session_->isModelLoaded());
}

void TestSessionController::testLoadFromAsset() {
    auto empty = TestUtils::waitForFuture(session_->loadModelFromAsset(""));
    QCOMPARE(empty.error().kind, LoadError::Kind::PathEmpty);

    auto missing = TestUtils::waitForFuture(session_->loadModelFromAsset(tempDir_ + "/absent.bin"));
    QCOMPARE(missing.error().kind, LoadError::Kind::ModelNotFound);

    auto loaded = TestUtils::waitForFuture(session_->loadModelFromAsset(modelPath_));
    ASSERT_EXPECTED_VALUE(loaded);
    QVERIFY(session_->isModelLoaded());
    QVERIFY(session_->canTranscribe());
}

// ---------------------------------------------------------------------------

void TestSessionController::testRecordingRefusedWithoutPermission() {
    QVERIFY(loadModel());
    permission_ = false;
    QVERIFY(!session_->refreshAndCheckSystemMicPermission());

    QSignalSpy failed(session_.get(), &SessionController::recordingFailed);
    QSignalSpy started(session_.get(), &SessionController::recordingStarted);

    session_->startRecording();
    QTRY_COMPARE(failed.count(), 1);
    QTest::qWait(50);

    QCOMPARE(failed.count(), 1);
    QCOMPARE(kindAt(failed, 0), OperationError::Kind::MicPermissionDenied);
    QCOMPARE(started.count(), 0);
    QCOMPARE(mic_->openCount.load(), 0);
    QVERIFY(!session_->isRecording());
    QVERIFY(session_->canTranscribe());
}

void TestSessionController::testRecordingFlagSpansStartToStop() {
    QVERIFY(loadModel());
    QVERIFY(session_->refreshAndCheckSystemMicPermission());

    QSignalSpy started(session_.get(), &SessionController::recordingStarted);
    QSignalSpy stopped(session_.get(), &SessionController::recordingStopped);
    QSignalSpy transcribed(session_.get(), &SessionController::transcribed);

    bool stopRequested = false;
    int violations = 0;
    connect(session_.get(), &SessionController::stateChanged, this, [&]() {
        if (!stopRequested && session_->isRecording() && session_->canTranscribe()) {
            ++violations;
        }
    });

    QVERIFY(!session_->isRecording());
    session_->startRecording();
    QVERIFY(session_->isRecording());
    QVERIFY(!session_->canTranscribe());
    QVERIFY(!session_->recordedFile().isEmpty());
    QTRY_COMPARE(started.count(), 1);

    QVERIFY(TestUtils::waitForCondition([this]() { return mic_->readCount.load() >= 3; }));
    QVERIFY(session_->isRecording());
    QVERIFY(!session_->canTranscribe());

    const QString recorded = session_->recordedFile();
    QVERIFY(recorded.startsWith(tempDir_ + "/scratch/recording-"));
    QVERIFY(recorded.endsWith(".wav"));

    stopRequested = true;
    QVERIFY(TestUtils::waitForFuture(session_->stopRecording()));
    QVERIFY(!session_->isRecording());
    QTRY_COMPARE(stopped.count(), 1);
    QTRY_COMPARE(transcribed.count(), 1);

    QCOMPARE(violations, 0);
    QVERIFY(session_->canTranscribe());
    QVERIFY(session_->recordedFile().isEmpty());
    QCOMPARE(decoder_->getLastPath(), recorded);
    QCOMPARE(backend_->getTranscribeCount(), 1);
}

void TestSessionController::testStartWithoutModelIsSilent() {
    QVERIFY(session_->refreshAndCheckSystemMicPermission());

    QSignalSpy started(session_.get(), &SessionController::recordingStarted);
    QSignalSpy recordingFailed(session_.get(), &SessionController::recordingFailed);
    QSignalSpy transcriptionFailed(session_.get(), &SessionController::transcriptionFailed);

    session_->startRecording();
    QTest::qWait(50);

    QVERIFY(!session_->isRecording());
    QCOMPARE(started.count(), 0);
    QCOMPARE(recordingFailed.count(), 0);
    QCOMPARE(transcriptionFailed.count(), 0);
    QCOMPARE(mic_->openCount.load(), 0);
}

void TestSessionController::testStartWhileRecordingIsIgnored() {
    QVERIFY(loadModel());
    QVERIFY(session_->refreshAndCheckSystemMicPermission());
    QSignalSpy started(session_.get(), &SessionController::recordingStarted);

    session_->startRecording();
    const QString first = session_->recordedFile();
    session_->startRecording();
    QTRY_COMPARE(started.count(), 1);
    QTest::qWait(30);

    QCOMPARE(started.count(), 1);
    QCOMPARE(session_->recordedFile(), first);
    QCOMPARE(mic_->openCount.load(), 1);

    QVERIFY(TestUtils::waitForFuture(session_->stopRecording()));
}

void TestSessionController::testStopWhenIdleIsPureNoOp() {
    QVERIFY(loadModel());
    QTest::qWait(20);

    QSignalSpy changed(session_.get(), &SessionController::stateChanged);
    QSignalSpy stopped(session_.get(), &SessionController::recordingStopped);
    QSignalSpy transcribed(session_.get(), &SessionController::transcribed);
    QSignalSpy recordingFailed(session_.get(), &SessionController::recordingFailed);
    QSignalSpy transcriptionFailed(session_.get(), &SessionController::transcriptionFailed);

    const QString log = session_->messageLog();
    QFuture<void> future = session_->stopRecording();
    QVERIFY(future.isFinished());
    QTest::qWait(50);

    QCOMPARE(changed.count(), 0);
    QCOMPARE(stopped.count(), 0);
    QCOMPARE(transcribed.count(), 0);
    QCOMPARE(recordingFailed.count(), 0);
    QCOMPARE(transcriptionFailed.count(), 0);
    QVERIFY(session_->isModelLoaded());
    QVERIFY(session_->canTranscribe());
    QVERIFY(!session_->isRecording());
    QCOMPARE(session_->messageLog(), log);
    QCOMPARE(mic_->openCount.load(), 0);
}

void TestSessionController::testCaptureFailureEndsRecording() {
    mic_->failAfterReads = 1;
    QVERIFY(loadModel());
    QVERIFY(session_->refreshAndCheckSystemMicPermission());
    QSignalSpy failed(session_.get(), &SessionController::recordingFailed);

    session_->startRecording();
    QTRY_COMPARE(failed.count(), 1);
    QCOMPARE(kindAt(failed, 0), OperationError::Kind::RecordingFailed);

    QVERIFY(!session_->isRecording());
    QVERIFY(session_->recordedFile().isEmpty());
    QVERIFY(session_->canTranscribe());
    QCOMPARE(backend_->getTranscribeCount(), 0);
    QVERIFY(scratchRecordings().isEmpty());
}

void TestSessionController::testModelLostDuringRecording() {
    QVERIFY(loadModel());
    QVERIFY(session_->refreshAndCheckSystemMicPermission());
    QSignalSpy failed(session_.get(), &SessionController::transcriptionFailed);
    QSignalSpy stopped(session_.get(), &SessionController::recordingStopped);

    session_->startRecording();
    QVERIFY(session_->isRecording());

    backend_->setFailInit(true);
    auto reload = TestUtils::waitForFuture(session_->loadModelFromPath(modelPath_));
    QVERIFY(reload.hasError());
    QVERIFY(!session_->isModelLoaded());

    QVERIFY(TestUtils::waitForFuture(session_->stopRecording()));
    QTRY_COMPARE(stopped.count(), 1);
    QTRY_COMPARE(failed.count(), 1);
    QCOMPARE(kindAt(failed, 0), OperationError::Kind::ModelNotLoaded);
    QVERIFY(!session_->canTranscribe());
    QVERIFY(session_->recordedFile().isEmpty());
}

void TestSessionController::testNextRecordingRemovesPreviousFile() {
    QVERIFY(loadModel());
    QVERIFY(session_->refreshAndCheckSystemMicPermission());

    session_->startRecording();
    const QString first = session_->recordedFile();
    QVERIFY(TestUtils::waitForCondition([this]() { return mic_->readCount.load() >= 2; }));
    QVERIFY(TestUtils::waitForFuture(session_->stopRecording()));
    ASSERT_FILE_EXISTS(first);

    session_->startRecording();
    QVERIFY(session_->isRecording());
    ASSERT_FILE_NOT_EXISTS(first);
    QVERIFY(session_->recordedFile() != first);

    QVERIFY(TestUtils::waitForFuture(session_->stopRecording()));
}

void TestSessionController::testStopKeepsGateForRecordedTake() {
    QVERIFY(loadModel());
    backend_->setTranscribeDelayMs(300);
    QVERIFY(session_->refreshAndCheckSystemMicPermission());
    const QString other = TestUtils::createTestWavFile(tempDir_, 200, 16000, 1, "other.wav");
    QSignalSpy transcribed(session_.get(), &SessionController::transcribed);
    QSignalSpy failed(session_.get(), &SessionController::transcriptionFailed);

    // A host that reacts to the stop by transcribing something else must not take the recorded take's turn.
    int rejected = 0;
    connect(session_.get(), &SessionController::recordingStopped, this, [this, other, &rejected]() {
        if (!session_->canTranscribe()) {
            ++rejected;
        }
        session_->transcribeAudioFile(other);
    });

    session_->startRecording();
    const QString recorded = session_->recordedFile();
    QVERIFY(TestUtils::waitForCondition([this]() { return mic_->readCount.load() >= 2; }));
    QVERIFY(TestUtils::waitForFuture(session_->stopRecording()));

    QTRY_COMPARE(transcribed.count(), 1);
    QCOMPARE(rejected, 1);
    QCOMPARE(failed.count(), 0);
    QCOMPARE(backend_->getTranscribeCount(), 1);
    QCOMPARE(decoder_->getDecodeCount(), 1);
    QCOMPARE(decoder_->getLastPath(), recorded);
}

// ---------------------------------------------------------------------------

void TestSessionController::testConcurrentTranscriptionsRunEngineOnce() {
    QVERIFY(loadModel());
    backend_->setTranscribeDelayMs(100);
    const QString audio = TestUtils::createTestWavFile(tempDir_);
    QSignalSpy transcribed(session_.get(), &SessionController::transcribed);
    QSignalSpy failed(session_.get(), &SessionController::transcriptionFailed);

    QFuture<void> first = session_->transcribeAudioFile(audio);
    QVERIFY(!session_->canTranscribe());
    QFuture<void> second = session_->transcribeAudioFile(audio);
    QVERIFY(second.isFinished());

    QVERIFY(TestUtils::waitForFuture(first));
    QTRY_COMPARE(transcribed.count(), 1);
    QTest::qWait(30);

    QCOMPARE(backend_->getTranscribeCount(), 1);
    QCOMPARE(decoder_->getDecodeCount(), 1);
    QCOMPARE(transcribed.count(), 1);
    QCOMPARE(failed.count(), 0);
    QVERIFY(session_->canTranscribe());
}

void TestSessionController::testTranscribeWithoutModel() {
    QSignalSpy failed(session_.get(), &SessionController::transcriptionFailed);

    QFuture<void> future = session_->transcribeAudioFile(TestUtils::createTestWavFile(tempDir_));
    QVERIFY(future.isFinished());
    QTRY_COMPARE(failed.count(), 1);
    QCOMPARE(kindAt(failed, 0), OperationError::Kind::ModelNotLoaded);
    QCOMPARE(decoder_->getDecodeCount(), 0);
    QVERIFY(!session_->canTranscribe());
}

void TestSessionController::testDecodeFailureReopensGate() {
    QVERIFY(loadModel());
    decoder_->setError(DecodeError::UnsupportedFormat);
    QSignalSpy failed(session_.get(), &SessionController::transcriptionFailed);

    QVERIFY(TestUtils::waitForFuture(session_->transcribeAudioFile(tempDir_ + "/clip.ogg")));
    QTRY_COMPARE(failed.count(), 1);
    QCOMPARE(kindAt(failed, 0), OperationError::Kind::TranscriptionFailed);
    QVERIFY(!failed.at(0).at(0).value<OperationError>().details.isEmpty());
    QCOMPARE(backend_->getTranscribeCount(), 0);
    QVERIFY(session_->canTranscribe());
    QCOMPARE(player_->getPlayCount(), 0);
}

void TestSessionController::testEngineFailureReopensGate() {
    QVERIFY(loadModel());
    backend_->setTranscribeResultCode(-3);
    QSignalSpy failed(session_.get(), &SessionController::transcriptionFailed);
    QSignalSpy transcribed(session_.get(), &SessionController::transcribed);

    QVERIFY(TestUtils::waitForFuture(session_->transcribeAudioFile(TestUtils::createTestWavFile(tempDir_))));
    QTRY_COMPARE(failed.count(), 1);
    QCOMPARE(kindAt(failed, 0), OperationError::Kind::TranscriptionFailed);
    QCOMPARE(transcribed.count(), 0);
    QVERIFY(session_->canTranscribe());
    QVERIFY(session_->messageLog().contains("Transcription failed"));
}

void TestSessionController::testTranscribeWithTimestamps() {
    backend_->setSegments({
        TranscriptionSegment{0, 100, "<seg0>"},
        TranscriptionSegment{100, 200, "<seg1>"}
    });
    QVERIFY(loadModel());
    QSignalSpy transcribed(session_.get(), &SessionController::transcribed);

    const QString audio = TestUtils::createTestWavFile(tempDir_);
    QVERIFY(TestUtils::waitForFuture(session_->transcribeAudioFile(audio, true, true)));
    QTRY_COMPARE(transcribed.count(), 1);
    QCOMPARE(transcribed.at(0).at(0).toString(),
             QString("[00:00:00.000 --> 00:00:01.000]: <seg0>\n[00:00:01.000 --> 00:00:02.000]: <seg1>\n"));

    const QString log = session_->messageLog();
    QVERIFY(log.contains("Reading wave samples... 1600 samples"));
    QVERIFY(log.contains("Transcribing data..."));
    QVERIFY(log.contains("Done ("));
}

void TestSessionController::testPlaybackFollowsToggle() {
    QVERIFY(loadModel());
    QVERIFY(session_->isPlaybackEnabled());
    const QString audio = TestUtils::createTestWavFile(tempDir_);

    QVERIFY(TestUtils::waitForFuture(session_->transcribeAudioFile(audio)));
    QTRY_COMPARE(player_->getPlayCount(), 1);
    QCOMPARE(player_->getPlayedFiles().value(0), audio);

    session_->setAudioPlaybackEnabled(false);
    QVERIFY(!session_->isPlaybackEnabled());
    QVERIFY(player_->getStopCount() >= 1);

    QVERIFY(TestUtils::waitForFuture(session_->transcribeAudioFile(audio)));
    QTest::qWait(30);
    QCOMPARE(player_->getPlayCount(), 1);
}

// ---------------------------------------------------------------------------

void TestSessionController::testBenchmarkAppendsResults() {
    QVERIFY(loadModel());

    QVERIFY(TestUtils::waitForFuture(session_->benchmarkCurrentModel()));
    QCOMPARE(backend_->getBenchCount(), 2);

    const QString log = session_->messageLog();
    const int startedAt = log.indexOf("Running benchmark. This will take minutes...\n");
    const int memcpyAt = log.indexOf("memcpy:");
    const int mulMatAt = log.indexOf("GFLOPS");
    QVERIFY(startedAt >= 0);
    QVERIFY(memcpyAt > startedAt);
    QVERIFY(mulMatAt > memcpyAt);
    QTRY_VERIFY(session_->canTranscribe());
}

void TestSessionController::testBenchmarkWithoutModelIsSkipped() {
    QFuture<void> future = session_->benchmarkCurrentModel();
    QVERIFY(future.isFinished());
    QCOMPARE(backend_->getBenchCount(), 0);
    QCOMPARE(session_->messageLog(), QString("Model not loaded. Cannot benchmark.\n"));
}

void TestSessionController::testBenchmarkSharesBusyGate() {
    QVERIFY(loadModel());
    backend_->setTranscribeDelayMs(100);

    QFuture<void> transcription = session_->transcribeAudioFile(TestUtils::createTestWavFile(tempDir_));
    QFuture<void> benchmark = session_->benchmarkCurrentModel();
    QVERIFY(benchmark.isFinished());

    QVERIFY(TestUtils::waitForFuture(transcription));
    QCOMPARE(backend_->getBenchCount(), 0);
    QCOMPARE(backend_->getTranscribeCount(), 1);
    QCOMPARE(backend_->getMaxConcurrentCalls(), 1);
    QVERIFY(!session_->messageLog().contains("Running benchmark"));
}

// ---------------------------------------------------------------------------

void TestSessionController::testResetClearsState() {
    QVERIFY(loadModel());
    session_->getSystemInfo();
    QVERIFY(!session_->messageLog().isEmpty());

    session_->resetState();
    QVERIFY(!session_->isModelLoaded());
    QVERIFY(!session_->canTranscribe());
    QVERIFY(!session_->isRecording());
    QVERIFY(session_->recordedFile().isEmpty());
    QVERIFY(session_->messageLog().isEmpty());
    QVERIFY(player_->getStopCount() >= 1);

    // The handle is released in the background but always released.
    QVERIFY(TestUtils::waitForCondition([this]() { return backend_->getFreeCount() == 1; }));

    // The session stays usable.
    QVERIFY(loadModel());
    QVERIFY(session_->canTranscribe());
}

void TestSessionController::testResetWhileRecordingJoinsCapture() {
    QVERIFY(loadModel());
    QVERIFY(session_->refreshAndCheckSystemMicPermission());

    session_->startRecording();
    QVERIFY(session_->isRecording());
    QVERIFY(TestUtils::waitForCondition([this]() { return mic_->readCount.load() >= 2; }));

    session_->resetState();
    // The capture thread is finished by the time resetState() returns.
    QCOMPARE(mic_->closeCount.load(), 1);
    QVERIFY(!session_->isRecording());
    QVERIFY(scratchRecordings().isEmpty());

    // A new take right after the reset is not cut short by it.
    QVERIFY(loadModel());
    QSignalSpy transcribed(session_.get(), &SessionController::transcribed);
    session_->startRecording();
    QVERIFY(session_->isRecording());
    QVERIFY(TestUtils::waitForCondition([this]() { return mic_->openCount.load() == 2; }));
    QTest::qWait(50);
    QCOMPARE(mic_->closeCount.load(), 1);

    QVERIFY(TestUtils::waitForFuture(session_->stopRecording()));
    QCOMPARE(mic_->closeCount.load(), 2);
    QTRY_COMPARE(transcribed.count(), 1);
    QCOMPARE(scratchRecordings().size(), qsizetype(1));
}

void TestSessionController::testCleanupTwiceMatchesOnce() {
    QVERIFY(loadModel());
    QVERIFY(session_->refreshAndCheckSystemMicPermission());
    session_->startRecording();
    QVERIFY(session_->isRecording());

    session_->cleanup();
    const bool loaded = session_->isModelLoaded();
    const bool gate = session_->canTranscribe();
    const bool recording = session_->isRecording();
    const int freed = backend_->getFreeCount();

    session_->cleanup();
    QCOMPARE(session_->isModelLoaded(), loaded);
    QCOMPARE(session_->canTranscribe(), gate);
    QCOMPARE(session_->isRecording(), recording);
    QCOMPARE(backend_->getFreeCount(), freed);

    QVERIFY(!loaded);
    QVERIFY(!gate);
    QVERIFY(!recording);
    QCOMPARE(freed, 1);
    QCOMPARE(mic_->closeCount.load(), 1);

    // Inert afterwards.
    QSignalSpy started(session_.get(), &SessionController::recordingStarted);
    session_->startRecording();
    QTest::qWait(30);
    QCOMPARE(started.count(), 0);
}

void TestSessionController::testPermissionBookkeeping() {
    QSignalSpy needed(session_.get(), &SessionController::permissionRequestNeeded);

    permission_ = false;
    QVERIFY(!session_->requestMicPermission());
    QTRY_COMPARE(needed.count(), 1);

    session_->updateInternalMicPermissionStatus(true);
    QVERIFY(session_->isMicPermissionGranted());

    QVERIFY(!session_->refreshAndCheckSystemMicPermission());
    QVERIFY(!session_->isMicPermissionGranted());

    permission_ = true;
    QVERIFY(session_->requestMicPermission());
    QVERIFY(session_->isMicPermissionGranted());
    QTest::qWait(20);
    QCOMPARE(needed.count(), 1);
}

void TestSessionController::testSystemInfoIsLogged() {
    backend_->setSystemInfo("AVX = 1 | test");
    QCOMPARE(session_->getSystemInfo(), QString("AVX = 1 | test"));
    QVERIFY(session_->messageLog().contains("System Info: AVX = 1 | test"));

    session_->getSystemInfo(false);
    QCOMPARE(session_->messageLog().count("System Info:"), qsizetype(1));
}

int runTestSessionController(int argc, char** argv) {
    TestSessionController test;
    return QTest::qExec(&test, argc, argv);
}

#include "TestSessionController.moc"
