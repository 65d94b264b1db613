#include "AudioCapture.hpp"
#include "WaveEncoder.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QDeadlineTimer>
#include <QtCore/QMutexLocker>
#include <QtCore/QThread>

#include <exception>

namespace Scribe {

namespace {

constexpr qint64 kReadChunkSamples = 1600;  // 100 ms at 16 kHz

} // namespace

AudioInputDeviceFactory AudioCapture::defaultDeviceFactory() {
    return [] { return std::make_unique<QtAudioInputDevice>(); };
}

AudioCapture::AudioCapture(AudioInputDeviceFactory deviceFactory, Timeouts timeouts, int sampleRate)
    : deviceFactory_(std::move(deviceFactory))
    , timeouts_(timeouts)
    , sampleRate_(sampleRate) {
}

AudioCapture::~AudioCapture() {
    auto stopped = stop();
    if (stopped.hasError()) {
        Logger::instance().warn("AudioCapture: capture ended with '{}' during shutdown",
                                toString(stopped.error()).toStdString());
    }

    QMutexLocker locker(&mutex_);
    for (auto& thread : stragglers_) {
        if (!thread->wait(QDeadlineTimer(timeouts_.stopJoinMs))) {
            // Destroying a running QThread aborts the process; the device read is stuck, leave it.
            Logger::instance().critical("AudioCapture: abandoning capture thread that never finished");
            thread.release();
        }
    }
    stragglers_.clear();
}

Expected<void, CaptureError> AudioCapture::start(const QString& outputFile, CaptureErrorCallback onError) {
    QMutexLocker locker(&mutex_);

    if (thread_) {
        Logger::instance().warn("AudioCapture: start while capturing, stopping previous capture");
        auto previous = joinCurrent(timeouts_.restartJoinMs);
        if (previous.hasError()) {
            Logger::instance().warn("AudioCapture: previous capture ended with '{}'",
                                    toString(previous.error()).toStdString());
        }
    }

    auto session = std::make_shared<Session>();
    session->outputFile = outputFile;
    session->onError = std::move(onError);

    std::unique_ptr<QThread> thread(QThread::create(
        [factory = deviceFactory_, rate = sampleRate_, session]() { captureLoop(factory, rate, session); }));
    if (!thread) {
        return makeUnexpected(CaptureError::ThreadStartFailed);
    }
    thread->setObjectName(QStringLiteral("AudioCapture"));
    thread->start();

    thread_ = std::move(thread);
    session_ = std::move(session);
    Logger::instance().info("AudioCapture: recording to {}", outputFile.toStdString());
    return {};
}

Expected<void, CaptureError> AudioCapture::stop() {
    QMutexLocker locker(&mutex_);
    if (!thread_) {
        return {};
    }
    return joinCurrent(timeouts_.stopJoinMs);
}

bool AudioCapture::isCapturing() const {
    QMutexLocker locker(&mutex_);
    return thread_ != nullptr;
}

Expected<void, CaptureError> AudioCapture::joinCurrent(int timeoutMs) {
    session_->quit.store(true);
    const bool finished = thread_->wait(QDeadlineTimer(timeoutMs));
    std::shared_ptr<Session> session = std::move(session_);

    if (!finished) {
        Logger::instance().error("AudioCapture: capture thread did not finish within {} ms", timeoutMs);
        stragglers_.push_back(std::move(thread_));
        return makeUnexpected(CaptureError::StopTimeout);
    }

    thread_.reset();
    if (session->failed.load()) {
        return makeUnexpected(CaptureError::CaptureFailed);
    }
    Logger::instance().info("AudioCapture: stopped");
    return {};
}

void AudioCapture::captureLoop(const AudioInputDeviceFactory& deviceFactory,
                               int sampleRate,
                               const std::shared_ptr<Session>& session) {
    std::unique_ptr<AudioInputDevice> device = deviceFactory ? deviceFactory() : nullptr;
    if (!device) {
        fail(session, CaptureError::DeviceUnavailable, toString(CaptureError::DeviceUnavailable));
        return;
    }

    auto opened = device->open(sampleRate, 1);
    if (opened.hasError()) {
        fail(session, opened.error(), toString(opened.error()));
        return;
    }

    std::vector<qint16> samples;
    try {
        std::vector<qint16> chunk(kReadChunkSamples);
        while (!session->quit.load()) {
            const qint64 read = device->read(chunk.data(), kReadChunkSamples);
            if (read < 0) {
                device->close();
                fail(session, CaptureError::ReadFailed,
                     QStringLiteral("device read returned %1").arg(read));
                return;
            }
            samples.insert(samples.end(), chunk.begin(), chunk.begin() + read);
        }
    } catch (const std::exception& e) {
        device->close();
        fail(session, CaptureError::CaptureFailed, QString::fromUtf8(e.what()));
        return;
    }
    device->close();

    Logger::instance().debug("AudioCapture: captured {} samples", samples.size());
    auto encoded = WaveEncoder::encode(session->outputFile, samples, sampleRate);
    if (encoded.hasError()) {
        fail(session, CaptureError::EncodeFailed, toString(encoded.error()));
    }
}

void AudioCapture::fail(const std::shared_ptr<Session>& session, CaptureError error, const QString& details) {
    session->failed.store(true);
    Logger::instance().error("AudioCapture: {}: {}", toString(error).toStdString(), details.toStdString());
    if (session->onError) {
        session->onError(error, details);
    }
}

} // namespace Scribe
