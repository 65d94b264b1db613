#pragma once

#include "AudioInputDevice.hpp"
#include "AudioTypes.hpp"
#include "../common/Expected.hpp"

#include <QtCore/QMutex>
#include <QtCore/QString>
#include <atomic>
#include <functional>
#include <memory>
#include <vector>

class QThread;

namespace Scribe {

using CaptureErrorCallback = std::function<void(CaptureError error, const QString& details)>;

/**
 * @brief Records the microphone into a WAVE file on a dedicated thread.
 *
 * Idle -> Recording -> Idle. start() opens a fresh device from the factory on a
 * new thread and accumulates PCM16 samples until stop() is requested; the samples
 * are then written with WaveEncoder. If the loop fails, onError runs on the
 * capture thread and nothing is written.
 */
class AudioCapture {
public:
    struct Timeouts {
        int restartJoinMs = 1000;
        int stopJoinMs = 5000;
    };

    explicit AudioCapture(AudioInputDeviceFactory deviceFactory = defaultDeviceFactory(),
                          Timeouts timeouts = Timeouts{},
                          int sampleRate = kWhisperSampleRate);
    ~AudioCapture();

    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    Expected<void, CaptureError> start(const QString& outputFile, CaptureErrorCallback onError);
    // No-op when idle. Fails when the thread outlives the join timeout or the loop reported an error.
    Expected<void, CaptureError> stop();

    bool isCapturing() const;

    static AudioInputDeviceFactory defaultDeviceFactory();

private:
    struct Session {
        QString outputFile;
        CaptureErrorCallback onError;
        std::atomic<bool> quit{false};
        std::atomic<bool> failed{false};
    };

    static void captureLoop(const AudioInputDeviceFactory& deviceFactory,
                            int sampleRate,
                            const std::shared_ptr<Session>& session);
    static void fail(const std::shared_ptr<Session>& session, CaptureError error, const QString& details);
    Expected<void, CaptureError> joinCurrent(int timeoutMs);

    AudioInputDeviceFactory deviceFactory_;
    Timeouts timeouts_;
    int sampleRate_;

    mutable QMutex mutex_;
    std::unique_ptr<QThread> thread_;
    std::shared_ptr<Session> session_;
    // Threads that missed their join deadline; reaped in the destructor.
    std::vector<std::unique_ptr<QThread>> stragglers_;
};

} // namespace Scribe
