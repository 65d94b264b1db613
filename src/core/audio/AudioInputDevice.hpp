#pragma once

#include "AudioTypes.hpp"
#include "../common/Expected.hpp"

#include <QtCore/QtGlobal>
#include <functional>
#include <memory>

class QAudioSource;
class QIODevice;

namespace Scribe {

// Microphone driver seam. Used from the capture thread only.
class AudioInputDevice {
public:
    virtual ~AudioInputDevice() = default;

    virtual Expected<void, CaptureError> open(int sampleRate, int channels) = 0;
    // Fills up to maxSamples PCM16 samples. Returns the count read, 0 when nothing
    // arrived within the poll interval, or a negative value on device failure.
    virtual qint64 read(qint16* buffer, qint64 maxSamples) = 0;
    virtual void close() = 0;
};

using AudioInputDeviceFactory = std::function<std::unique_ptr<AudioInputDevice>()>;

// Default system microphone through QAudioSource.
class QtAudioInputDevice : public AudioInputDevice {
public:
    QtAudioInputDevice();
    ~QtAudioInputDevice() override;

    Expected<void, CaptureError> open(int sampleRate, int channels) override;
    qint64 read(qint16* buffer, qint64 maxSamples) override;
    void close() override;

    static bool hasInputDevice();

private:
    std::unique_ptr<QAudioSource> source_;
    QIODevice* io_ = nullptr;
};

} // namespace Scribe
