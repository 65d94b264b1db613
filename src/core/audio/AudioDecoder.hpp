#pragma once

#include "AudioTypes.hpp"
#include "../common/Expected.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <vector>

namespace Scribe {

// Turns an audio file into mono 16 kHz float samples in [-1, 1).
class AudioDecoder {
public:
    virtual ~AudioDecoder() = default;
    virtual Expected<std::vector<float>, DecodeError> decode(const QString& filePath) = 0;
};

/**
 * @brief Decoder for PCM16 WAVE files, with ffmpeg conversion for everything else.
 *
 * WAVE input is parsed directly: chunks are scanned for "fmt " and "data",
 * channels are averaged to mono and the result is linearly resampled to 16 kHz.
 * Other containers are converted by the ffmpeg command-line tool first.
 */
class DefaultAudioDecoder : public AudioDecoder {
public:
    explicit DefaultAudioDecoder(QString ffmpegProgram = QStringLiteral("ffmpeg"),
                                 int conversionTimeoutMs = 60000);

    Expected<std::vector<float>, DecodeError> decode(const QString& filePath) override;

    static Expected<std::vector<float>, DecodeError> decodeWave(const QByteArray& bytes);
    static std::vector<float> resample(const std::vector<float>& input, int fromRate, int toRate);

private:
    Expected<void, DecodeError> convertToWave(const QString& inputPath, const QString& outputPath) const;

    QString ffmpegProgram_;
    int conversionTimeoutMs_;
};

} // namespace Scribe
