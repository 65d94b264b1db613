#pragma once

#include "AudioTypes.hpp"
#include "../common/Expected.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <vector>

namespace Scribe {

// Mono PCM16 RIFF/WAVE writer.
class WaveEncoder {
public:
    static constexpr int kHeaderSize = 44;

    static Expected<void, WaveError> encode(const QString& filePath,
                                            const std::vector<qint16>& samples,
                                            int sampleRate = kWhisperSampleRate);

    static QByteArray header(qint64 dataBytes, int sampleRate = kWhisperSampleRate);
};

} // namespace Scribe
