#include "WaveEncoder.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QFile>
#include <QtCore/QtEndian>

namespace Scribe {

namespace {

void putU16(QByteArray& out, int offset, quint16 value) {
    qToLittleEndian<quint16>(value, reinterpret_cast<uchar*>(out.data() + offset));
}

void putU32(QByteArray& out, int offset, quint32 value) {
    qToLittleEndian<quint32>(value, reinterpret_cast<uchar*>(out.data() + offset));
}

} // namespace

QByteArray WaveEncoder::header(qint64 dataBytes, int sampleRate) {
    constexpr quint16 channels = 1;
    constexpr quint16 bitsPerSample = 16;
    constexpr quint16 blockAlign = channels * bitsPerSample / 8;

    QByteArray out(kHeaderSize, '\0');
    out.replace(0, 4, "RIFF");
    putU32(out, 4, static_cast<quint32>(dataBytes + kHeaderSize - 8));
    out.replace(8, 4, "WAVE");
    out.replace(12, 4, "fmt ");
    putU32(out, 16, 16);
    putU16(out, 20, 1);
    putU16(out, 22, channels);
    putU32(out, 24, static_cast<quint32>(sampleRate));
    putU32(out, 28, static_cast<quint32>(sampleRate * blockAlign));
    putU16(out, 32, blockAlign);
    putU16(out, 34, bitsPerSample);
    out.replace(36, 4, "data");
    putU32(out, 40, static_cast<quint32>(dataBytes));
    return out;
}

Expected<void, WaveError> WaveEncoder::encode(const QString& filePath,
                                              const std::vector<qint16>& samples,
                                              int sampleRate) {
    if (sampleRate <= 0) {
        return makeUnexpected(WaveError::InvalidSampleRate);
    }

    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        Logger::instance().error("WaveEncoder: cannot open {}: {}",
                                 filePath.toStdString(), file.errorString().toStdString());
        return makeUnexpected(WaveError::CannotOpenFile);
    }

    const qint64 dataBytes = static_cast<qint64>(samples.size() * sizeof(qint16));
    QByteArray payload = header(dataBytes, sampleRate);
    payload.reserve(kHeaderSize + dataBytes);
    for (qint16 sample : samples) {
        char bytes[2];
        qToLittleEndian<qint16>(sample, bytes);
        payload.append(bytes, 2);
    }

    if (file.write(payload) != payload.size()) {
        Logger::instance().error("WaveEncoder: short write to {}", filePath.toStdString());
        return makeUnexpected(WaveError::WriteFailed);
    }
    if (!file.flush()) {
        return makeUnexpected(WaveError::WriteFailed);
    }

    Logger::instance().debug("WaveEncoder: wrote {} samples to {}", samples.size(), filePath.toStdString());
    return {};
}

} // namespace Scribe
