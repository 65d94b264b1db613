#include "AudioDecoder.hpp"
#include "../common/Config.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QProcess>
#include <QtCore/QTemporaryFile>
#include <QtCore/QtEndian>

namespace Scribe {

namespace {

constexpr quint16 kFormatPcm = 1;
constexpr quint16 kFormatExtensible = 0xFFFE;

quint16 readU16(const QByteArray& bytes, qsizetype offset) {
    return qFromLittleEndian<quint16>(reinterpret_cast<const uchar*>(bytes.constData() + offset));
}

quint32 readU32(const QByteArray& bytes, qsizetype offset) {
    return qFromLittleEndian<quint32>(reinterpret_cast<const uchar*>(bytes.constData() + offset));
}

bool looksLikeWave(const QByteArray& bytes) {
    return bytes.size() >= 12 && bytes.startsWith("RIFF") && bytes.mid(8, 4) == "WAVE";
}

} // namespace

DefaultAudioDecoder::DefaultAudioDecoder(QString ffmpegProgram, int conversionTimeoutMs)
    : ffmpegProgram_(std::move(ffmpegProgram))
    , conversionTimeoutMs_(conversionTimeoutMs) {
}

Expected<std::vector<float>, DecodeError> DefaultAudioDecoder::decode(const QString& filePath) {
    const QFileInfo info(filePath);
    if (!info.exists() || !info.isFile()) {
        Logger::instance().error("AudioDecoder: file not found: {}", filePath.toStdString());
        return makeUnexpected(DecodeError::FileNotFound);
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        Logger::instance().error("AudioDecoder: cannot open {}: {}",
                                 filePath.toStdString(), file.errorString().toStdString());
        return makeUnexpected(DecodeError::FileUnreadable);
    }
    const QByteArray bytes = file.readAll();
    file.close();

    if (looksLikeWave(bytes)) {
        return decodeWave(bytes);
    }
    if (info.suffix().compare(QLatin1String("wav"), Qt::CaseInsensitive) == 0) {
        Logger::instance().error("AudioDecoder: {} has a .wav name but no RIFF/WAVE header",
                                 filePath.toStdString());
        return makeUnexpected(DecodeError::InvalidFormat);
    }

    QDir().mkpath(Config::instance().getTempPath());
    QTemporaryFile converted(Config::instance().getTempPath() + "/decode-XXXXXX.wav");
    if (!converted.open()) {
        Logger::instance().error("AudioDecoder: cannot create temporary file for conversion");
        return makeUnexpected(DecodeError::ConversionFailed);
    }
    const QString convertedPath = converted.fileName();
    converted.close();

    auto conversion = convertToWave(filePath, convertedPath);
    if (conversion.hasError()) {
        return makeUnexpected(conversion.error());
    }

    QFile wave(convertedPath);
    if (!wave.open(QIODevice::ReadOnly)) {
        return makeUnexpected(DecodeError::ConversionFailed);
    }
    return decodeWave(wave.readAll());
}

Expected<std::vector<float>, DecodeError> DefaultAudioDecoder::decodeWave(const QByteArray& bytes) {
    if (!looksLikeWave(bytes)) {
        return makeUnexpected(DecodeError::InvalidFormat);
    }

    quint16 format = 0;
    quint16 channels = 0;
    quint32 sampleRate = 0;
    quint16 bitsPerSample = 0;
    bool haveFormat = false;
    QByteArray data;
    bool haveData = false;

    qsizetype offset = 12;
    while (offset + 8 <= bytes.size()) {
        const QByteArray chunkId = bytes.mid(offset, 4);
        const quint32 chunkSize = readU32(bytes, offset + 4);
        const qsizetype body = offset + 8;

        if (chunkId == "fmt ") {
            if (chunkSize < 16 || body + 16 > bytes.size()) {
                return makeUnexpected(DecodeError::InvalidFormat);
            }
            format = readU16(bytes, body);
            channels = readU16(bytes, body + 2);
            sampleRate = readU32(bytes, body + 4);
            bitsPerSample = readU16(bytes, body + 14);
            haveFormat = true;
        } else if (chunkId == "data") {
            // Writers that never patched the size leave it short or zero; take what is there.
            const qsizetype available = bytes.size() - body;
            const qsizetype length = (chunkSize == 0 || chunkSize > available) ? available : chunkSize;
            data = bytes.mid(body, length);
            haveData = true;
            break;
        }

        // Chunks are padded to an even size.
        offset = body + chunkSize + (chunkSize & 1);
    }

    if (!haveFormat || !haveData) {
        Logger::instance().error("AudioDecoder: WAVE file without fmt or data chunk");
        return makeUnexpected(DecodeError::InvalidFormat);
    }
    if ((format != kFormatPcm && format != kFormatExtensible) || bitsPerSample != 16) {
        Logger::instance().error("AudioDecoder: unsupported WAVE encoding (format {}, {} bits)",
                                 format, bitsPerSample);
        return makeUnexpected(DecodeError::UnsupportedFormat);
    }
    if (channels == 0 || sampleRate == 0) {
        return makeUnexpected(DecodeError::InvalidFormat);
    }

    const qsizetype frameBytes = static_cast<qsizetype>(channels) * 2;
    const qsizetype frames = data.size() / frameBytes;
    if (frames == 0) {
        return makeUnexpected(DecodeError::NoAudioData);
    }

    std::vector<float> mono;
    mono.reserve(static_cast<size_t>(frames));
    const uchar* raw = reinterpret_cast<const uchar*>(data.constData());
    for (qsizetype frame = 0; frame < frames; ++frame) {
        float sum = 0.0f;
        for (quint16 channel = 0; channel < channels; ++channel) {
            const qint16 sample = qFromLittleEndian<qint16>(raw + frame * frameBytes + channel * 2);
            sum += static_cast<float>(sample) / 32768.0f;
        }
        mono.push_back(sum / channels);
    }

    if (sampleRate != static_cast<quint32>(kWhisperSampleRate)) {
        Logger::instance().debug("AudioDecoder: resampling {} Hz to {} Hz", sampleRate, kWhisperSampleRate);
        mono = resample(mono, static_cast<int>(sampleRate), kWhisperSampleRate);
    }

    if (mono.empty()) {
        return makeUnexpected(DecodeError::NoAudioData);
    }
    return mono;
}

std::vector<float> DefaultAudioDecoder::resample(const std::vector<float>& input, int fromRate, int toRate) {
    if (input.empty() || fromRate <= 0 || toRate <= 0 || fromRate == toRate) {
        return input;
    }

    const double ratio = static_cast<double>(toRate) / fromRate;
    const size_t outputSize = static_cast<size_t>(input.size() * ratio);
    std::vector<float> output;
    output.reserve(outputSize);

    for (size_t i = 0; i < outputSize; ++i) {
        const double source = i / ratio;
        const size_t index = static_cast<size_t>(source);
        if (index + 1 < input.size()) {
            const double frac = source - index;
            output.push_back(static_cast<float>(input[index] * (1.0 - frac) + input[index + 1] * frac));
        } else if (index < input.size()) {
            output.push_back(input[index]);
        }
    }
    return output;
}

Expected<void, DecodeError> DefaultAudioDecoder::convertToWave(const QString& inputPath,
                                                               const QString& outputPath) const {
    QStringList arguments;
    arguments << "-nostdin" << "-hide_banner"
              << "-i" << inputPath
              << "-ar" << QString::number(kWhisperSampleRate)
              << "-ac" << "1"
              << "-c:a" << "pcm_s16le"
              << "-y" << outputPath;

    QProcess ffmpeg;
    ffmpeg.start(ffmpegProgram_, arguments);

    if (!ffmpeg.waitForStarted()) {
        Logger::instance().error("AudioDecoder: failed to start {} for conversion", ffmpegProgram_.toStdString());
        return makeUnexpected(DecodeError::ConversionFailed);
    }

    if (!ffmpeg.waitForFinished(conversionTimeoutMs_)) {
        ffmpeg.kill();
        ffmpeg.waitForFinished();
        Logger::instance().error("AudioDecoder: conversion of {} timed out", inputPath.toStdString());
        return makeUnexpected(DecodeError::ConversionFailed);
    }

    if (ffmpeg.exitStatus() != QProcess::NormalExit || ffmpeg.exitCode() != 0) {
        const QString error = QString::fromUtf8(ffmpeg.readAllStandardError()).trimmed();
        Logger::instance().error("AudioDecoder: conversion failed: {}", error.toStdString());
        return makeUnexpected(DecodeError::ConversionFailed);
    }

    Logger::instance().debug("AudioDecoder: converted {} to {}", inputPath.toStdString(), outputPath.toStdString());
    return {};
}

} // namespace Scribe
