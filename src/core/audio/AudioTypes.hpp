#pragma once

#include <QtCore/QString>

namespace Scribe {

constexpr int kWhisperSampleRate = 16000;

enum class WaveError {
    CannotOpenFile,
    WriteFailed,
    InvalidSampleRate
};

enum class DecodeError {
    FileNotFound,
    FileUnreadable,
    InvalidFormat,
    UnsupportedFormat,
    ConversionFailed,
    NoAudioData
};

enum class CaptureError {
    DeviceUnavailable,
    DeviceOpenFailed,
    ReadFailed,
    EncodeFailed,
    ThreadStartFailed,
    StopTimeout,
    CaptureFailed
};

inline QString toString(WaveError error) {
    switch (error) {
        case WaveError::CannotOpenFile: return QStringLiteral("cannot open output file");
        case WaveError::WriteFailed: return QStringLiteral("failed to write audio data");
        case WaveError::InvalidSampleRate: return QStringLiteral("invalid sample rate");
    }
    return QStringLiteral("unknown wave error");
}

inline QString toString(DecodeError error) {
    switch (error) {
        case DecodeError::FileNotFound: return QStringLiteral("audio file not found");
        case DecodeError::FileUnreadable: return QStringLiteral("audio file cannot be read");
        case DecodeError::InvalidFormat: return QStringLiteral("not a valid WAVE file");
        case DecodeError::UnsupportedFormat: return QStringLiteral("unsupported audio encoding");
        case DecodeError::ConversionFailed: return QStringLiteral("audio conversion failed");
        case DecodeError::NoAudioData: return QStringLiteral("audio file contains no samples");
    }
    return QStringLiteral("unknown decode error");
}

inline QString toString(CaptureError error) {
    switch (error) {
        case CaptureError::DeviceUnavailable: return QStringLiteral("no audio input device available");
        case CaptureError::DeviceOpenFailed: return QStringLiteral("audio input device could not be opened");
        case CaptureError::ReadFailed: return QStringLiteral("reading from the audio input failed");
        case CaptureError::EncodeFailed: return QStringLiteral("recorded audio could not be written");
        case CaptureError::ThreadStartFailed: return QStringLiteral("capture thread could not be started");
        case CaptureError::StopTimeout: return QStringLiteral("capture thread did not stop in time");
        case CaptureError::CaptureFailed: return QStringLiteral("capture ended with an error");
    }
    return QStringLiteral("unknown capture error");
}

} // namespace Scribe
