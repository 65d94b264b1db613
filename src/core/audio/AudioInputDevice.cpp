#include "AudioInputDevice.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QCoreApplication>
#include <QtCore/QThread>
#include <QtMultimedia/QAudioDevice>
#include <QtMultimedia/QAudioFormat>
#include <QtMultimedia/QAudioSource>
#include <QtMultimedia/QMediaDevices>

#include <algorithm>

namespace Scribe {

namespace {

constexpr int kPollIntervalMs = 20;

} // namespace

QtAudioInputDevice::QtAudioInputDevice() = default;

QtAudioInputDevice::~QtAudioInputDevice() {
    close();
}

bool QtAudioInputDevice::hasInputDevice() {
    return !QMediaDevices::defaultAudioInput().isNull();
}

Expected<void, CaptureError> QtAudioInputDevice::open(int sampleRate, int channels) {
    const QAudioDevice device = QMediaDevices::defaultAudioInput();
    if (device.isNull()) {
        Logger::instance().error("QtAudioInputDevice: no default audio input");
        return makeUnexpected(CaptureError::DeviceUnavailable);
    }

    QAudioFormat format;
    format.setSampleRate(sampleRate);
    format.setChannelCount(channels);
    format.setSampleFormat(QAudioFormat::Int16);

    if (!device.isFormatSupported(format)) {
        Logger::instance().error("QtAudioInputDevice: {} does not support {} Hz / {} ch / Int16",
                                 device.description().toStdString(), sampleRate, channels);
        return makeUnexpected(CaptureError::DeviceOpenFailed);
    }

    source_ = std::make_unique<QAudioSource>(device, format);
    io_ = source_->start();
    if (!io_ || source_->error() != QAudio::NoError) {
        Logger::instance().error("QtAudioInputDevice: failed to start {} (error {})",
                                 device.description().toStdString(), static_cast<int>(source_->error()));
        source_.reset();
        io_ = nullptr;
        return makeUnexpected(CaptureError::DeviceOpenFailed);
    }

    Logger::instance().info("QtAudioInputDevice: capturing from {}", device.description().toStdString());
    return {};
}

qint64 QtAudioInputDevice::read(qint16* buffer, qint64 maxSamples) {
    if (!source_ || !io_) {
        return -1;
    }

    // QAudioSource delivers through the event loop of the thread that started it.
    if (io_->bytesAvailable() < static_cast<qint64>(sizeof(qint16))) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, kPollIntervalMs);
        if (io_->bytesAvailable() < static_cast<qint64>(sizeof(qint16))) {
            QThread::msleep(kPollIntervalMs / 2);
        }
    }

    if (source_->error() != QAudio::NoError && source_->error() != QAudio::UnderrunError) {
        Logger::instance().error("QtAudioInputDevice: device error {}", static_cast<int>(source_->error()));
        return -1;
    }

    const qint64 wanted = std::min<qint64>(io_->bytesAvailable() / sizeof(qint16), maxSamples);
    if (wanted <= 0) {
        return 0;
    }
    const qint64 bytes = io_->read(reinterpret_cast<char*>(buffer), wanted * sizeof(qint16));
    if (bytes < 0) {
        return -1;
    }
    return bytes / static_cast<qint64>(sizeof(qint16));
}

void QtAudioInputDevice::close() {
    if (source_) {
        source_->stop();
        source_.reset();
        io_ = nullptr;
    }
}

} // namespace Scribe
