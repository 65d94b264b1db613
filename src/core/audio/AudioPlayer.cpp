#include "AudioPlayer.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QUrl>
#include <QtMultimedia/QAudioOutput>
#include <QtMultimedia/QMediaPlayer>

namespace Scribe {

QtAudioPlayer::QtAudioPlayer()
    : output_(std::make_unique<QAudioOutput>())
    , player_(std::make_unique<QMediaPlayer>()) {
    player_->setAudioOutput(output_.get());
    QObject::connect(player_.get(), &QMediaPlayer::errorOccurred,
                     [](QMediaPlayer::Error error, const QString& message) {
        Logger::instance().warn("QtAudioPlayer: playback error {}: {}",
                                static_cast<int>(error), message.toStdString());
    });
}

QtAudioPlayer::~QtAudioPlayer() {
    player_->stop();
    player_->setAudioOutput(nullptr);
}

void QtAudioPlayer::play(const QString& filePath) {
    player_->stop();
    player_->setSource(QUrl::fromLocalFile(filePath));
    player_->play();
    Logger::instance().debug("QtAudioPlayer: playing {}", filePath.toStdString());
}

void QtAudioPlayer::stop() {
    if (player_->playbackState() != QMediaPlayer::StoppedState) {
        player_->stop();
    }
}

bool QtAudioPlayer::isPlaying() const {
    return player_->playbackState() == QMediaPlayer::PlayingState;
}

} // namespace Scribe
