#pragma once

#include <QtCore/QString>
#include <memory>

class QAudioOutput;
class QMediaPlayer;

namespace Scribe {

// Playback of transcribed audio. Called on the owning object's thread only.
class AudioPlayer {
public:
    virtual ~AudioPlayer() = default;
    virtual void play(const QString& filePath) = 0;
    virtual void stop() = 0;
    virtual bool isPlaying() const = 0;
};

class QtAudioPlayer : public AudioPlayer {
public:
    QtAudioPlayer();
    ~QtAudioPlayer() override;

    void play(const QString& filePath) override;
    void stop() override;
    bool isPlaying() const override;

private:
    std::unique_ptr<QAudioOutput> output_;
    std::unique_ptr<QMediaPlayer> player_;
};

} // namespace Scribe
