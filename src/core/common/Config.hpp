#pragma once

#include <QtCore/QMutex>
#include <QtCore/QSettings>
#include <QtCore/QStandardPaths>
#include <QtCore/QString>
#include <QtCore/QVariant>
#include <memory>

namespace Scribe {

class Config {
public:
    static Config& instance();

    // Native settings store for the given organization/application.
    void initialize(const QString& organizationName = "Scribe",
                    const QString& applicationName = "ScribeDictation");
    // INI file store, used by the command-line host and tests.
    void initializeFromFile(const QString& iniPath);
    bool isInitialized() const;

    QVariant getValue(const QString& key, const QVariant& defaultValue = QVariant()) const;
    void setValue(const QString& key, const QVariant& value);

    QString getString(const QString& key, const QString& defaultValue = QString()) const;
    int getInt(const QString& key, int defaultValue = 0) const;
    bool getBool(const QString& key, bool defaultValue = false) const;

    struct TranscriptionSettings {
        QString language = "en";
        int threads = 0;  // 0 = pick from CPU topology
        bool useGpu = true;
        bool withTimestamps = false;
    };

    struct RecordingSettings {
        int sampleRate = 16000;
        int restartJoinTimeoutMs = 1000;
        int stopJoinTimeoutMs = 5000;
        QString scratchDirectory;
    };

    struct ModelSettings {
        QString assetRoot = ":/models";
    };

    struct PlaybackSettings {
        bool enabled = true;
    };

    TranscriptionSettings getTranscriptionSettings() const;
    RecordingSettings getRecordingSettings() const;
    ModelSettings getModelSettings() const;
    PlaybackSettings getPlaybackSettings() const;

    void setTranscriptionSettings(const TranscriptionSettings& settings);
    void setRecordingSettings(const RecordingSettings& settings);
    void setModelSettings(const ModelSettings& settings);
    void setPlaybackSettings(const PlaybackSettings& settings);

    QString getCachePath() const;
    QString getTempPath() const;

    void sync();

private:
    Config() = default;
    void ensureDirectoriesExist();

    mutable QMutex mutex_;
    std::unique_ptr<QSettings> settings_;
};

} // namespace Scribe
