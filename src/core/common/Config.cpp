#include "Config.hpp"
#include "Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QMutexLocker>
#include <QtCore/QStringList>

namespace Scribe {

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::initialize(const QString& organizationName, const QString& applicationName) {
    {
        QMutexLocker locker(&mutex_);
        settings_ = std::make_unique<QSettings>(organizationName, applicationName);
    }
    ensureDirectoriesExist();
    SCRIBE_INFO("Config initialized for {}/{}",
                organizationName.toStdString(), applicationName.toStdString());
}

void Config::initializeFromFile(const QString& iniPath) {
    {
        QMutexLocker locker(&mutex_);
        settings_ = std::make_unique<QSettings>(iniPath, QSettings::IniFormat);
        if (settings_->status() != QSettings::NoError) {
            SCRIBE_WARN("Config: {} could not be read, using defaults", iniPath.toStdString());
        }
    }
    ensureDirectoriesExist();
    SCRIBE_INFO("Config initialized from {}", iniPath.toStdString());
}

bool Config::isInitialized() const {
    QMutexLocker locker(&mutex_);
    return settings_ != nullptr;
}

QVariant Config::getValue(const QString& key, const QVariant& defaultValue) const {
    QMutexLocker locker(&mutex_);
    if (!settings_) return defaultValue;
    return settings_->value(key, defaultValue);
}

void Config::setValue(const QString& key, const QVariant& value) {
    QMutexLocker locker(&mutex_);
    if (settings_) {
        settings_->setValue(key, value);
    }
}

QString Config::getString(const QString& key, const QString& defaultValue) const {
    return getValue(key, defaultValue).toString();
}

int Config::getInt(const QString& key, int defaultValue) const {
    return getValue(key, defaultValue).toInt();
}

bool Config::getBool(const QString& key, bool defaultValue) const {
    return getValue(key, defaultValue).toBool();
}

Config::TranscriptionSettings Config::getTranscriptionSettings() const {
    TranscriptionSettings settings;
    settings.language = getString("transcription/language", settings.language);
    settings.threads = qMax(0, getInt("transcription/threads", settings.threads));
    settings.useGpu = getBool("transcription/useGpu", settings.useGpu);
    settings.withTimestamps = getBool("transcription/withTimestamps", settings.withTimestamps);
    return settings;
}

Config::RecordingSettings Config::getRecordingSettings() const {
    RecordingSettings settings;
    settings.sampleRate = getInt("recording/sampleRate", settings.sampleRate);
    settings.restartJoinTimeoutMs = getInt("recording/restartJoinTimeoutMs", settings.restartJoinTimeoutMs);
    settings.stopJoinTimeoutMs = getInt("recording/stopJoinTimeoutMs", settings.stopJoinTimeoutMs);
    settings.scratchDirectory = getString("recording/scratchDirectory", getCachePath() + "/recordings");
    return settings;
}

Config::ModelSettings Config::getModelSettings() const {
    ModelSettings settings;
    settings.assetRoot = getString("models/assetRoot", settings.assetRoot);
    return settings;
}

Config::PlaybackSettings Config::getPlaybackSettings() const {
    PlaybackSettings settings;
    settings.enabled = getBool("playback/enabled", settings.enabled);
    return settings;
}

void Config::setTranscriptionSettings(const TranscriptionSettings& settings) {
    setValue("transcription/language", settings.language);
    setValue("transcription/threads", settings.threads);
    setValue("transcription/useGpu", settings.useGpu);
    setValue("transcription/withTimestamps", settings.withTimestamps);
}

void Config::setRecordingSettings(const RecordingSettings& settings) {
    setValue("recording/sampleRate", settings.sampleRate);
    setValue("recording/restartJoinTimeoutMs", settings.restartJoinTimeoutMs);
    setValue("recording/stopJoinTimeoutMs", settings.stopJoinTimeoutMs);
    setValue("recording/scratchDirectory", settings.scratchDirectory);
}

void Config::setModelSettings(const ModelSettings& settings) {
    setValue("models/assetRoot", settings.assetRoot);
}

void Config::setPlaybackSettings(const PlaybackSettings& settings) {
    setValue("playback/enabled", settings.enabled);
}

QString Config::getCachePath() const {
    return QStandardPaths::writableLocation(QStandardPaths::CacheLocation);
}

QString Config::getTempPath() const {
    return QStandardPaths::writableLocation(QStandardPaths::TempLocation) + "/Scribe";
}

void Config::sync() {
    QMutexLocker locker(&mutex_);
    if (settings_) {
        settings_->sync();
    }
}

void Config::ensureDirectoriesExist() {
    const QStringList paths = {
        getCachePath(),
        getTempPath(),
        getRecordingSettings().scratchDirectory
    };

    for (const QString& path : paths) {
        if (path.isEmpty()) {
            continue;
        }
        QDir dir;
        if (!dir.mkpath(path)) {
            SCRIBE_WARN("Failed to create directory: {}", path.toStdString());
        }
    }
}

} // namespace Scribe
