#include "Config.hpp"
#include "Logger.hpp"

#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QStringList>

#include <algorithm>

namespace WhisperGui {

namespace {
const QString kWhisperExecutableName = QStringLiteral("whisper-cli");
// Keeps the millisecond value within an int
constexpr int kMaxInactivityTimeoutSeconds = 24 * 60 * 60;
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::initialize(const QString& organizationName, const QString& applicationName) {
    settings_ = std::make_unique<QSettings>(organizationName, applicationName);
    WHISPERGUI_INFO("Config initialized for {}/{}",
                    organizationName.toStdString(), applicationName.toStdString());
}

void Config::initializeFromFile(const QString& iniPath) {
    settings_ = std::make_unique<QSettings>(iniPath, QSettings::IniFormat);
    WHISPERGUI_INFO("Config initialized from {}", iniPath.toStdString());
}

QVariant Config::getValue(const QString& key, const QVariant& defaultValue) const {
    if (!settings_) return defaultValue;
    return settings_->value(key, defaultValue);
}

void Config::setValue(const QString& key, const QVariant& value) {
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

Config::DownloadSettings Config::getDownloadSettings() const {
    DownloadSettings settings;
    settings.modelsDirectory = getString("models/directory", getDefaultModelsPath());
    settings.userAgent = getString("download/userAgent", settings.userAgent);
    settings.inactivityTimeoutSeconds = std::clamp(getInt("download/inactivityTimeoutSeconds",
                                                          settings.inactivityTimeoutSeconds),
                                                   1, kMaxInactivityTimeoutSeconds);
    settings.chunkSize = std::max(1, getInt("download/chunkSize", settings.chunkSize));
    return settings;
}

Config::TranscriptionSettings Config::getTranscriptionSettings() const {
    TranscriptionSettings settings;
    settings.executablePath = getString("transcription/executable");
    settings.eventCapacity = std::max(1, getInt("transcription/eventCapacity", settings.eventCapacity));
    settings.defaultOutputFormat = getString("transcription/defaultOutputFormat",
                                             settings.defaultOutputFormat);
    settings.defaultLanguage = getString("transcription/defaultLanguage", settings.defaultLanguage);
    return settings;
}

void Config::setDownloadSettings(const DownloadSettings& settings) {
    setValue("models/directory", settings.modelsDirectory);
    setValue("download/userAgent", settings.userAgent);
    setValue("download/inactivityTimeoutSeconds", settings.inactivityTimeoutSeconds);
    setValue("download/chunkSize", settings.chunkSize);
}

void Config::setTranscriptionSettings(const TranscriptionSettings& settings) {
    setValue("transcription/executable", settings.executablePath);
    setValue("transcription/eventCapacity", settings.eventCapacity);
    setValue("transcription/defaultOutputFormat", settings.defaultOutputFormat);
    setValue("transcription/defaultLanguage", settings.defaultLanguage);
}

QString Config::getDataPath() const {
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

QString Config::getDefaultModelsPath() const {
    const QString dataPath = getDataPath();
    if (dataPath.isEmpty()) {
        return QDir::current().filePath("models");
    }
    return QDir(dataPath).filePath("models");
}

QString Config::resolveWhisperExecutable() const {
    const QString configured = getString("transcription/executable");
    if (!configured.isEmpty()) {
        return configured;
    }

    const QString appDir = QCoreApplication::applicationDirPath();
    const QStringList candidates = {
        QDir(appDir).filePath(kWhisperExecutableName),
        QDir(appDir).filePath("binaries/" + kWhisperExecutableName)
    };

    for (const QString& candidate : candidates) {
        QFileInfo info(candidate);
        if (info.isFile() && info.isExecutable()) {
            return candidate;
        }
    }

    const QString onPath = QStandardPaths::findExecutable(kWhisperExecutableName);
    if (!onPath.isEmpty()) {
        return onPath;
    }

    // Let the spawn attempt report the missing binary
    WHISPERGUI_WARN("{} not found next to the application or on PATH",
                    kWhisperExecutableName.toStdString());
    return kWhisperExecutableName;
}

void Config::sync() {
    if (settings_) {
        settings_->sync();
    }
}

} // namespace WhisperGui
