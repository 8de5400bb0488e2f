#pragma once

#include <QtCore/QSettings>
#include <QtCore/QStandardPaths>
#include <QtCore/QString>
#include <QtCore/QVariant>
#include <memory>

namespace WhisperGui {

class Config {
public:
    static Config& instance();

    void initialize(const QString& organizationName = "WhisperGui",
                    const QString& applicationName = "com.whisper-gui.app");

    // Points the store at an explicit INI file (tests, portable installs)
    void initializeFromFile(const QString& iniPath);

    QVariant getValue(const QString& key, const QVariant& defaultValue = QVariant()) const;
    void setValue(const QString& key, const QVariant& value);

    QString getString(const QString& key, const QString& defaultValue = QString()) const;
    int getInt(const QString& key, int defaultValue = 0) const;

    struct DownloadSettings {
        QString modelsDirectory;
        QString userAgent = "WhisperGui/1.0";
        int inactivityTimeoutSeconds = 300;
        int chunkSize = 64 * 1024;
    };

    struct TranscriptionSettings {
        QString executablePath;            // empty = auto-detect
        int eventCapacity = 100;
        QString defaultOutputFormat = "txt";
        QString defaultLanguage = "auto";
    };

    DownloadSettings getDownloadSettings() const;
    TranscriptionSettings getTranscriptionSettings() const;

    void setDownloadSettings(const DownloadSettings& settings);
    void setTranscriptionSettings(const TranscriptionSettings& settings);

    QString getDataPath() const;
    QString getDefaultModelsPath() const;

    // Explicit setting, then the bundled sidecar locations, then PATH
    QString resolveWhisperExecutable() const;

    void sync();

private:
    Config() = default;
    std::unique_ptr<QSettings> settings_;
};

} // namespace WhisperGui
