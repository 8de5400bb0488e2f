#pragma once

#include <QtCore/QString>
#include <QtCore/QUrl>

#include <optional>
#include <vector>

namespace WhisperGui {

struct ModelDescriptor {
    QString id;             // stable key, also names the file on disk
    QString displayName;
    qint64 sizeMb = 0;      // advertised size, informational only
    QString description;
    QUrl url;
};

/**
 * @brief Immutable, ordered list of downloadable models
 *
 * Built once at startup and handed to whichever component needs it.
 */
class ModelCatalog {
public:
    ModelCatalog() = default;
    explicit ModelCatalog(std::vector<ModelDescriptor> models);

    // The whisper.cpp ggml models published on Hugging Face
    static ModelCatalog defaults();

    const std::vector<ModelDescriptor>& models() const { return models_; }
    std::optional<ModelDescriptor> find(const QString& id) const;
    bool contains(const QString& id) const;

private:
    std::vector<ModelDescriptor> models_;
};

} // namespace WhisperGui
