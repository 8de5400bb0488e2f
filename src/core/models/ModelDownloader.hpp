#pragma once

#include <QtCore/QFuture>
#include <QtCore/QMetaType>
#include <QtCore/QObject>
#include <QtCore/QString>

#include <memory>
#include <vector>

#include "../common/Error.hpp"
#include "ModelCatalog.hpp"

namespace WhisperGui {

class HttpClient;

struct DownloadProgress {
    QString modelId;
    qint64 bytesDownloaded = 0;
    qint64 bytesTotal = 0;      // 0 when the server did not declare a length
    double percent = 0.0;       // stays 0 while the total is unknown

    static DownloadProgress sample(const QString& modelId, qint64 downloaded, qint64 total);
};

/**
 * @brief Fetches catalog models into the models directory
 *
 * The body is streamed into "<target>.tmp" and renamed onto the target only
 * once it is complete, so the target path is either absent or a whole file.
 * A failed attempt leaves its temp file behind; the next attempt truncates it.
 *
 * Progress is published through progressChanged() from the thread running
 * the transfer. Observers that must not slow the transfer connect with
 * Qt::QueuedConnection; samples are then delivered in order, none dropped.
 */
class ModelDownloader : public QObject {
    Q_OBJECT

public:
    ModelDownloader(ModelCatalog catalog,
                    const QString& modelsDirectory,
                    std::shared_ptr<HttpClient> httpClient,
                    QObject* parent = nullptr);
    ~ModelDownloader() override;

    const std::vector<ModelDescriptor>& listAvailableModels() const;
    const ModelCatalog& catalog() const;
    QString modelsDirectory() const;

    // Deterministic "<modelsDir>/ggml-<id>.bin"; the id need not be in the catalog
    QString resolvePath(const QString& modelId) const;
    static QString tempPathFor(const QString& targetPath);

    bool isDownloaded(const QString& modelId) const;

    // Existing artifact path, or NotDownloaded
    Result<QString> locate(const QString& modelId) const;

    /**
     * @brief Downloads a catalog model. Blocking; returns the target path.
     */
    Result<QString> download(const QString& modelId);

    // download() on the downloader's own pool; destruction waits for it
    QFuture<Result<QString>> downloadAsync(const QString& modelId);

    // Deletes the artifact if present; absence is not an error
    Result<void> remove(const QString& modelId);

signals:
    void downloadStarted(const QString& modelId);
    void progressChanged(const WhisperGui::DownloadProgress& progress);
    void downloadFinished(const QString& modelId, const QString& path);
    void downloadFailed(const QString& modelId, const WhisperGui::Error& error);

private:
    struct ModelDownloaderPrivate;
    std::unique_ptr<ModelDownloaderPrivate> d;

    Result<void> transfer(const ModelDescriptor& model, const QString& targetPath);
    Result<void> commit(const QString& tempPath, const QString& targetPath);
};

} // namespace WhisperGui

Q_DECLARE_METATYPE(WhisperGui::DownloadProgress)
