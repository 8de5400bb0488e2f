#pragma once

#include <QtCore/QFuture>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QThreadPool>

#include <memory>
#include <optional>
#include <vector>

#include "../core/common/Error.hpp"
#include "../core/models/ModelCatalog.hpp"
#include "../core/models/ModelDownloader.hpp"
#include "../core/transcription/TranscriptionTypes.hpp"
#include "../core/transcription/WhisperProcess.hpp"

namespace WhisperGui {

class HttpClient;

struct ModelStatus {
    ModelDescriptor info;
    bool downloaded = false;
};

/**
 * @brief Front-end facing command surface
 *
 * Wraps the downloader and the transcription pipeline behind the operations
 * a UI or the CLI invokes, and re-publishes their progress as signals.
 * Signals may be emitted from worker threads; connect with
 * Qt::QueuedConnection when the receiver lives elsewhere.
 */
class AppController : public QObject {
    Q_OBJECT

public:
    AppController(ModelCatalog catalog,
                  const QString& modelsDirectory,
                  std::shared_ptr<HttpClient> httpClient,
                  WhisperProcess::Options processOptions,
                  QObject* parent = nullptr);
    ~AppController() override;

    // Wired from Config: default catalog, configured directory and executable
    static std::unique_ptr<AppController> fromConfig(QObject* parent = nullptr);

    ModelDownloader* downloader() const { return downloader_.get(); }
    const WhisperProcess& whisperProcess() const { return whisperProcess_; }

    std::vector<ModelStatus> listModels() const;

    Result<QString> downloadModel(const QString& modelId);
    QFuture<Result<QString>> downloadModelAsync(const QString& modelId);

    Result<QString> modelPath(const QString& modelId) const;
    Result<void> deleteModel(const QString& modelId);

    /**
     * @brief Validates inputs and starts a transcription
     *
     * Returns as soon as whisper-cli is running. Output then arrives through
     * transcriptionOutput() and ends with exactly one transcriptionComplete().
     */
    Result<void> transcribeAudio(const QString& audioPath,
                                 const QString& modelId,
                                 const QString& outputFormat,
                                 const std::optional<QString>& language);

    // Blocks until background downloads and transcription consumers are idle
    bool waitForIdle(int timeoutMs = -1);

signals:
    void downloadProgress(const WhisperGui::DownloadProgress& progress);
    void transcriptionOutput(const WhisperGui::TranscriptionOutput& output);
    void transcriptionComplete(const WhisperGui::TranscriptionComplete& result);

private:
    void consume(TranscriptionStream& stream);

    std::unique_ptr<ModelDownloader> downloader_;
    WhisperProcess whisperProcess_;
    QThreadPool workers_;
};

} // namespace WhisperGui

Q_DECLARE_METATYPE(WhisperGui::ModelStatus)
