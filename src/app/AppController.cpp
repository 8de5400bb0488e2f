#include "AppController.hpp"
#include "../core/common/Config.hpp"
#include "../core/common/Logger.hpp"
#include "../core/models/HttpClient.hpp"

#include <QtConcurrent/QtConcurrent>
#include <QtCore/QFileInfo>
#include <QtCore/QThread>

#include <algorithm>

namespace WhisperGui {

AppController::AppController(ModelCatalog catalog,
                             const QString& modelsDirectory,
                             std::shared_ptr<HttpClient> httpClient,
                             WhisperProcess::Options processOptions,
                             QObject* parent)
    : QObject(parent)
    , downloader_(std::make_unique<ModelDownloader>(std::move(catalog), modelsDirectory, std::move(httpClient)))
    , whisperProcess_(std::move(processOptions)) {
    qRegisterMetaType<TranscriptionOutput>("WhisperGui::TranscriptionOutput");
    qRegisterMetaType<TranscriptionComplete>("WhisperGui::TranscriptionComplete");
    qRegisterMetaType<ModelStatus>("WhisperGui::ModelStatus");

    // Transcription consumers block for the whole run
    workers_.setMaxThreadCount(std::max(4, QThread::idealThreadCount()));

    connect(downloader_.get(), &ModelDownloader::progressChanged,
            this, &AppController::downloadProgress, Qt::DirectConnection);
}

AppController::~AppController() {
    workers_.waitForDone();
}

std::unique_ptr<AppController> AppController::fromConfig(QObject* parent) {
    Config& config = Config::instance();
    const Config::DownloadSettings downloads = config.getDownloadSettings();
    const Config::TranscriptionSettings transcription = config.getTranscriptionSettings();

    NetworkHttpClient::Options httpOptions;
    httpOptions.userAgent = downloads.userAgent;
    httpOptions.inactivityTimeoutMs = downloads.inactivityTimeoutSeconds * 1000;
    httpOptions.maxChunkSize = downloads.chunkSize;

    WhisperProcess::Options processOptions;
    processOptions.executable = config.resolveWhisperExecutable();
    processOptions.eventCapacity = transcription.eventCapacity;

    WHISPERGUI_DEBUG("AppController: models in {}, whisper at {}",
                     downloads.modelsDirectory.toStdString(),
                     processOptions.executable.toStdString());

    return std::make_unique<AppController>(ModelCatalog::defaults(),
                                           downloads.modelsDirectory,
                                           std::make_shared<NetworkHttpClient>(httpOptions),
                                           processOptions,
                                           parent);
}

std::vector<ModelStatus> AppController::listModels() const {
    std::vector<ModelStatus> statuses;
    for (const ModelDescriptor& model : downloader_->listAvailableModels()) {
        statuses.push_back(ModelStatus{model, downloader_->isDownloaded(model.id)});
    }
    return statuses;
}

Result<QString> AppController::downloadModel(const QString& modelId) {
    return downloader_->download(modelId);
}

QFuture<Result<QString>> AppController::downloadModelAsync(const QString& modelId) {
    return QtConcurrent::run(&workers_, [this, modelId]() {
        return downloader_->download(modelId);
    });
}

Result<QString> AppController::modelPath(const QString& modelId) const {
    return downloader_->locate(modelId);
}

Result<void> AppController::deleteModel(const QString& modelId) {
    return downloader_->remove(modelId);
}

Result<void> AppController::transcribeAudio(const QString& audioPath,
                                            const QString& modelId,
                                            const QString& outputFormat,
                                            const std::optional<QString>& language) {
    if (!QFileInfo(audioPath).isFile()) {
        WHISPERGUI_WARN("AppController: audio file {} not found", audioPath.toStdString());
        return makeError(ErrorCode::InvalidInput, QString("Audio file not found: %1").arg(audioPath));
    }

    Result<QString> model = downloader_->locate(modelId);
    if (!model) {
        WHISPERGUI_WARN("AppController: {}", model.error().message.toStdString());
        return makeUnexpected(model.error());
    }

    Result<TranscriptionStream> started =
        whisperProcess_.run(audioPath, model.value(), outputFormat, language);
    if (!started) {
        return makeUnexpected(started.error());
    }

    auto stream = std::make_shared<TranscriptionStream>(std::move(started).value());
    workers_.start([this, stream]() {
        consume(*stream);
    });

    WHISPERGUI_INFO("AppController: transcribing {} with {}", audioPath.toStdString(), modelId.toStdString());
    return Result<void>();
}

void AppController::consume(TranscriptionStream& stream) {
    while (std::optional<TranscriptionEvent> event = stream.next()) {
        switch (event->kind) {
        case TranscriptionEvent::Kind::OutputLine:
            emit transcriptionOutput(TranscriptionOutput{event->text, event->isError});
            break;
        case TranscriptionEvent::Kind::Completed:
            emit transcriptionComplete(TranscriptionComplete{true, event->text, std::nullopt});
            return;
        case TranscriptionEvent::Kind::Failed:
            emit transcriptionComplete(TranscriptionComplete{false, QString(), event->text});
            return;
        }
    }

    // The job always sends a terminal event; this covers a torn-down thread
    emit transcriptionComplete(TranscriptionComplete{false, QString(), QString("Transcription ended without a result")});
}

bool AppController::waitForIdle(int timeoutMs) {
    return workers_.waitForDone(timeoutMs);
}

} // namespace WhisperGui
