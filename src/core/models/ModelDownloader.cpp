#include "ModelDownloader.hpp"
#include "HttpClient.hpp"
#include "../common/Logger.hpp"

#include <QtConcurrent/QtConcurrent>
#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QThreadPool>

#include <filesystem>
#include <system_error>

namespace WhisperGui {

namespace {
const QString kModelFilePrefix = QStringLiteral("ggml-");
const QString kModelFileExtension = QStringLiteral(".bin");
const QString kTempSuffix = QStringLiteral(".tmp");

std::filesystem::path toFsPath(const QString& path) {
    return std::filesystem::path(path.toStdU16String());
}
}

DownloadProgress DownloadProgress::sample(const QString& modelId, qint64 downloaded, qint64 total) {
    DownloadProgress progress;
    progress.modelId = modelId;
    progress.bytesDownloaded = downloaded;
    progress.bytesTotal = total;
    progress.percent = total > 0
        ? static_cast<double>(downloaded) / static_cast<double>(total) * 100.0
        : 0.0;
    return progress;
}

struct ModelDownloader::ModelDownloaderPrivate {
    ModelCatalog catalog;
    QString modelsDirectory;
    std::shared_ptr<HttpClient> httpClient;
    QThreadPool pool;   // downloadAsync() transfers
};

ModelDownloader::ModelDownloader(ModelCatalog catalog,
                                 const QString& modelsDirectory,
                                 std::shared_ptr<HttpClient> httpClient,
                                 QObject* parent)
    : QObject(parent)
    , d(std::make_unique<ModelDownloaderPrivate>()) {
    d->catalog = std::move(catalog);
    d->modelsDirectory = QDir::cleanPath(modelsDirectory);
    d->httpClient = std::move(httpClient);

    qRegisterMetaType<DownloadProgress>();
    qRegisterMetaType<Error>();

    WHISPERGUI_DEBUG("ModelDownloader: models directory {}", d->modelsDirectory.toStdString());
}

ModelDownloader::~ModelDownloader() {
    // Transfers in flight still emit on this object
    d->pool.waitForDone();
}

const std::vector<ModelDescriptor>& ModelDownloader::listAvailableModels() const {
    return d->catalog.models();
}

const ModelCatalog& ModelDownloader::catalog() const {
    return d->catalog;
}

QString ModelDownloader::modelsDirectory() const {
    return d->modelsDirectory;
}

QString ModelDownloader::resolvePath(const QString& modelId) const {
    return QDir(d->modelsDirectory).filePath(kModelFilePrefix + modelId + kModelFileExtension);
}

QString ModelDownloader::tempPathFor(const QString& targetPath) {
    return targetPath + kTempSuffix;
}

bool ModelDownloader::isDownloaded(const QString& modelId) const {
    return QFileInfo::exists(resolvePath(modelId));
}

Result<QString> ModelDownloader::locate(const QString& modelId) const {
    const QString path = resolvePath(modelId);
    if (!QFileInfo::exists(path)) {
        return makeError(ErrorCode::NotDownloaded, QString("Model '%1' not downloaded").arg(modelId));
    }
    return path;
}

Result<QString> ModelDownloader::download(const QString& modelId) {
    const auto model = d->catalog.find(modelId);
    if (!model) {
        Error error{ErrorCode::UnknownModel, QString("Model '%1' not found").arg(modelId)};
        WHISPERGUI_ERROR("ModelDownloader: {}", error.message.toStdString());
        emit downloadFailed(modelId, error);
        return makeUnexpected(error);
    }

    if (!QDir().mkpath(d->modelsDirectory)) {
        Error error{ErrorCode::StorageError,
                    QString("Failed to create models directory: %1").arg(d->modelsDirectory)};
        WHISPERGUI_ERROR("ModelDownloader: {}", error.message.toStdString());
        emit downloadFailed(modelId, error);
        return makeUnexpected(error);
    }

    const QString targetPath = resolvePath(modelId);
    WHISPERGUI_INFO("ModelDownloader: downloading {} from {} -> {}", modelId.toStdString(),
                    model->url.toString().toStdString(), targetPath.toStdString());
    emit downloadStarted(modelId);

    auto result = transfer(*model, targetPath);
    if (result.hasError()) {
        WHISPERGUI_ERROR("ModelDownloader: download of {} failed: {}", modelId.toStdString(),
                         result.error().toString().toStdString());
        emit downloadFailed(modelId, result.error());
        return makeUnexpected(result.error());
    }

    WHISPERGUI_INFO("ModelDownloader: {} ready at {}", modelId.toStdString(), targetPath.toStdString());
    emit downloadFinished(modelId, targetPath);
    return targetPath;
}

QFuture<Result<QString>> ModelDownloader::downloadAsync(const QString& modelId) {
    return QtConcurrent::run(&d->pool, [this, modelId]() { return download(modelId); });
}

Result<void> ModelDownloader::transfer(const ModelDescriptor& model, const QString& targetPath) {
    auto response = d->httpClient->get(model.url);
    if (response.hasError()) {
        return makeUnexpected(response.error());
    }
    HttpResponse& reply = *response.value();

    const int status = reply.statusCode();
    if (status < 200 || status >= 300) {
        return makeError(ErrorCode::RemoteError, QString("Download failed with status: %1").arg(status));
    }

    const qint64 total = reply.contentLength();
    const QString tempPath = tempPathFor(targetPath);

    QFile file(tempPath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return makeError(ErrorCode::StorageError,
                         QString("Failed to create file %1: %2").arg(tempPath, file.errorString()));
    }

    qint64 downloaded = 0;
    while (true) {
        auto chunk = reply.readChunk();
        if (chunk.hasError()) {
            return makeUnexpected(chunk.error());
        }
        const QByteArray& data = chunk.value();
        if (data.isEmpty()) {
            break;
        }

        if (file.write(data) != data.size()) {
            return makeError(ErrorCode::StorageError,
                             QString("Error writing file: %1").arg(file.errorString()));
        }

        downloaded += data.size();
        WHISPERGUI_TRACE("ModelDownloader: {} {}/{} bytes", model.id.toStdString(), downloaded, total);
        emit progressChanged(DownloadProgress::sample(model.id, downloaded, total));
    }

    if (!file.flush()) {
        return makeError(ErrorCode::StorageError,
                         QString("Error flushing file: %1").arg(file.errorString()));
    }
    file.close();
    if (file.error() != QFileDevice::NoError) {
        return makeError(ErrorCode::StorageError,
                         QString("Error closing file: %1").arg(file.errorString()));
    }

    return commit(tempPath, targetPath);
}

Result<void> ModelDownloader::commit(const QString& tempPath, const QString& targetPath) {
    // rename(2) replaces an existing target in one step; QFile::rename refuses to
    std::error_code ec;
    std::filesystem::rename(toFsPath(tempPath), toFsPath(targetPath), ec);
    if (ec) {
        return makeError(ErrorCode::StorageError,
                         QString("Error finalizing download: %1")
                             .arg(QString::fromStdString(ec.message())));
    }
    return {};
}

Result<void> ModelDownloader::remove(const QString& modelId) {
    const QString path = resolvePath(modelId);
    if (!QFileInfo::exists(path)) {
        return {};
    }

    QFile file(path);
    if (!file.remove()) {
        Error error{ErrorCode::StorageError,
                    QString("Failed to delete model: %1").arg(file.errorString())};
        WHISPERGUI_ERROR("ModelDownloader: {}", error.message.toStdString());
        return makeUnexpected(error);
    }

    WHISPERGUI_INFO("ModelDownloader: deleted {}", path.toStdString());
    return {};
}

} // namespace WhisperGui
