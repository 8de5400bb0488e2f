#include "HttpClient.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QEventLoop>
#include <QtCore/QTimer>
#include <QtNetwork/QNetworkAccessManager>
#include <QtNetwork/QNetworkReply>
#include <QtNetwork/QNetworkRequest>

namespace WhisperGui {

namespace {

class NetworkHttpResponse : public HttpResponse {
public:
    NetworkHttpResponse(std::unique_ptr<QNetworkAccessManager> manager,
                        QNetworkReply* reply,
                        const NetworkHttpClient::Options& options)
        : manager_(std::move(manager))
        , reply_(reply)
        , options_(options) {
        // Stop pulling from the socket while the caller is busy writing
        reply_->setReadBufferSize(options_.maxChunkSize * 4);
    }

    int statusCode() const override {
        return reply_->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    }

    qint64 contentLength() const override {
        const QVariant header = reply_->header(QNetworkRequest::ContentLengthHeader);
        if (!header.isValid()) {
            return 0;
        }
        return qMax<qint64>(0, header.toLongLong());
    }

    Result<QByteArray> readChunk() override {
        while (true) {
            if (reply_->bytesAvailable() > 0) {
                return reply_->read(options_.maxChunkSize);
            }
            if (reply_->isFinished()) {
                if (reply_->error() != QNetworkReply::NoError) {
                    return makeError(ErrorCode::NetworkError,
                                     QString("Error downloading: %1").arg(reply_->errorString()));
                }
                return QByteArray();
            }
            if (!waitForActivity()) {
                reply_->abort();
                return makeError(ErrorCode::NetworkError,
                                 QString("No data received for %1 seconds")
                                     .arg(options_.inactivityTimeoutMs / 1000));
            }
        }
    }

    // Headers of the final (post-redirect) response are known once body
    // bytes are buffered or the reply is finished
    Result<void> waitForHeaders() {
        while (reply_->bytesAvailable() == 0 && !reply_->isFinished()) {
            if (!waitForActivity()) {
                reply_->abort();
                return makeError(ErrorCode::NetworkError,
                                 QString("No response within %1 seconds")
                                     .arg(options_.inactivityTimeoutMs / 1000));
            }
        }

        const bool gotStatus = reply_->attribute(QNetworkRequest::HttpStatusCodeAttribute).isValid();
        if (reply_->error() != QNetworkReply::NoError && !gotStatus) {
            return makeError(ErrorCode::NetworkError,
                             QString("Failed to start download: %1").arg(reply_->errorString()));
        }
        return {};
    }

private:
    // Returns false when the inactivity timeout expired first
    bool waitForActivity() {
        QEventLoop loop;
        QTimer timer;
        timer.setSingleShot(true);
        QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
        QObject::connect(reply_.get(), &QNetworkReply::readyRead, &loop, &QEventLoop::quit);
        QObject::connect(reply_.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
        timer.start(options_.inactivityTimeoutMs);
        loop.exec();
        return timer.isActive();
    }

    // Declared first so the reply goes before its manager
    std::unique_ptr<QNetworkAccessManager> manager_;
    std::unique_ptr<QNetworkReply> reply_;
    NetworkHttpClient::Options options_;
};

} // namespace

NetworkHttpClient::NetworkHttpClient(Options options)
    : options_(std::move(options)) {}

Result<std::unique_ptr<HttpResponse>> NetworkHttpClient::get(const QUrl& url) {
    if (!url.isValid() || (url.scheme() != "http" && url.scheme() != "https")) {
        return makeError(ErrorCode::NetworkError,
                         QString("Unsupported download URL: %1").arg(url.toString()));
    }

    auto manager = std::make_unique<QNetworkAccessManager>();
    manager->setRedirectPolicy(QNetworkRequest::NoLessSafeRedirectPolicy);

    QNetworkRequest request(url);
    request.setRawHeader("User-Agent", options_.userAgent.toUtf8());
    request.setAttribute(QNetworkRequest::CacheLoadControlAttribute, QNetworkRequest::AlwaysNetwork);

    WHISPERGUI_DEBUG("HttpClient: GET {}", url.toString().toStdString());
    QNetworkReply* reply = manager->get(request);

    auto response = std::make_unique<NetworkHttpResponse>(std::move(manager), reply, options_);
    auto headers = response->waitForHeaders();
    if (headers.hasError()) {
        WHISPERGUI_ERROR("HttpClient: {} ({})", headers.error().message.toStdString(),
                         url.toString().toStdString());
        return makeUnexpected(headers.error());
    }

    return std::unique_ptr<HttpResponse>(std::move(response));
}

} // namespace WhisperGui
