#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <QtCore/QUrl>

#include <memory>

#include "../common/Error.hpp"

class QNetworkAccessManager;
class QNetworkReply;

namespace WhisperGui {

/**
 * @brief Body of an HTTP GET whose status line and headers have arrived
 */
class HttpResponse {
public:
    virtual ~HttpResponse() = default;

    virtual int statusCode() const = 0;

    // Declared Content-Length, or 0 when the server did not send one
    virtual qint64 contentLength() const = 0;

    // Next piece of the body; an empty array marks the end of the body
    virtual Result<QByteArray> readChunk() = 0;
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Fails with NetworkError when no response could be obtained at all.
    // Non-success statuses are returned as responses.
    virtual Result<std::unique_ptr<HttpResponse>> get(const QUrl& url) = 0;
};

/**
 * @brief HttpClient on top of Qt Network
 *
 * Blocking: each call spins a local event loop on the calling thread and
 * uses its own QNetworkAccessManager, so it can be used from worker threads
 * and concurrent calls share nothing.
 */
class NetworkHttpClient : public HttpClient {
public:
    struct Options {
        QString userAgent = "WhisperGui/1.0";
        int inactivityTimeoutMs = 300 * 1000;
        qint64 maxChunkSize = 64 * 1024;
    };

    explicit NetworkHttpClient(Options options);

    Result<std::unique_ptr<HttpResponse>> get(const QUrl& url) override;

private:
    Options options_;
};

} // namespace WhisperGui
