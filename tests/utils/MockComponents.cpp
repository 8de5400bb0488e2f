#include "MockComponents.hpp"

#include <QtCore/QMutexLocker>
#include <QtCore/QThread>

namespace WhisperGui {
namespace Test {

namespace {

class MockHttpResponse : public HttpResponse {
public:
    explicit MockHttpResponse(MockHttpClient::Script script)
        : script_(std::move(script)) {}

    int statusCode() const override { return script_.status; }
    qint64 contentLength() const override { return script_.contentLength; }

    Result<QByteArray> readChunk() override {
        if (next_ < script_.chunks.size()) {
            if (script_.chunkDelayMs > 0) {
                QThread::msleep(script_.chunkDelayMs);
            }
            return script_.chunks[next_++];
        }
        if (script_.errorAfterChunks) {
            return makeUnexpected(*script_.errorAfterChunks);
        }
        return QByteArray();
    }

private:
    MockHttpClient::Script script_;
    size_t next_ = 0;
};

} // namespace

void MockHttpClient::setScript(const Script& script) {
    QMutexLocker locker(&mutex_);
    script_ = script;
}

Result<std::unique_ptr<HttpResponse>> MockHttpClient::get(const QUrl& url) {
    QMutexLocker locker(&mutex_);
    requestedUrls_.append(url);

    if (script_.connectError) {
        return makeUnexpected(*script_.connectError);
    }
    return std::unique_ptr<HttpResponse>(std::make_unique<MockHttpResponse>(script_));
}

QList<QUrl> MockHttpClient::requestedUrls() const {
    QMutexLocker locker(&mutex_);
    return requestedUrls_;
}

int MockHttpClient::requestCount() const {
    QMutexLocker locker(&mutex_);
    return requestedUrls_.size();
}

MockHttpClient::Script MockHttpClient::chunkedBody(const QByteArray& body, int chunkSize, bool declareLength) {
    Script script;
    script.contentLength = declareLength ? body.size() : 0;
    for (int offset = 0; offset < body.size(); offset += chunkSize) {
        script.chunks.push_back(body.mid(offset, chunkSize));
    }
    return script;
}

} // namespace Test
} // namespace WhisperGui
