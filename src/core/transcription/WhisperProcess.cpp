#include "WhisperProcess.hpp"
#include "TranscriptionJob.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QCoreApplication>
#include <QtCore/QMetaObject>
#include <QtCore/QThread>

namespace WhisperGui {

TranscriptionStream::TranscriptionStream(std::shared_ptr<EventChannel<TranscriptionEvent>> channel)
    : channel_(std::move(channel)) {}

TranscriptionStream::~TranscriptionStream() {
    if (channel_) {
        channel_->detachReceiver();
    }
}

TranscriptionStream::TranscriptionStream(TranscriptionStream&& other) noexcept
    : channel_(std::move(other.channel_)) {}

TranscriptionStream& TranscriptionStream::operator=(TranscriptionStream&& other) noexcept {
    if (this != &other) {
        if (channel_) {
            channel_->detachReceiver();
        }
        channel_ = std::move(other.channel_);
    }
    return *this;
}

std::optional<TranscriptionEvent> TranscriptionStream::next(int timeoutMs) {
    if (!channel_) {
        return std::nullopt;
    }
    return channel_->receive(timeoutMs);
}

bool TranscriptionStream::atEnd() const {
    return !channel_ || channel_->isFinished();
}

WhisperProcess::WhisperProcess(Options options)
    : options_(std::move(options)) {
    qRegisterMetaType<TranscriptionEvent>("WhisperGui::TranscriptionEvent");
}

QStringList WhisperProcess::buildArguments(const QString& audioPath,
                                           const QString& modelPath,
                                           const QString& outputFormat,
                                           const std::optional<QString>& language) {
    QStringList args;
    args << "-m" << modelPath;
    args << "-f" << audioPath;
    args << "-o" << outputFormat;

    if (language && *language != "auto") {
        args << "-l" << *language;
    }

    return args;
}

Result<TranscriptionStream> WhisperProcess::run(const QString& audioPath,
                                                const QString& modelPath,
                                                const QString& outputFormat,
                                                const std::optional<QString>& language) const {
    const QStringList args = buildArguments(audioPath, modelPath, outputFormat, language);
    auto channel = std::make_shared<EventChannel<TranscriptionEvent>>(options_.eventCapacity);

    auto* thread = new QThread;
    thread->setObjectName("TranscriptionJob");
    auto* job = new TranscriptionJob(options_.executable, args, channel);
    job->moveToThread(thread);

    // done() fires on the job thread; quit() is thread-safe
    QObject::connect(job, &TranscriptionJob::done, thread, &QThread::quit, Qt::DirectConnection);
    QObject::connect(thread, &QThread::finished, job, &QObject::deleteLater);
    // Reaped by the application's event loop, whichever thread called run()
    if (QCoreApplication* app = QCoreApplication::instance()) {
        thread->moveToThread(app->thread());
    }
    QObject::connect(thread, &QThread::finished, thread, &QObject::deleteLater);
    thread->start();

    QString spawnFailure;
    QMetaObject::invokeMethod(job, &TranscriptionJob::start, Qt::BlockingQueuedConnection, &spawnFailure);

    if (!spawnFailure.isEmpty()) {
        thread->wait();
        return makeError(ErrorCode::SpawnError, spawnFailure);
    }

    WHISPERGUI_DEBUG("WhisperProcess: transcription of {} running", audioPath.toStdString());
    return TranscriptionStream(std::move(channel));
}

} // namespace WhisperGui
