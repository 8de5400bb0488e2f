#include "TranscriptionJob.hpp"
#include "../common/Logger.hpp"

namespace WhisperGui {

TranscriptionJob::TranscriptionJob(const QString& program,
                                   const QStringList& arguments,
                                   std::shared_ptr<EventChannel<TranscriptionEvent>> channel)
    : program_(program)
    , arguments_(arguments)
    , channel_(std::move(channel)) {}

TranscriptionJob::~TranscriptionJob() {
    if (!finished_) {
        // Thread torn down under a running child
        if (process_ && process_->state() != QProcess::NotRunning) {
            WHISPERGUI_WARN("TranscriptionJob: killing {} before it exited", program_.toStdString());
            process_->disconnect(this);
            process_->kill();
            process_->waitForFinished(3000);
        }
        channel_->send(TranscriptionEvent::failed("Process exited with code: unknown"));
        channel_->close();
    }
}

QString TranscriptionJob::start() {
    process_ = new QProcess(this);
    process_->setProgram(program_);
    process_->setArguments(arguments_);

    connect(process_, &QProcess::readyReadStandardOutput,
            this, &TranscriptionJob::onStandardOutput);
    connect(process_, &QProcess::readyReadStandardError,
            this, &TranscriptionJob::onStandardError);
    connect(process_, &QProcess::finished,
            this, &TranscriptionJob::onFinished);

    WHISPERGUI_INFO("TranscriptionJob: starting {} {}", program_.toStdString(),
                    arguments_.join(' ').toStdString());
    process_->start(QIODevice::ReadOnly);

    if (!process_->waitForStarted()) {
        const QString reason = QString("Failed to spawn %1: %2").arg(program_, process_->errorString());
        WHISPERGUI_ERROR("TranscriptionJob: {}", reason.toStdString());
        process_->disconnect(this);
        finished_ = true;
        channel_->close();
        emit done();
        return reason;
    }

    WHISPERGUI_DEBUG("TranscriptionJob: child pid {}", process_->processId());
    return QString();
}

void TranscriptionJob::onStandardOutput() {
    if (finished_) return;
    splitLines(pendingStdout_, process_->readAllStandardOutput(), false);
}

void TranscriptionJob::onStandardError() {
    if (finished_) return;
    splitLines(pendingStderr_, process_->readAllStandardError(), true);
}

void TranscriptionJob::splitLines(QByteArray& pending, const QByteArray& incoming, bool fromStderr) {
    pending.append(incoming);

    qsizetype newline = pending.indexOf('\n');
    while (newline >= 0) {
        emitLine(pending.left(newline), fromStderr);
        pending.remove(0, newline + 1);
        newline = pending.indexOf('\n');
    }
}

void TranscriptionJob::emitLine(const QByteArray& rawLine, bool fromStderr) {
    QByteArray line = rawLine;
    if (line.endsWith('\r')) {
        line.chop(1);
    }

    // fromUtf8 substitutes U+FFFD for malformed sequences
    const QString text = QString::fromUtf8(line);
    if (!fromStderr) {
        accumulatedOutput_ += text;
        accumulatedOutput_ += QLatin1Char('\n');
    }

    // Blocks while the consumer is behind; false means nobody is listening
    channel_->send(TranscriptionEvent::outputLine(text, fromStderr));
}

void TranscriptionJob::onFinished(int exitCode, QProcess::ExitStatus exitStatus) {
    if (finished_) return;

    onStandardOutput();
    onStandardError();
    if (!pendingStdout_.isEmpty()) {
        emitLine(pendingStdout_, false);
        pendingStdout_.clear();
    }
    if (!pendingStderr_.isEmpty()) {
        emitLine(pendingStderr_, true);
        pendingStderr_.clear();
    }

    if (exitStatus == QProcess::NormalExit && exitCode == 0) {
        WHISPERGUI_INFO("TranscriptionJob: {} completed", program_.toStdString());
        finish(TranscriptionEvent::completed(accumulatedOutput_));
        return;
    }

    const QString code = exitStatus == QProcess::NormalExit
        ? QString::number(exitCode)
        : QStringLiteral("unknown");
    WHISPERGUI_ERROR("TranscriptionJob: {} exited with code {}", program_.toStdString(),
                     code.toStdString());
    finish(TranscriptionEvent::failed(QString("Process exited with code: %1").arg(code)));
}

void TranscriptionJob::finish(const TranscriptionEvent& terminal) {
    finished_ = true;
    channel_->send(terminal);
    channel_->close();
    emit done();
}

} // namespace WhisperGui
