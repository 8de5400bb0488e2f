#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QObject>
#include <QtCore/QProcess>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include <memory>

#include "../common/EventChannel.hpp"
#include "TranscriptionTypes.hpp"

namespace WhisperGui {

/**
 * @brief Owns one whisper-cli child process and the sending end of its channel
 *
 * Lives on a dedicated thread for its whole life. Nothing else touches the
 * process or sends on the channel; the outside world only sees the events.
 * Emits done() once the terminal event has been sent (or spawning failed),
 * which is the cue to stop the thread.
 */
class TranscriptionJob : public QObject {
    Q_OBJECT

public:
    TranscriptionJob(const QString& program,
                     const QStringList& arguments,
                     std::shared_ptr<EventChannel<TranscriptionEvent>> channel);
    ~TranscriptionJob() override;

    // Runs on the job thread. Returns an empty string once the child is
    // running, otherwise the reason it could not be launched.
    QString start();

signals:
    void done();

private slots:
    void onStandardOutput();
    void onStandardError();
    void onFinished(int exitCode, QProcess::ExitStatus exitStatus);

private:
    void splitLines(QByteArray& pending, const QByteArray& incoming, bool fromStderr);
    void emitLine(const QByteArray& rawLine, bool fromStderr);
    void finish(const TranscriptionEvent& terminal);

    QString program_;
    QStringList arguments_;
    std::shared_ptr<EventChannel<TranscriptionEvent>> channel_;
    QProcess* process_ = nullptr;

    QByteArray pendingStdout_;
    QByteArray pendingStderr_;
    QString accumulatedOutput_;
    bool finished_ = false;
};

} // namespace WhisperGui
