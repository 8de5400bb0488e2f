#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>

#include <memory>
#include <optional>

#include "../common/Error.hpp"
#include "../common/EventChannel.hpp"
#include "TranscriptionTypes.hpp"

namespace WhisperGui {

/**
 * @brief Receiving end of one transcription's event stream
 *
 * Move-only. Dropping it tells the job nobody is listening; the job keeps
 * running to process exit and its remaining events are discarded.
 */
class TranscriptionStream {
public:
    explicit TranscriptionStream(std::shared_ptr<EventChannel<TranscriptionEvent>> channel);
    ~TranscriptionStream();

    TranscriptionStream(TranscriptionStream&& other) noexcept;
    TranscriptionStream& operator=(TranscriptionStream&& other) noexcept;
    TranscriptionStream(const TranscriptionStream&) = delete;
    TranscriptionStream& operator=(const TranscriptionStream&) = delete;

    // Next event in emission order; nothing after the terminal event or on timeout
    std::optional<TranscriptionEvent> next(int timeoutMs = -1);

    // True once the terminal event has been received
    bool atEnd() const;

private:
    std::shared_ptr<EventChannel<TranscriptionEvent>> channel_;
};

/**
 * @brief Launches whisper-cli and turns its output into an event stream
 */
class WhisperProcess {
public:
    struct Options {
        QString executable;
        int eventCapacity = 100;
    };

    explicit WhisperProcess(Options options);

    const Options& options() const { return options_; }

    static QStringList buildArguments(const QString& audioPath,
                                      const QString& modelPath,
                                      const QString& outputFormat,
                                      const std::optional<QString>& language);

    /**
     * @brief Spawns the child and hands back its event stream
     *
     * Returns once the child is running, or with SpawnError if it could not be
     * launched. Everything after that happens on the job's own thread.
     * May be called from any thread; the job thread object is released by
     * the application's event loop once the child has exited.
     */
    Result<TranscriptionStream> run(const QString& audioPath,
                                    const QString& modelPath,
                                    const QString& outputFormat,
                                    const std::optional<QString>& language) const;

private:
    Options options_;
};

} // namespace WhisperGui
