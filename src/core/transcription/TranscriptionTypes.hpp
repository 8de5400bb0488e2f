#pragma once

#include <QtCore/QMetaType>
#include <QtCore/QString>

#include <optional>

namespace WhisperGui {

/**
 * @brief One item of a transcription's event stream
 *
 * A stream carries any number of OutputLine events followed by exactly one
 * terminal event (Completed or Failed), which is always the last one.
 */
struct TranscriptionEvent {
    enum class Kind {
        OutputLine,   // text = one line, isError = came from stderr
        Completed,    // text = every stdout line, each followed by '\n'
        Failed        // text = diagnostic
    };

    Kind kind = Kind::OutputLine;
    QString text;
    bool isError = false;

    static TranscriptionEvent outputLine(const QString& line, bool fromStderr) {
        return TranscriptionEvent{Kind::OutputLine, line, fromStderr};
    }

    static TranscriptionEvent completed(const QString& output) {
        return TranscriptionEvent{Kind::Completed, output, false};
    }

    static TranscriptionEvent failed(const QString& message) {
        return TranscriptionEvent{Kind::Failed, message, false};
    }

    bool isTerminal() const { return kind != Kind::OutputLine; }
};

// Payload of the per-line notification
struct TranscriptionOutput {
    QString line;
    bool isError = false;
};

// Payload of the terminal notification
struct TranscriptionComplete {
    bool success = false;
    QString output;                 // empty on failure
    std::optional<QString> error;   // set on failure only
};

} // namespace WhisperGui

Q_DECLARE_METATYPE(WhisperGui::TranscriptionEvent)
Q_DECLARE_METATYPE(WhisperGui::TranscriptionOutput)
Q_DECLARE_METATYPE(WhisperGui::TranscriptionComplete)
