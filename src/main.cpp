#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QTextStream>

#include "app/AppController.hpp"
#include "core/common/Config.hpp"
#include "core/common/Logger.hpp"

namespace {

QTextStream& out() {
    static QTextStream stream(stdout);
    return stream;
}

QTextStream& err() {
    static QTextStream stream(stderr);
    return stream;
}

int fail(const WhisperGui::Error& error) {
    err() << error.toString() << Qt::endl;
    return 1;
}

QString requireArgument(const QStringList& positional, const QString& command) {
    if (positional.size() < 2) {
        err() << "Usage: whisper-gui-cli " << command << " <model-id>" << Qt::endl;
        return QString();
    }
    return positional.at(1);
}

int listModels(WhisperGui::AppController& controller) {
    for (const WhisperGui::ModelStatus& status : controller.listModels()) {
        out() << status.info.id << '\t'
              << status.info.sizeMb << " MB\t"
              << (status.downloaded ? "downloaded" : "-") << '\t'
              << status.info.displayName << Qt::endl;
    }
    return 0;
}

int downloadModel(WhisperGui::AppController& controller, const QString& modelId) {
    // The download runs on this thread, so progress arrives inline
    QObject::connect(&controller, &WhisperGui::AppController::downloadProgress,
                     [](const WhisperGui::DownloadProgress& progress) {
        if (progress.bytesTotal > 0) {
            out() << '\r' << progress.modelId << ": "
                  << QString::number(progress.percent, 'f', 1) << '%';
        } else {
            out() << '\r' << progress.modelId << ": " << progress.bytesDownloaded << " bytes";
        }
        out().flush();
    });

    const WhisperGui::Result<QString> path = controller.downloadModel(modelId);
    out() << Qt::endl;
    if (!path) {
        return fail(path.error());
    }
    out() << path.value() << Qt::endl;
    return 0;
}

int printModelPath(WhisperGui::AppController& controller, const QString& modelId) {
    const WhisperGui::Result<QString> path = controller.modelPath(modelId);
    if (!path) {
        return fail(path.error());
    }
    out() << path.value() << Qt::endl;
    return 0;
}

int deleteModel(WhisperGui::AppController& controller, const QString& modelId) {
    const WhisperGui::Result<void> removed = controller.deleteModel(modelId);
    if (!removed) {
        return fail(removed.error());
    }
    return 0;
}

int transcribe(QCoreApplication& app,
               WhisperGui::AppController& controller,
               const QString& audioPath,
               const QString& modelId,
               const QString& format,
               const QString& language) {
    QObject::connect(&controller, &WhisperGui::AppController::transcriptionOutput, &app,
                     [](const WhisperGui::TranscriptionOutput& output) {
        if (output.isError) {
            err() << output.line << Qt::endl;
        } else {
            out() << output.line << Qt::endl;
        }
    }, Qt::QueuedConnection);

    QObject::connect(&controller, &WhisperGui::AppController::transcriptionComplete, &app,
                     [](const WhisperGui::TranscriptionComplete& result) {
        if (!result.success) {
            err() << result.error.value_or(QString("Transcription failed")) << Qt::endl;
        }
        QCoreApplication::exit(result.success ? 0 : 1);
    }, Qt::QueuedConnection);

    const WhisperGui::Result<void> started =
        controller.transcribeAudio(audioPath, modelId, format, language);
    if (!started) {
        return fail(started.error());
    }
    return app.exec();
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("com.whisper-gui.app");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("WhisperGui");

    QCommandLineParser parser;
    parser.setApplicationDescription("Download Whisper models and transcribe audio with whisper-cli");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "list | download <id> | path <id> | delete <id> | transcribe <audio>");

    QCommandLineOption modelOption({"m", "model"}, "Model id used for transcription.", "id");
    QCommandLineOption formatOption({"o", "format"}, "Output format passed to whisper-cli.", "format");
    QCommandLineOption languageOption({"l", "language"}, "Spoken language, or 'auto'.", "lang");
    QCommandLineOption configOption("config", "Read settings from this INI file.", "file");
    QCommandLineOption verboseOption("verbose", "Log debug output to stderr.");
    parser.addOptions({modelOption, formatOption, languageOption, configOption, verboseOption});
    parser.process(app);

    const WhisperGui::Logger::Level logLevel = parser.isSet(verboseOption)
        ? WhisperGui::Logger::Level::Debug
        : WhisperGui::Logger::Level::Warn;
    WhisperGui::Logger::instance().setLevel(logLevel);

    try {
        if (parser.isSet(configOption)) {
            WhisperGui::Config::instance().initializeFromFile(parser.value(configOption));
        } else {
            WhisperGui::Config::instance().initialize();
        }

        const QString logDir = QDir(WhisperGui::Config::instance().getDataPath()).filePath("logs");
        QDir().mkpath(logDir);
        WhisperGui::Logger::instance().initialize(
            QDir(logDir).filePath("whisper-gui-cli.log").toStdString(), logLevel);
        WHISPERGUI_DEBUG("Starting whisper-gui-cli v{}", app.applicationVersion().toStdString());

        const QStringList positional = parser.positionalArguments();
        if (positional.isEmpty()) {
            parser.showHelp(1);
        }

        std::unique_ptr<WhisperGui::AppController> controller = WhisperGui::AppController::fromConfig();
        const QString command = positional.first();
        int result = 1;

        if (command == "list") {
            result = listModels(*controller);
        } else if (command == "download" || command == "path" || command == "delete") {
            const QString modelId = requireArgument(positional, command);
            if (modelId.isEmpty()) {
                return 1;
            }
            if (command == "download") {
                result = downloadModel(*controller, modelId);
            } else if (command == "path") {
                result = printModelPath(*controller, modelId);
            } else {
                result = deleteModel(*controller, modelId);
            }
        } else if (command == "transcribe") {
            if (positional.size() < 2 || !parser.isSet(modelOption)) {
                err() << "Usage: whisper-gui-cli transcribe <audio> --model <id>" << Qt::endl;
                return 1;
            }
            const WhisperGui::Config::TranscriptionSettings defaults =
                WhisperGui::Config::instance().getTranscriptionSettings();
            result = transcribe(app, *controller, positional.at(1), parser.value(modelOption),
                                parser.isSet(formatOption) ? parser.value(formatOption) : defaults.defaultOutputFormat,
                                parser.isSet(languageOption) ? parser.value(languageOption) : defaults.defaultLanguage);
        } else {
            err() << "Unknown command: " << command << Qt::endl;
            parser.showHelp(1);
        }

        WhisperGui::Config::instance().sync();
        return result;

    } catch (const std::exception& e) {
        WHISPERGUI_CRITICAL("Fatal error: {}", e.what());
        return 1;
    }
}
