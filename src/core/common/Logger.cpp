#include "Logger.hpp"

namespace WhisperGui {

namespace {
constexpr const char* kLoggerName = "whispergui";
constexpr const char* kConsolePattern = "[%H:%M:%S] [%^%l%$] [%t] %v";
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern(kConsolePattern);
    logger_ = std::make_shared<spdlog::logger>(kLoggerName, console_sink);
    logger_->set_level(spdlog::level::info);
}

void Logger::initialize(const std::string& logFilePath, Level level) {
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFilePath, 1024 * 1024 * 5, 3); // 5MB, 3 files

        console_sink->set_pattern(kConsolePattern);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%l] [%t] %v");

        logger_ = std::make_shared<spdlog::logger>(kLoggerName,
            spdlog::sinks_init_list{console_sink, file_sink});
        setLevel(level);

        spdlog::drop(kLoggerName);
        spdlog::register_logger(logger_);

        WHISPERGUI_INFO("Logger initialized with file: {}", logFilePath);
    } catch (const spdlog::spdlog_ex& ex) {
        // Keep the console-only logger
        setLevel(level);
        logger_->error("Logger initialization failed: {}", ex.what());
    }
}

void Logger::setLevel(Level level) {
    logger_->set_level(static_cast<spdlog::level::level_enum>(level));
}

} // namespace WhisperGui
