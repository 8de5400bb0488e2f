#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <memory>
#include <string>

namespace WhisperGui {

/**
 * @brief Process-wide spdlog front end
 *
 * Until initialize() is called every message goes to a console-only logger
 * on stderr, so library code can log before (or without) application setup.
 * Stdout is left to transcript text.
 */
class Logger {
public:
    enum class Level {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5
    };

    static Logger& instance();

    void initialize(const std::string& logFilePath = "whisper-gui.log",
                    Level level = Level::Info);

    void setLevel(Level level);

    template<typename... Args>
    void trace(fmt::format_string<Args...> format, Args&&... args) {
        logger_->trace(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) {
        logger_->debug(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) {
        logger_->info(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) {
        logger_->warn(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args) {
        logger_->error(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(fmt::format_string<Args...> format, Args&&... args) {
        logger_->critical(format, std::forward<Args>(args)...);
    }

private:
    Logger();
    std::shared_ptr<spdlog::logger> logger_;
};

#define WHISPERGUI_TRACE(...) WhisperGui::Logger::instance().trace(__VA_ARGS__)
#define WHISPERGUI_DEBUG(...) WhisperGui::Logger::instance().debug(__VA_ARGS__)
#define WHISPERGUI_INFO(...) WhisperGui::Logger::instance().info(__VA_ARGS__)
#define WHISPERGUI_WARN(...) WhisperGui::Logger::instance().warn(__VA_ARGS__)
#define WHISPERGUI_ERROR(...) WhisperGui::Logger::instance().error(__VA_ARGS__)
#define WHISPERGUI_CRITICAL(...) WhisperGui::Logger::instance().critical(__VA_ARGS__)

} // namespace WhisperGui
