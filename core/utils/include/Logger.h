#pragma once

#include <string>
#include <mutex>
#include <fstream>
#include <iostream>
#include <functional>
#include <atomic>

namespace LanScout {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR,
        CRITICAL
    };

    /**
     * @brief Receives every formatted entry that passes the level filter.
     */
    using LogSink = std::function<void(LogLevel level, const std::string& component, const std::string& message)>;

    class Logger {
    public:
        static Logger& instance();

        void setLogFile(const std::string& path);
        void setLevel(LogLevel level);
        void setMaxFileSize(size_t maxSizeMB); // Set max log file size before rotation
        void setComponent(const std::string& component); // Set default component name
        void setConsoleOutput(bool enabled);
        void setSink(LogSink sink);

        // Level checking for conditional logging (avoid string construction overhead)
        bool isDebugEnabled() const { return currentLevel_.load() <= LogLevel::DEBUG; }
        LogLevel getLevel() const { return currentLevel_.load(); }

        void log(LogLevel level, const std::string& message, const std::string& component = "");

        void debug(const std::string& message, const std::string& component = "");
        void info(const std::string& message, const std::string& component = "");
        void warn(const std::string& message, const std::string& component = "");
        void error(const std::string& message, const std::string& component = "");
        void critical(const std::string& message, const std::string& component = "");

        static bool parseLevel(const std::string& text, LogLevel& level);

    private:
        Logger() = default;
        ~Logger();

        std::mutex mutex_;
        std::ofstream logFile_;
        std::string logFilePath_;
        std::atomic<LogLevel> currentLevel_{LogLevel::INFO};
        std::string defaultComponent_ = "LanScout";
        size_t maxFileSizeMB_ = 10;
        size_t currentFileSize_ = 0;
        bool consoleOutput_ = true;
        LogSink sink_;

        std::string levelToString(LogLevel level);
        std::string getCurrentTime();
        void rotateLogFile();
        void checkAndRotate();
        size_t getFileSize();
    };

}
