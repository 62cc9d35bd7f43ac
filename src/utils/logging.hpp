#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace logging
{
    enum class LogLevel
    {
        ERROR = 0,   // Most important - always show
        WARNING = 1, // Important - usually show
        INFO = 2,    // Normal - sometimes show
        DEBUG = 3    // Least important - rarely show
    };

    // Global settings, shared by every translation unit
    inline LogLevel globalLogLevel = LogLevel::INFO;
    inline bool showTimestamp = false;
    inline bool enableFileLogging = false;
    inline std::string logFilePath = "debug_frames/stashscan.log";

    // Scan loop, HTTP handlers and the foreground loop all log
    inline std::mutex &logMutex()
    {
        static std::mutex mutex;
        return mutex;
    }

    inline void setLogLevel(LogLevel level)
    {
        globalLogLevel = level;
    }

    inline void setShowTimestamp(bool show)
    {
        showTimestamp = show;
    }

    // Enable/disable file logging
    inline void setFileLogging(bool enable, const std::string &filepath = "debug_frames/stashscan.log")
    {
        std::lock_guard<std::mutex> lock(logMutex());
        enableFileLogging = enable;
        logFilePath = filepath;

        if (enable)
        {
            std::ofstream logFile(logFilePath, std::ios::app);
            if (logFile.is_open())
            {
                logFile << "\n========== StashScan Session Started ==========\n";
            }
            else
            {
                std::cerr << "Cannot open log file " << logFilePath << ", file logging disabled" << std::endl;
                enableFileLogging = false;
            }
        }
    }

    // Get current timestamp as string
    inline std::string getCurrentTimestamp()
    {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::tm local{};
        localtime_r(&time_t, &local);

        std::stringstream ss;
        ss << std::put_time(&local, "%H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    inline std::string logLevelToString(LogLevel level)
    {
        switch (level)
        {
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::WARNING:
            return "WARN";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::DEBUG:
            return "DEBUG";
        default:
            return "UNKNOWN";
        }
    }

// Highlight a number (anything std::to_string accepts) in cyan
#define log_string(value) ("\033[36m" + std::to_string(value) + "\033[0m")

    // Module tag from a function signature:
    // "void ScanCoordinator::start()" -> "SCANCOORDINATOR"
    // "std::optional<cv::Rect> region_locator::locate(const cv::Mat&, ...)" -> "REGION_LOCATOR"
    inline std::string extractModuleName(const std::string &function)
    {
        if (function.find("logging::") != std::string::npos)
        {
            return "SYSTEM";
        }

        // Only look at the qualified name right before the argument list
        size_t parenPos = function.find('(');
        std::string head = function.substr(0, parenPos);
        size_t spacePos = head.rfind(' ');
        std::string qualified = (spacePos == std::string::npos) ? head : head.substr(spacePos + 1);

        // Strip pointer/reference decorations glued to the name
        while (!qualified.empty() && (qualified[0] == '*' || qualified[0] == '&'))
        {
            qualified.erase(0, 1);
        }

        size_t colonPos = qualified.find("::");
        if (colonPos == std::string::npos || colonPos == 0)
        {
            return "SYSTEM";
        }

        std::string moduleName = qualified.substr(0, colonPos);
        std::transform(moduleName.begin(), moduleName.end(), moduleName.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });
        return moduleName;
    }

    // Remove ANSI escape sequences (for file logging)
    inline std::string stripColorCodes(const std::string &text)
    {
        std::string result = text;
        size_t pos = 0;

        while ((pos = result.find("\033[", pos)) != std::string::npos)
        {
            size_t endPos = result.find('m', pos);
            if (endPos == std::string::npos)
            {
                break; // Malformed escape sequence
            }
            result.erase(pos, endPos - pos + 1);
        }

        return result;
    }

    // Main logging function
    inline void log(const std::string &message, LogLevel level = LogLevel::INFO, const std::string &moduleName = "SYSTEM")
    {
        // Lower number = higher priority
        if (level > globalLogLevel)
            return;

        std::string timestamp = getCurrentTimestamp();
        std::string levelStr = logLevelToString(level);

        const std::string timestampColor = "\033[32m"; // Green
        const std::string bracketColor = "\033[37m";   // White
        const std::string moduleColor = "\033[90m";    // Gray
        const std::string resetCode = "\033[0m";
        std::string levelColor;

        switch (level)
        {
        case LogLevel::ERROR:
            levelColor = "\033[91m"; // Bright red
            break;
        case LogLevel::WARNING:
            levelColor = "\033[33m"; // Orange
            break;
        case LogLevel::INFO:
            levelColor = "\033[92m"; // Lime green
            break;
        case LogLevel::DEBUG:
            levelColor = "\033[34m"; // Blue
            break;
        }

        std::string consoleMessage;

        if (showTimestamp)
        {
            consoleMessage += bracketColor + "[" + timestampColor + timestamp + bracketColor + "]" + resetCode;
        }

        consoleMessage += bracketColor + "[" + levelColor + levelStr + bracketColor + "]";
        consoleMessage += bracketColor + "[" + moduleColor + moduleName + bracketColor + "]" + resetCode;
        consoleMessage += " - " + message;

        std::lock_guard<std::mutex> lock(logMutex());
        std::cout << consoleMessage << std::endl;

        // File logging (always with timestamp, no colors)
        if (enableFileLogging)
        {
            std::ofstream logFile(logFilePath, std::ios::app);
            if (logFile.is_open())
            {
                logFile << "[" << timestamp << "][" << levelStr << "][" << moduleName << "] - "
                        << stripColorCodes(message) << std::endl;
            }
        }
    }

    inline void error(const std::string &message, const std::string &module = "SYSTEM")
    {
        log(message, LogLevel::ERROR, module);
    }

    inline void warning(const std::string &message, const std::string &module = "SYSTEM")
    {
        log(message, LogLevel::WARNING, module);
    }

    inline void info(const std::string &message, const std::string &module = "SYSTEM")
    {
        log(message, LogLevel::INFO, module);
    }

    inline void debug(const std::string &message, const std::string &module = "SYSTEM")
    {
        log(message, LogLevel::DEBUG, module);
    }

// Macros that auto-detect the module name
#define LOG_ERROR(message) logging::log(message, logging::LogLevel::ERROR, logging::extractModuleName(__PRETTY_FUNCTION__))
#define LOG_WARNING(message) logging::log(message, logging::LogLevel::WARNING, logging::extractModuleName(__PRETTY_FUNCTION__))
#define LOG_INFO(message) logging::log(message, logging::LogLevel::INFO, logging::extractModuleName(__PRETTY_FUNCTION__))
#define LOG_DEBUG(message) logging::log(message, logging::LogLevel::DEBUG, logging::extractModuleName(__PRETTY_FUNCTION__))

#define log_error(message) LOG_ERROR(message)
#define log_warning(message) LOG_WARNING(message)
#define log_info(message) LOG_INFO(message)
#define log_debug(message) LOG_DEBUG(message)

} // namespace logging
