#pragma once

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

using namespace std;

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
    inline string logFilePath = "logs/pokervision.log";

    // Capture, consumer and HTTP threads all log
    inline mutex &logMutex()
    {
        static mutex m;
        return m;
    }

    inline void setLogLevel(LogLevel level)
    {
        globalLogLevel = level;
    }

    inline void setShowTimestamp(bool show)
    {
        showTimestamp = show;
    }

    inline void setFileLogging(bool enable, const string &filepath = "logs/pokervision.log")
    {
        lock_guard<mutex> lock(logMutex());
        enableFileLogging = enable;
        logFilePath = filepath;

        if (enable)
        {
            error_code ec;
            filesystem::path parent = filesystem::path(logFilePath).parent_path();
            if (!parent.empty())
                filesystem::create_directories(parent, ec);

            ofstream logFile(logFilePath, ios::app);
            if (logFile.is_open())
            {
                logFile << "\n========== pokervision session started ==========\n";
            }
        }
    }

    inline string getCurrentTimestamp()
    {
        auto now = chrono::system_clock::now();
        auto time_t = chrono::system_clock::to_time_t(now);
        auto ms = chrono::duration_cast<chrono::milliseconds>(now.time_since_epoch()) % 1000;

        tm local_tm{};
        localtime_r(&time_t, &local_tm);

        stringstream ss;
        ss << put_time(&local_tm, "%H:%M:%S");
        ss << '.' << setfill('0') << setw(3) << ms.count();
        return ss.str();
    }

    inline string logLevelToString(LogLevel level)
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

// Highlight numbers in console output (cyan)
#define log_string(value) ("\033[36m" + std::to_string(value) + "\033[0m")
#define log_string_src(value) ("\033[36m" + std::string(value) + "\033[0m")

    // "void GameStateParser::parse(...)" -> "GAMESTATEPARSER"
    // "bool ocr::parseTimer(...)"        -> "OCR"
    inline string extractModuleName(const string &function)
    {
        if (function.find("logging::") != string::npos)
        {
            return "SYSTEM";
        }

        size_t paren = function.find('(');
        string signature = function.substr(0, paren);

        size_t lastColon = signature.rfind("::");
        if (lastColon == string::npos)
        {
            return "SYSTEM";
        }

        // Scope directly in front of the function name
        string scope = signature.substr(0, lastColon);
        size_t start = scope.find_last_of(" :*&");
        if (start != string::npos)
        {
            scope = scope.substr(start + 1);
        }

        // Drop template arguments
        size_t angle = scope.find('<');
        if (angle != string::npos)
        {
            scope = scope.substr(0, angle);
        }

        if (scope.empty())
        {
            return "SYSTEM";
        }

        transform(scope.begin(), scope.end(), scope.begin(), ::toupper);
        return scope;
    }

    // Strip ANSI colour codes for file output
    inline string stripColorCodes(const string &text)
    {
        string result = text;
        size_t pos = 0;

        while ((pos = result.find("\033[", pos)) != string::npos)
        {
            size_t endPos = result.find('m', pos);
            if (endPos != string::npos)
            {
                result.erase(pos, endPos - pos + 1);
            }
            else
            {
                break;
            }
        }

        return result;
    }

    inline void log(const string &message, LogLevel level = LogLevel::INFO, const string &moduleName = "SYSTEM")
    {
        if (level > globalLogLevel)
            return;

        string timestamp = getCurrentTimestamp();
        string levelStr = logLevelToString(level);

        string timestampColor = "\033[32m";
        string bracketColor = "\033[37m";
        string moduleColor = "\033[90m";
        string levelColor = "";
        string resetCode = "\033[0m";

        switch (level)
        {
        case LogLevel::ERROR:
            levelColor = "\033[91m";
            break;
        case LogLevel::WARNING:
            levelColor = "\033[33m";
            break;
        case LogLevel::INFO:
            levelColor = "\033[92m";
            break;
        case LogLevel::DEBUG:
            levelColor = "\033[34m";
            break;
        }

        string consoleMessage = "";

        if (showTimestamp)
        {
            consoleMessage += bracketColor + "[" + timestampColor + timestamp + bracketColor + "]" + resetCode;
        }

        consoleMessage += bracketColor + "[" + levelColor + levelStr + bracketColor + "]";
        consoleMessage += bracketColor + "[" + moduleColor + moduleName + bracketColor + "]" + resetCode;
        consoleMessage += " - " + message;

        lock_guard<mutex> lock(logMutex());
        cout << consoleMessage << endl;

        // File logging is always timestamped and colour free
        if (enableFileLogging)
        {
            ofstream logFile(logFilePath, ios::app);
            if (logFile.is_open())
            {
                logFile << "[" << timestamp << "][" << levelStr << "][" << moduleName << "] - " << stripColorCodes(message) << endl;
            }
        }
    }

    inline void error(const string &message, const string &module = "SYSTEM")
    {
        log(message, LogLevel::ERROR, module);
    }

    inline void warning(const string &message, const string &module = "SYSTEM")
    {
        log(message, LogLevel::WARNING, module);
    }

    inline void info(const string &message, const string &module = "SYSTEM")
    {
        log(message, LogLevel::INFO, module);
    }

    inline void debug(const string &message, const string &module = "SYSTEM")
    {
        log(message, LogLevel::DEBUG, module);
    }

#define LOG_ERROR(message) logging::log(message, logging::LogLevel::ERROR, logging::extractModuleName(__PRETTY_FUNCTION__))
#define LOG_WARNING(message) logging::log(message, logging::LogLevel::WARNING, logging::extractModuleName(__PRETTY_FUNCTION__))
#define LOG_INFO(message) logging::log(message, logging::LogLevel::INFO, logging::extractModuleName(__PRETTY_FUNCTION__))
#define LOG_DEBUG(message) logging::log(message, logging::LogLevel::DEBUG, logging::extractModuleName(__PRETTY_FUNCTION__))

#define log_error(message) LOG_ERROR(message)
#define log_warning(message) LOG_WARNING(message)
#define log_info(message) LOG_INFO(message)
#define log_debug(message) LOG_DEBUG(message)

}
