#include "restgate/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

ServerLogger::ServerLogger()
    : minLevel(LogLevel::SERVER_INFO), historyLimit(1000), quietMode(false),
      showRequestDetails(true), consoleOutput(true)
{
}

ServerLogger::~ServerLogger()
{
    if (logFile.is_open())
    {
        logFile.close();
    }
}

ServerLogger &ServerLogger::instance()
{
    static ServerLogger instance;
    return instance;
}

void ServerLogger::setLevel(LogLevel level)
{
    std::lock_guard<std::mutex> lock(logMutex);
    minLevel = level;
}

LogLevel ServerLogger::getLevel() const
{
    std::lock_guard<std::mutex> lock(logMutex);
    return minLevel;
}

LogLevel ServerLogger::parseLevel(const std::string &name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "ERROR")
        return LogLevel::SERVER_ERROR;
    if (upper == "WARN" || upper == "WARNING")
        return LogLevel::SERVER_WARNING;
    if (upper == "DEBUG")
        return LogLevel::SERVER_DEBUG;
    return LogLevel::SERVER_INFO;
}

void ServerLogger::setQuietMode(bool enabled)
{
    std::lock_guard<std::mutex> lock(logMutex);
    quietMode = enabled;
}

void ServerLogger::setShowRequestDetails(bool enabled)
{
    std::lock_guard<std::mutex> lock(logMutex);
    showRequestDetails = enabled;
}

void ServerLogger::setConsoleOutput(bool enabled)
{
    std::lock_guard<std::mutex> lock(logMutex);
    consoleOutput = enabled;
}

bool ServerLogger::setLogFile(const std::string &filePath)
{
    std::lock_guard<std::mutex> lock(logMutex);

    // Close existing file if open
    if (logFile.is_open())
    {
        logFile.close();
    }

    logFilePath = filePath;
    logFile.open(filePath, std::ios::app);

    if (!logFile.is_open())
    {
        std::cerr << "Failed to open log file: " << filePath << std::endl;
        return false;
    }

    return true;
}

void ServerLogger::setHistoryLimit(size_t limit)
{
    std::lock_guard<std::mutex> lock(logMutex);
    historyLimit = limit;
    while (logs.size() > historyLimit)
    {
        logs.pop_front();
    }
}

void ServerLogger::error(const std::string &message)
{
    log(LogLevel::SERVER_ERROR, message);
}

void ServerLogger::warning(const std::string &message)
{
    log(LogLevel::SERVER_WARNING, message);
}

void ServerLogger::info(const std::string &message)
{
    log(LogLevel::SERVER_INFO, message);
}

void ServerLogger::debug(const std::string &message)
{
    log(LogLevel::SERVER_DEBUG, message);
}

void ServerLogger::error(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    logv(LogLevel::SERVER_ERROR, format, args);
    va_end(args);
}

void ServerLogger::warning(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    logv(LogLevel::SERVER_WARNING, format, args);
    va_end(args);
}

void ServerLogger::info(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    logv(LogLevel::SERVER_INFO, format, args);
    va_end(args);
}

void ServerLogger::debug(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    logv(LogLevel::SERVER_DEBUG, format, args);
    va_end(args);
}

void ServerLogger::logError(const std::string &message)
{
    instance().error(message);
}

void ServerLogger::logWarning(const std::string &message)
{
    instance().warning(message);
}

void ServerLogger::logInfo(const std::string &message)
{
    instance().info(message);
}

void ServerLogger::logDebug(const std::string &message)
{
    instance().debug(message);
}

void ServerLogger::logError(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    instance().logv(LogLevel::SERVER_ERROR, format, args);
    va_end(args);
}

void ServerLogger::logWarning(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    instance().logv(LogLevel::SERVER_WARNING, format, args);
    va_end(args);
}

void ServerLogger::logInfo(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    instance().logv(LogLevel::SERVER_INFO, format, args);
    va_end(args);
}

void ServerLogger::logDebug(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    instance().logv(LogLevel::SERVER_DEBUG, format, args);
    va_end(args);
}

// Formatting is skipped for levels that would be filtered anyway
void ServerLogger::logv(LogLevel level, const char *format, va_list args)
{
    if (level > getLevel())
        return;
    log(level, formatString(format, args));
}

std::vector<LogEntry> ServerLogger::getLogs() const
{
    std::lock_guard<std::mutex> lock(logMutex);
    return std::vector<LogEntry>(logs.begin(), logs.end());
}

std::string ServerLogger::formatString(const char *format, va_list args)
{
    va_list argsCopy;
    va_copy(argsCopy, args);
    int size = vsnprintf(nullptr, 0, format, argsCopy) + 1; // +1 for null terminator
    va_end(argsCopy);

    if (size <= 0)
    {
        return "Error formatting string";
    }

    std::vector<char> buffer(size);

    vsnprintf(buffer.data(), size, format, args);

    return std::string(buffer.data(), buffer.data() + size - 1);
}

void ServerLogger::log(LogLevel level, const std::string &message)
{
    std::lock_guard<std::mutex> lock(logMutex);

    // Skip if level is below minimum
    if (level > minLevel)
    {
        return;
    }

    // Filter out routine per-request messages in quiet mode
    if (quietMode && level == LogLevel::SERVER_INFO)
    {
        if (message.find("New client connection") != std::string::npos ||
            message.find("Dispatching") != std::string::npos ||
            message.find("Completed request") != std::string::npos)
        {
            return;
        }
    }

    // Filter request details if disabled
    if (!showRequestDetails && level == LogLevel::SERVER_INFO)
    {
        if (message.find("[Conn ") != std::string::npos ||
            message.find("Content-Length:") != std::string::npos ||
            message.find("Rate limit check") != std::string::npos ||
            message.find("CORS preflight") != std::string::npos)
        {
            return;
        }
    }

    std::string timestamp = getCurrentTimestamp();
    std::string levelStr = levelToString(level);

    std::ostringstream logStream;
    logStream << "[" << timestamp << "] [" << levelStr << "] " << message;
    std::string formattedMessage = logStream.str();

    logs.push_back(LogEntry{level, timestamp, message});
    while (logs.size() > historyLimit)
    {
        logs.pop_front();
    }

    if (consoleOutput)
    {
        std::cout << formattedMessage << std::endl;
    }

    if (logFile.is_open())
    {
        logFile << formattedMessage << std::endl;
        logFile.flush();
    }
}

std::string ServerLogger::levelToString(LogLevel level)
{
    switch (level)
    {
    case LogLevel::SERVER_ERROR:
        return "ERROR";
    case LogLevel::SERVER_WARNING:
        return "WARNING";
    case LogLevel::SERVER_INFO:
        return "INFO";
    case LogLevel::SERVER_DEBUG:
        return "DEBUG";
    default:
        return "UNKNOWN";
    }
}

std::string ServerLogger::getCurrentTimestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) %
              1000;

    std::tm localTm{};
#ifdef _WIN32
    localtime_s(&localTm, &time_t);
#else
    localtime_r(&time_t, &localTm);
#endif

    std::stringstream ss;
    ss << std::put_time(&localTm, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}
