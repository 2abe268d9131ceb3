#pragma once

#include "export.hpp"

#include <string>
#include <vector>
#include <deque>
#include <fstream>
#include <mutex>
#include <cstdarg>

enum class LogLevel {
	SERVER_ERROR,
	SERVER_WARNING,
	SERVER_INFO,
	SERVER_DEBUG
};

struct LogEntry {
	LogLevel level;
	std::string timestamp;
	std::string message;
};

class RESTGATE_SERVER_API ServerLogger {
public:
	static ServerLogger& instance();

	ServerLogger(const ServerLogger&) = delete;
	ServerLogger& operator=(const ServerLogger&) = delete;
	ServerLogger(ServerLogger&&) = delete;
	ServerLogger& operator=(ServerLogger&&) = delete;

	// Set minimum log level
	void setLevel(LogLevel level);
	LogLevel getLevel() const;

	// Parse "DEBUG", "INFO", "WARN"/"WARNING", "ERROR"; unknown names map to INFO
	static LogLevel parseLevel(const std::string& name);

	// Configure quiet mode settings
	void setQuietMode(bool enabled);
	void setShowRequestDetails(bool enabled);

	// Console echo can be turned off (tests, daemonized runs with a log file)
	void setConsoleOutput(bool enabled);

	// Set log file path
	bool setLogFile(const std::string& filePath);

	// Number of entries kept in memory for getLogs()
	void setHistoryLimit(size_t limit);

	// Log methods
	void error(const std::string& message);
	void warning(const std::string& message);
	void info(const std::string& message);
	void debug(const std::string& message);

	void error(const char* format, ...);
	void warning(const char* format, ...);
	void info(const char* format, ...);
	void debug(const char* format, ...);

	static void logError(const std::string& message);
	static void logWarning(const std::string& message);
	static void logInfo(const std::string& message);
	static void logDebug(const std::string& message);

	static void logError(const char* format, ...);
	static void logWarning(const char* format, ...);
	static void logInfo(const char* format, ...);
	static void logDebug(const char* format, ...);

	// Snapshot of stored logs
	std::vector<LogEntry> getLogs() const;

	// "ERROR", "WARNING", "INFO" or "DEBUG"
	static std::string levelToString(LogLevel level);

private:
	// Private constructor for singleton
	ServerLogger();
	~ServerLogger();

	void log(LogLevel level, const std::string& message);

	static std::string formatString(const char* format, va_list args);
	void logv(LogLevel level, const char* format, va_list args);

	// Get current timestamp
	static std::string getCurrentTimestamp();

	LogLevel minLevel;
#pragma warning(push)
#pragma warning(disable: 4251)
	std::deque<LogEntry> logs;
	std::ofstream logFile;
	std::string logFilePath;
#pragma warning(pop)
	mutable std::mutex logMutex;
	size_t historyLimit;

	// Quiet mode settings
	bool quietMode;
	bool showRequestDetails;
	bool consoleOutput;
};
