#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <atomic>

enum class LogLevel
{
    INFO,
    WARN,
    ERROR
};

class Logger
{
public:
    Logger() = default;
    ~Logger();

    void Init(const std::string& logDir);
    // Messages below the minimum level are dropped. Defaults to INFO.
    void SetMinLevel(LogLevel Level);
    static bool LevelFromString(const std::string& Value, LogLevel& OutLevel);

    void Log(LogLevel Level, const std::string& Message);
    void Info(const std::string& Message);
    void Warn(const std::string& Message);
    void Error(const std::string& Message);
    void CleanupOldLogs();

    bool IsOpen() const;

    static std::string GetTimestampForFilename();

    std::string CurrentLogFilePath;

private:
    std::ofstream LogFile;
    mutable std::mutex LogWriteMutex;
    std::string LogDirectory;
    std::atomic<LogLevel> MinLevel{ LogLevel::INFO };

    std::string GetTimestamp() const;
    std::string LevelToString(LogLevel Level) const;

    void OpenLogFile(const std::string& FilePath);
};

extern Logger Log;
