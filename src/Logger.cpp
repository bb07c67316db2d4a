#include "Logger.hpp"
#include "ConfigGlobal.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <iostream>
#include <vector>
#include <algorithm>

Logger Log;
namespace FS = std::filesystem;

void Logger::Init(const std::string& logDir)
{
    std::error_code ec;
    FS::create_directories(logDir, ec);
    if (ec)
    {
        std::cerr << "Logger: Failed to create log directory: " << logDir << " (" << ec.message() << ")\n";
    }

    LogDirectory = logDir;
    CurrentLogFilePath = (FS::path(logDir) / ("Import_Log" + GetTimestampForFilename() + ".txt")).string();

    OpenLogFile(CurrentLogFilePath);

    Info("Import Started at " + GetTimestamp());
}

Logger::~Logger()
{
    if (LogFile.is_open())
    {
        Info("Import Finished at " + GetTimestamp());
        LogFile.close();
    }
}

void Logger::OpenLogFile(const std::string& FilePath)
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);
    LogFile.open(FilePath, std::ios::out);

    if (!LogFile.is_open())
    {
        std::cerr << "Logger: Failed to open log file: " << FilePath << "\n";
    }
}

bool Logger::IsOpen() const
{
    std::lock_guard<std::mutex> Lock(LogWriteMutex);
    return LogFile.is_open();
}

void Logger::CleanupOldLogs()
{
    if (LogDirectory.empty())
    {
        return;
    }

    std::vector<FS::directory_entry> Logs;
    std::error_code ec;

    for (const auto& Entry : FS::directory_iterator(LogDirectory, ec))
    {
        if (Entry.is_regular_file() && Entry.path().filename().string().find("Import_Log") == 0)
        {
            Logs.push_back(Entry);
        }
    }

    if ((int)Logs.size() <= ConfigGlobal::MaxLogFiles)
    {
        return;
    }

    // Timestamped names sort oldest first
    std::sort(Logs.begin(), Logs.end(), [](const FS::directory_entry& A, const FS::directory_entry& B)
    {
            return A.path().filename().string() < B.path().filename().string();
    });

    while ((int)Logs.size() > ConfigGlobal::MaxLogFiles)
    {
        std::error_code RemoveError;
        if (!FS::remove(Logs.front(), RemoveError) && RemoveError)
        {
            std::cerr << "Logger: Failed to remove old log: " << Logs.front().path().string() << " (" << RemoveError.message() << ")\n";
        }
        Logs.erase(Logs.begin());
    }
}

void Logger::Log(LogLevel Level, const std::string& Message)
{
    if (static_cast<int>(Level) < static_cast<int>(MinLevel.load()))
    {
        return;
    }

    std::lock_guard<std::mutex> Lock(LogWriteMutex);

    if (!LogFile.is_open())
    {
        return;
    }

    LogFile << "[" << GetTimestamp() << "]" << " [" << LevelToString(Level) << "] " << Message << "\n";
    LogFile.flush();
}

void Logger::SetMinLevel(LogLevel Level)
{
    MinLevel = Level;
}

bool Logger::LevelFromString(const std::string& Value, LogLevel& OutLevel)
{
    if (Value == "Info")
    {
        OutLevel = LogLevel::INFO;
    }
    else if (Value == "Warn")
    {
        OutLevel = LogLevel::WARN;
    }
    else if (Value == "Error")
    {
        OutLevel = LogLevel::ERROR;
    }
    else
    {
        return false;
    }
    return true;
}

void Logger::Info(const std::string& Message)
{
    Log(LogLevel::INFO, Message);
}

void Logger::Warn(const std::string& Message)
{
    Log(LogLevel::WARN, Message);
}

void Logger::Error(const std::string& Message)
{
    Log(LogLevel::ERROR, Message);
}

namespace
{
    std::string FormatLocalNow(const char* Pattern)
    {
        std::time_t Time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm Local{};
        localtime_r(&Time, &Local);

        std::ostringstream Stream;
        Stream << std::put_time(&Local, Pattern);
        return Stream.str();
    }
}

std::string Logger::GetTimestampForFilename()
{
    return FormatLocalNow("%Y%m%d_%H%M%S");
}

std::string Logger::GetTimestamp() const
{
    return FormatLocalNow("%Y-%m-%d %H:%M:%S");
}

std::string Logger::LevelToString(LogLevel Level) const
{
    switch (Level)
    {
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    default:              return "UNKNOWN";
    }
}
