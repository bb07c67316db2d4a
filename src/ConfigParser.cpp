#include <iostream>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>

#include "ConfigParser.hpp"
#include "ConfigGlobal.hpp"
#include "HardwareProfile.hpp"
#include "Logger.hpp"

namespace FS = std::filesystem;

namespace
{
    std::string Trimmed(std::string Value)
    {
        Value.erase(Value.begin(), std::find_if(Value.begin(), Value.end(), [](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }));
        Value.erase(std::find_if(Value.rbegin(), Value.rend(), [](char Ch) { return !std::isspace(static_cast<unsigned char>(Ch)); }).base(), Value.end());
        return Value;
    }
}

const std::vector<std::string>& ConfigParser::GetSources() const
{
    return Sources;
}

const std::vector<std::string>& ConfigParser::GetExcludes() const
{
    return Excludes;
}

const std::vector<std::string>& ConfigParser::GetErrors() const
{
    return Errors;
}

const std::vector<std::string>& ConfigParser::GetInfos() const
{
    return Infos;
}

void ConfigParser::Reset()
{
    Sources.clear();
    Excludes.clear();
    NetworkRoots.clear();
    LocalVolumes.clear();
    Errors.clear();
    Infos.clear();

    std::string ConfigFile = ConfigGlobal::ConfigFile;
    ConfigGlobal::InitializeDefaults();
    ConfigGlobal::ConfigFile = ConfigFile;
}

void ConfigParser::AddError(const std::string& Message)
{
    Errors.push_back(Message);
}

void ConfigParser::AddInfo(const std::string& Message)
{
    Infos.push_back(Message);
}

void ConfigParser::AddLineError(int LineNumber, const std::string& Message)
{
    AddError("Line " + std::to_string(LineNumber) + ": " + Message);
}

void ConfigParser::AddLineInfo(int LineNumber, const std::string& Message)
{
    AddInfo("Line " + std::to_string(LineNumber) + ": " + Message);
}

bool ConfigParser::IsAbsolutePath(const std::string& Path)
{
    return !Path.empty() && Path[0] == '/';
}

bool ConfigParser::IsParentDirectory(const std::string& Parent, const std::string& Child)
{
    std::error_code ec;
    auto ParentAbs = FS::absolute(FS::path(Parent), ec).lexically_normal();
    if (ec)
    {
        return false;
    }
    auto ChildAbs = FS::absolute(FS::path(Child), ec).lexically_normal();
    if (ec)
    {
        return false;
    }

    auto ParentIt = ParentAbs.begin();
    auto ChildIt = ChildAbs.begin();

    for (; ParentIt != ParentAbs.end() && ChildIt != ChildAbs.end(); ++ParentIt, ++ChildIt)
    {
        // "/a/b/" normalizes with an empty trailing element
        if (ParentIt->empty())
        {
            break;
        }
        if (*ParentIt != *ChildIt)
            return false;
    }
    return ParentIt == ParentAbs.end() || ParentIt->empty();
}

bool ConfigParser::ParseCount(const std::string& Key, const std::string& Value, int LineNumber, unsigned long MinValue, unsigned long MaxValue, unsigned long& OutValue)
{
    try
    {
        size_t Consumed = 0;
        unsigned long ValueNum = std::stoul(Value, &Consumed);
        if (Consumed != Value.size() || ValueNum < MinValue || ValueNum > MaxValue)
        {
            AddLineError(LineNumber, "" + Key + " must be between " + std::to_string(MinValue) + " and " + std::to_string(MaxValue) + ".");
            return false;
        }
        OutValue = ValueNum;
        return true;
    }
    catch (const std::exception&)
    {
        AddLineError(LineNumber, "Invalid number for " + Key + ".");
        return false;
    }
}

bool ConfigParser::ParseDelayList(const std::string& Value, int LineNumber, std::vector<uint32_t>& OutDelays)
{
    std::vector<uint32_t> Delays;
    std::stringstream Stream(Value);
    std::string Item;

    while (std::getline(Stream, Item, ','))
    {
        unsigned long Delay = 0;
        if (!ParseCount("RetryDelaysMs", Trimmed(Item), LineNumber, 0, 600000, Delay))
        {
            return false;
        }
        Delays.push_back(static_cast<uint32_t>(Delay));
    }

    if (Delays.empty())
    {
        AddLineError(LineNumber, "RetryDelaysMs needs at least one delay.");
        return false;
    }
    OutDelays = std::move(Delays);
    return true;
}

bool ConfigParser::Parse(const std::string& FilePath)
{
    if (!std::filesystem::exists(FilePath))
    {
        AddError("Config file does not exist: " + FilePath);
        return false;
    }

    std::ifstream File(FilePath);
    if (!File.is_open())
    {
        AddError("Failed to open config file: " + FilePath);
        return false;
    }

    std::string Line;
    int LineNumber = 0;

    while (std::getline(File, Line))
    {
        LineNumber++;

        Line = Trimmed(Line);
        if (Line.empty() || Line[0] == '#')
        {
            continue;
        }

        size_t EqualPos = Line.find('=');
        if (EqualPos == std::string::npos)
        {
            AddLineError(LineNumber, "Expected Key = Value.");
            continue;
        }

        std::string Key = Line.substr(0, EqualPos);
        std::string Value = Trimmed(Line.substr(EqualPos + 1));

        Key.erase(std::remove_if(Key.begin(), Key.end(), [](char Ch) { return std::isspace(static_cast<unsigned char>(Ch)); }), Key.end());

        if (Key == "Source")
        {
            if (!IsAbsolutePath(Value))
            {
                AddLineError(LineNumber, "Source path is not absolute.");
                continue;
            }
            FS::path SourcePath(Value);
            std::error_code ec;
            if (!FS::exists(SourcePath, ec))
            {
                AddLineError(LineNumber, "Source path does not exist. " + ec.message());
                continue;
            }
            if (!FS::is_directory(SourcePath, ec) && !FS::is_regular_file(SourcePath, ec))
            {
                AddLineError(LineNumber, "Source path is neither a file nor a directory.");
                continue;
            }

            if (std::find(Sources.begin(), Sources.end(), Value) != Sources.end())
            {
                AddLineInfo(LineNumber, "Duplicate source path '" + Value + "'. Ignored.");
                continue;
            }

            bool ConflictFound = false;
            for (const auto& ExistingSource : Sources)
            {
                if (IsParentDirectory(ExistingSource, Value))
                {
                    AddLineInfo(LineNumber, "Skipping source '" + Value + "' because parent directory '" + ExistingSource + "' is already added.");
                    ConflictFound = true;
                    break;
                }
                else if (IsParentDirectory(Value, ExistingSource)) //Files under both would be read twice
                {
                    AddLineInfo(LineNumber, "Skipping parent directory '" + Value + "' because '" + ExistingSource + "' is already added.");
                    ConflictFound = true;
                    break;
                }
            }
            if (ConflictFound)
            {
                continue;
            }
            Sources.push_back(Value);
        }

        else if (Key == "Destination")
        {
            if (!IsAbsolutePath(Value))
            {
                AddLineError(LineNumber, "Destination path is not absolute.");
                continue;
            }
            if (!ConfigGlobal::DestinationPath.empty())
            {
                AddLineError(LineNumber, "Multiple destination entries found.");
                continue;
            }
            std::error_code ec;
            FS::path DestPath(Value);
            if (!FS::exists(DestPath, ec))
            {
                AddLineError(LineNumber, "Destination path does not exist.");
                continue;
            }
            if (!FS::is_directory(DestPath, ec))
            {
                AddLineError(LineNumber, "Destination path is not a directory.");
                continue;
            }
            ConfigGlobal::DestinationPath = Value;
        }

        else if (Key == "Collection")
        {
            if (Value.empty())
            {
                AddLineError(LineNumber, "Collection must not be empty.");
                continue;
            }
            ConfigGlobal::Collection = Value;
            AddInfo("Collection set to '" + Value + "'");
        }

        else if (Key == "Exclude")
        {
            if (!IsAbsolutePath(Value))
            {
                AddLineError(LineNumber, "Exclude path is not absolute.");
                continue;
            }
            if (std::find(Excludes.begin(), Excludes.end(), Value) != Excludes.end())
            {
                AddLineInfo(LineNumber, "Duplicate exclude path '" + Value + "'. Ignored.");
                continue;
            }
            Excludes.push_back(Value);
        }

        else if (Key == "NetworkRoot")
        {
            if (!IsAbsolutePath(Value))
            {
                AddLineError(LineNumber, "NetworkRoot is not absolute.");
                continue;
            }
            NetworkRoots.push_back(Value);
        }

        else if (Key == "LocalVolume")
        {
            if (Value.empty())
            {
                AddLineError(LineNumber, "LocalVolume must not be empty.");
                continue;
            }
            LocalVolumes.push_back(Value);
        }

        else if (Key == "Tier")
        {
            CapabilityTier Forced;
            if (Value == "Auto")
            {
                ConfigGlobal::Tier = "Auto";
                AddInfo("Tier set to 'Auto' (detected from CPU cores and memory).");
            }
            else if (TierFromString(Value, Forced))
            {
                ConfigGlobal::Tier = Value;
                AddInfo("Tier forced to '" + TierToString(Forced) + "'.");
            }
            else
            {
                AddLineError(LineNumber, "Invalid Tier. Use 'Auto', 'Low', 'Medium', 'High' or 'Beast'.");
            }
        }

        else if (Key == "LogDir")
        {
            if (Value.empty())
            {
                AddLineError(LineNumber, "LogDir must not be empty.");
                continue;
            }
            ConfigGlobal::LogDir = Value;
        }

        else if (Key == "LogLevel")
        {
            LogLevel Level;
            if (!Logger::LevelFromString(Value, Level))
            {
                AddLineError(LineNumber, "Invalid LogLevel. Use 'Info', 'Warn' or 'Error'.");
                continue;
            }
            ConfigGlobal::LogLevel = Value;
        }

        else if (Key == "IndexDir")
        {
            if (Value.empty())
            {
                AddLineError(LineNumber, "IndexDir must not be empty.");
                continue;
            }
            ConfigGlobal::IndexDir = Value;
        }

        else if (Key == "MaxLogFiles")
        {
            unsigned long ValueNum = 0;
            if (ParseCount(Key, Value, LineNumber, 1, 65535, ValueNum))
            {
                ConfigGlobal::MaxLogFiles = static_cast<unsigned short int>(ValueNum);
                AddInfo("MaxLogFiles set to " + std::to_string(ValueNum));
            }
        }

        else if (Key == "CopyBufferKB")
        {
            unsigned long ValueNum = 0;
            if (ParseCount(Key, Value, LineNumber, 4, 65536, ValueNum))
            {
                ConfigGlobal::CopyBufferSize = static_cast<size_t>(ValueNum) * 1024;
                AddInfo("CopyBufferKB set to " + std::to_string(ValueNum));
            }
        }

        else if (Key == "MaxRetries")
        {
            unsigned long ValueNum = 0;
            if (ParseCount(Key, Value, LineNumber, 0, 100, ValueNum))
            {
                ConfigGlobal::MaxRetries = static_cast<unsigned short int>(ValueNum);
                AddInfo("MaxRetries set to " + std::to_string(ValueNum));
            }
        }

        else if (Key == "RetryDelaysMs")
        {
            std::vector<uint32_t> Delays;
            if (ParseDelayList(Value, LineNumber, Delays))
            {
                ConfigGlobal::RetryDelaysMs = Delays;
                AddInfo("RetryDelaysMs set to " + Value);
            }
        }

        else
        {
            AddLineError(LineNumber, "Unknown key '" + Key + "'.");
            continue;
        }
    }

    if (!NetworkRoots.empty())
    {
        ConfigGlobal::NetworkRoots = NetworkRoots;
    }
    if (!LocalVolumes.empty())
    {
        ConfigGlobal::LocalVolumes = LocalVolumes;
    }
    ConfigGlobal::IndexFileName = FS::path(ConfigGlobal::IndexDir) / "ArchiveIndex.bin";

    if (Sources.empty())
    {
        AddError("No source paths provided.");
    }

    if (ConfigGlobal::DestinationPath.empty())
    {
        AddError("No destination path provided.");
    }
    else
    {
        FS::path DestAbs = FS::absolute(ConfigGlobal::DestinationPath).lexically_normal();

        for (const auto& Source : Sources)
        {
            FS::path SourceAbs = FS::absolute(Source).lexically_normal();

            if (SourceAbs == DestAbs)
            {
                AddError("Source path '" + Source + "' is the same as the destination path.");
            }
            else if (IsParentDirectory(SourceAbs.string(), DestAbs.string()))
            {
                AddError("Destination '" + DestAbs.string() + "' is inside source directory '" + SourceAbs.string() + "'. This is not allowed.");
            }
        }
    }
    return Errors.empty();  // Return false only if fatal errors present
}
