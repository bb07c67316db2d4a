#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>

namespace ConfigGlobal
{
    extern std::string ConfigFile;
    extern std::string LogDir;
    extern std::string LogLevel;
    extern std::string IndexDir;
    extern std::string DestinationPath;
    extern std::string Collection;
    extern std::string Tier;

    extern std::vector<std::string> NetworkRoots;
    extern std::vector<std::string> LocalVolumes;

    extern unsigned short int MaxLogFiles;
    extern unsigned short int MaxRetries;
    extern std::vector<uint32_t> RetryDelaysMs;
    extern size_t CopyBufferSize;

    extern std::filesystem::path IndexFileName;

    void InitializeDefaults();
}
