#pragma once

#include <string>
#include <vector>
#include <cstdint>

class ConfigParser
{
public:
    ConfigParser() = default;
    bool Parse(const std::string& FilePath);

    const std::vector<std::string>& GetErrors() const;
    const std::vector<std::string>& GetInfos() const;
    const std::vector<std::string>& GetExcludes() const;
    const std::vector<std::string>& GetSources() const;
    void Reset();

    static bool IsAbsolutePath(const std::string& Path);
    static bool IsParentDirectory(const std::string& Parent, const std::string& Child);

private:
    void AddError(const std::string& Message);
    void AddInfo(const std::string& Message);
    // Prefixed with "Line N: "
    void AddLineError(int LineNumber, const std::string& Message);
    void AddLineInfo(int LineNumber, const std::string& Message);

    bool ParseCount(const std::string& Key, const std::string& Value, int LineNumber, unsigned long MinValue, unsigned long MaxValue, unsigned long& OutValue);
    bool ParseDelayList(const std::string& Value, int LineNumber, std::vector<uint32_t>& OutDelays);

    std::vector<std::string> Sources;
    std::vector<std::string> Excludes;
    std::vector<std::string> NetworkRoots;
    std::vector<std::string> LocalVolumes;
    std::vector<std::string> Errors;
    std::vector<std::string> Infos;
};
