#include "ConfigGlobal.hpp"

namespace ConfigGlobal
{
    std::string ConfigFile;
    std::string LogDir;
    std::string LogLevel;
    std::string IndexDir;
    std::string DestinationPath;
    std::string Collection;
    std::string Tier;

    std::vector<std::string> NetworkRoots;
    std::vector<std::string> LocalVolumes;

    unsigned short int MaxLogFiles;
    unsigned short int MaxRetries;
    std::vector<uint32_t> RetryDelaysMs;
    size_t CopyBufferSize;

    std::filesystem::path IndexFileName;

    void InitializeDefaults()
    {
        ConfigFile = "Config.txt"; //Relative to the working directory unless an absolute path is given on the command line
        LogDir = "Import_Logs";
        LogLevel = "Info";
        IndexDir = "Archive_Index";
        DestinationPath.clear();
        Collection = "default";
        Tier = "Auto";

        NetworkRoots = { "/Volumes/", "/mnt/", "/media/", "/net/" };
        LocalVolumes = { "macintosh hd", "ssd", "internal", "system", "data" };

        MaxLogFiles = 10;
        MaxRetries = 3;
        RetryDelaysMs = { 1000, 3000, 5000 };
        CopyBufferSize = 1024 * 1024; // 1MB chunks keep round-trips to SMB/NFS shares low

        IndexFileName = std::filesystem::path(IndexDir) / "ArchiveIndex.bin";
    }
}
