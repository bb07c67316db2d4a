#pragma once

#include <string>
#include <vector>
#include <unordered_set>
#include <filesystem>

#include "ImportTypes.hpp"

struct ScanError
{
    std::string Path;
    IoFailure Error;
};

// Walks source roots and records path, size and mtime of every regular file.
// Never opens file content. Each Scan() call starts a fresh traversal.
class FileScanner
{
public:
    FileScanner() = default;

    void Clear();

    void Scan(const std::vector<std::string>& RootPaths);
    void Scan(const std::string& RootPath);
    void SetExcludes(const std::vector<std::string>& ExcludePaths);

    const std::vector<FileDescriptor>& GetFiles() const;
    const std::vector<ScanError>& GetErrors() const;
    uint64_t GetTotalBytes() const;

    static bool IsHousekeepingName(const std::string& FileName);
    static std::string ExtensionOf(const std::filesystem::path& Path);

private:
    std::vector<FileDescriptor> Files;
    std::vector<ScanError> Errors;
    std::vector<std::string> Excludes;
    std::unordered_set<std::string> SeenPaths;

    void ScanDirectoryIterative(const std::filesystem::path& Root);
    void AddFile(const std::filesystem::path& Path, uint64_t Size, std::filesystem::file_time_type WriteTime);
    void AddError(const std::string& Path, int Code, const std::string& Reason);

    bool IsExcluded(const std::filesystem::path& Path) const;
};
