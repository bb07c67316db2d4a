#include <iostream>
#include <filesystem>
#include <stack>
#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>

#include "FileScanner.hpp"
#include "TimeUtils.hpp"
#include "Logger.hpp"

namespace FS = std::filesystem;

namespace
{
    const std::array<const char*, 9> HousekeepingNames = {
        ".ds_store", "thumbs.db", "desktop.ini", ".spotlight-v100", ".trashes", ".fseventsd", "__macosx", ".git", ".svn"
    };

    std::string Lowered(std::string Value)
    {
        std::transform(Value.begin(), Value.end(), Value.begin(), [](unsigned char Ch) { return static_cast<char>(std::tolower(Ch)); });
        return Value;
    }
}

const std::vector<FileDescriptor>& FileScanner::GetFiles() const
{
    return Files;
}

const std::vector<ScanError>& FileScanner::GetErrors() const
{
    return Errors;
}

uint64_t FileScanner::GetTotalBytes() const
{
    uint64_t Total = 0;
    for (const auto& File : Files)
    {
        Total += File.Size;
    }
    return Total;
}

void FileScanner::Clear()
{
    Files.clear();
    Errors.clear();
    SeenPaths.clear();
}

void FileScanner::SetExcludes(const std::vector<std::string>& ExcludePaths)
{
    Excludes = ExcludePaths;
}

bool FileScanner::IsHousekeepingName(const std::string& FileName)
{
    const std::string Lower = Lowered(FileName);
    return std::find(HousekeepingNames.begin(), HousekeepingNames.end(), Lower) != HousekeepingNames.end();
}

std::string FileScanner::ExtensionOf(const FS::path& Path)
{
    std::string Extension = Path.extension().string();
    if (!Extension.empty() && Extension.front() == '.')
    {
        Extension.erase(0, 1);
    }
    return Lowered(Extension);
}

bool FileScanner::IsExcluded(const FS::path& Path) const
{
    std::error_code ec;
    const std::string Abs = FS::absolute(Path, ec).lexically_normal().string();
    for (const auto& Exclude : Excludes)
    {
        if (Abs == Exclude)
        {
            return true;
        }
    }
    return false;
}

void FileScanner::AddError(const std::string& Path, int Code, const std::string& Reason)
{
    ScanError Entry;
    Entry.Path = Path;
    Entry.Error.Category = FailureCategory::Scan;
    Entry.Error.Code = Code;
    Entry.Error.Reason = Reason;
    Errors.push_back(std::move(Entry));
    Log.Error("[Scanner] " + Reason + " Path: " + Path);
}

void FileScanner::AddFile(const FS::path& Path, uint64_t Size, FS::file_time_type WriteTime)
{
    std::error_code ec;
    FS::path Absolute = FS::absolute(Path, ec).lexically_normal();
    std::string Key = Absolute.string();

    // Overlapping roots must not produce two descriptors for one file
    if (!SeenPaths.insert(Key).second)
    {
        return;
    }

    FileDescriptor Descriptor;
    Descriptor.SourcePath = Key;
    Descriptor.Extension = ExtensionOf(Absolute);
    Descriptor.Size = Size;
    Descriptor.MTime = ToUnixSeconds(WriteTime);
    Files.push_back(std::move(Descriptor));
}

void FileScanner::Scan(const std::vector<std::string>& RootPaths)
{
    Clear();
    for (const auto& Root : RootPaths)
    {
        Scan(Root);
    }
    Log.Info("[Scanner] Scanned " + std::to_string(Files.size()) + " files, " + std::to_string(Errors.size()) + " errors");
}

void FileScanner::Scan(const std::string& RootPath)
{
    FS::path Root(RootPath);
    try
    {
        std::error_code ec;
        FS::file_status Status = FS::status(Root, ec);
        if (ec || !FS::exists(Status))
        {
            int Code = ec ? ec.value() : ENOENT;
            std::cerr << "Scan Error: Path does not exist: " << Root.string() << "\n";
            AddError(Root.string(), Code, "Path not found or not accessible" + (ec ? " (" + ec.message() + ")" : std::string()));
            return;
        }
        if (IsExcluded(Root))
        {
            Log.Info("[Scanner] Skipping excluded root path: " + Root.string());
            return;
        }
        if (FS::is_regular_file(Status)) // Single file case
        {
            AddFile(Root, FS::file_size(Root), FS::last_write_time(Root));
            return;
        }
        if (!FS::is_directory(Status))
        {
            std::cerr << "Scan Error: Path is neither a directory nor a file: " << Root.string() << "\n";
            AddError(Root.string(), EINVAL, "Path is neither a directory nor a file");
            return;
        }
        ScanDirectoryIterative(Root);
    }
    catch (const FS::filesystem_error& e)
    {
        std::cerr << "Filesystem error during scan: " << e.what() << "\n";
        AddError(Root.string(), e.code().value(), std::string("Filesystem error during scan: ") + e.what());
    }
}

void FileScanner::ScanDirectoryIterative(const FS::path& Root)
{
    std::stack<FS::path> DirStack;
    DirStack.push(Root);
    while (!DirStack.empty())
    {
        FS::path Current = DirStack.top();
        DirStack.pop();

        if (IsExcluded(Current))
        {
            Log.Info(std::string("[Scanner] Skipping Excluded Directory: ") + Current.string());
            continue;
        }
        try
        {
            for (const auto& Entry : FS::directory_iterator(Current))
            {
                try
                {
                    const FS::path& EntryPath = Entry.path();
                    // Skip symbolic links to avoid loops and escapes from the root.
                    if (FS::is_symlink(Entry.symlink_status()))
                    {
                        Log.Info(std::string("[Scanner] Skipping SymLink: ") + EntryPath.string());
                        continue;
                    }
                    if (IsHousekeepingName(EntryPath.filename().string()))
                    {
                        continue;
                    }
                    if (IsExcluded(EntryPath))
                    {
                        Log.Info(std::string("[Scanner] Skipping Excluded Path: ") + EntryPath.string());
                        continue;
                    }
                    if (Entry.is_directory())
                    {
                        DirStack.push(EntryPath);
                    }
                    else if (Entry.is_regular_file())
                    {
                        AddFile(EntryPath, Entry.file_size(), Entry.last_write_time());
                    }
                }
                catch (const FS::filesystem_error& e)
                {
                    std::cerr << "Filesystem error accessing entry: " << e.what() << " Path: " << Entry.path() << "\n";
                    AddError(Entry.path().string(), e.code().value(), std::string("Filesystem error accessing entry: ") + e.what());
                }
            }
        }
        catch (const FS::filesystem_error& e)
        {
            std::cerr << "Filesystem error iterating directory: " << e.what() << " Path: " << Current << "\n";
            AddError(Current.string(), e.code().value(), std::string("Filesystem error iterating directory: ") + e.what());
        }
    }
}
