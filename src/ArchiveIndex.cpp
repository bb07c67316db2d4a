#include "ArchiveIndex.hpp"
#include "Logger.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace FS = std::filesystem;

namespace
{
    constexpr uint32_t MaxStringLength = 4096;

    template<typename T>
    bool ReadBinary(std::ifstream& stream, T& value)
    {
        return static_cast<bool>(stream.read(reinterpret_cast<char*>(&value), sizeof(T)));
    }

    template<typename T>
    bool WriteBinary(std::ofstream& stream, const T& value)
    {
        return static_cast<bool>(stream.write(reinterpret_cast<const char*>(&value), sizeof(T)));
    }

    bool ReadString(std::ifstream& stream, std::string& value)
    {
        uint32_t len = 0;
        if (!ReadBinary(stream, len)) return false;
        if (len > MaxStringLength) return false;
        value.assign(len, '\0');
        if (len == 0) return true;
        return static_cast<bool>(stream.read(&value[0], len));
    }

    bool WriteString(std::ofstream& stream, const std::string& value)
    {
        uint32_t len = static_cast<uint32_t>(value.size());
        if (!WriteBinary(stream, len)) return false;
        return static_cast<bool>(stream.write(value.data(), len));
    }
}

ArchiveIndex::ArchiveIndex(const std::string& indexFilePath) : IndexFilePath(indexFilePath)
{
    EnsureIndexDirExists();
}

const std::string& ArchiveIndex::GetFilePath() const
{
    return IndexFilePath;
}

void ArchiveIndex::EnsureIndexDirExists()
{
    auto dir = FS::path(IndexFilePath).parent_path();
    if (dir.empty())
    {
        return;
    }

    std::error_code ec;
    FS::create_directories(dir, ec);
    if (ec)
    {
        std::cerr << "ArchiveIndex: Failed to create index directory: " << ec.message() << "\n";
        Log.Error(std::string("[ArchiveIndex] Failed to create index directory: ") + dir.string() + " - " + ec.message());
    }
}

// Loads every complete record. A torn trailing record from an interrupted write is dropped.
bool ArchiveIndex::Load()
{
    std::lock_guard lock(IndexMutex);
    Entries.clear();

    if (IndexFilePath.empty())
    {
        return true;
    }

    std::ifstream file(IndexFilePath, std::ios::binary);
    if (!file)
    {
        Log.Info(std::string("[ArchiveIndex::Load] Starting Fresh. No Index File Found at: ") + IndexFilePath);
        return true;
    }

    std::streamoff goodOffset = 0;
    bool torn = false;

    while (file.peek() != std::ifstream::traits_type::eof())
    {
        ArchiveEntry entry;
        if (!ReadString(file, entry.Identity) ||
            !ReadString(file, entry.RelativePath) ||
            !ReadBinary(file, entry.Size) ||
            !ReadBinary(file, entry.IngestedAt) ||
            !ReadString(file, entry.Collection))
        {
            Log.Warn(std::string("[ArchiveIndex::Load] Ignoring incomplete trailing record in: ") + IndexFilePath);
            torn = true;
            break;
        }

        if (entry.Identity.empty())
        {
            Log.Error(std::string("[ArchiveIndex::Load] Invalid record with empty identity in: ") + IndexFilePath);
            return false;
        }

        // First record for an identity wins
        Entries.emplace(entry.Identity, std::move(entry));
        goodOffset = file.tellg();
    }
    file.close();

    // Cut the torn tail so later appends start on a record boundary
    if (torn)
    {
        std::error_code ec;
        FS::resize_file(IndexFilePath, static_cast<std::uintmax_t>(goodOffset), ec);
        if (ec)
        {
            Log.Error(std::string("[ArchiveIndex::Load] Failed to truncate torn record: ") + ec.message());
            return false;
        }
    }

    Log.Info(std::string("[ArchiveIndex::Load] Finished Loading ") + std::to_string(Entries.size()) + std::string(" entries."));
    return true;
}

bool ArchiveIndex::Lookup(const std::string& Identity, ArchiveEntry& OutEntry) const
{
    std::lock_guard lock(IndexMutex);
    auto it = Entries.find(Identity);
    if (it == Entries.end())
    {
        return false;
    }
    OutEntry = it->second;
    return true;
}

InsertResult ArchiveIndex::Insert(const ArchiveEntry& Entry)
{
    std::lock_guard lock(IndexMutex);

    if (Entries.find(Entry.Identity) != Entries.end())
    {
        return InsertResult::AlreadyExists;
    }

    if (!AppendRecord(Entry))
    {
        Log.Error(std::string("[ArchiveIndex::Insert] Failed to persist entry: ") + Entry.Identity);
        return InsertResult::Failed;
    }

    Entries.emplace(Entry.Identity, Entry);
    return InsertResult::Inserted;
}

bool ArchiveIndex::AppendRecord(const ArchiveEntry& Entry)
{
    // In-memory only index
    if (IndexFilePath.empty())
    {
        return true;
    }

    std::ofstream file(IndexFilePath, std::ios::binary | std::ios::app);
    if (!file)
    {
        return false;
    }

    if (!WriteString(file, Entry.Identity)) return false;
    if (!WriteString(file, Entry.RelativePath)) return false;
    if (!WriteBinary(file, Entry.Size)) return false;
    if (!WriteBinary(file, Entry.IngestedAt)) return false;
    if (!WriteString(file, Entry.Collection)) return false;

    file.flush();
    return static_cast<bool>(file);
}

size_t ArchiveIndex::Size() const
{
    std::lock_guard lock(IndexMutex);
    return Entries.size();
}

std::vector<ArchiveEntry> ArchiveIndex::GetAllEntries() const
{
    std::lock_guard lock(IndexMutex);
    std::vector<ArchiveEntry> All;
    All.reserve(Entries.size());
    for (const auto& [identity, entry] : Entries)
    {
        All.push_back(entry);
    }
    return All;
}
