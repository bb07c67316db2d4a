#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include <mutex>
#include <cstdint>

#include "ImportTypes.hpp"

enum class InsertResult
{
    Inserted,
    AlreadyExists,
    Failed
};

// Persistent content identity -> ArchiveEntry map. Records are appended to a
// binary file one entry at a time, so an identity is either fully present or absent.
class ArchiveIndex
{
public:
    ArchiveIndex() = default;
    explicit ArchiveIndex(const std::string& indexFilePath);

    // Non-copyable
    ArchiveIndex(const ArchiveIndex&) = delete;
    ArchiveIndex& operator=(const ArchiveIndex&) = delete;

    bool Load();

    bool Lookup(const std::string& Identity, ArchiveEntry& OutEntry) const;
    InsertResult Insert(const ArchiveEntry& Entry);

    size_t Size() const;
    std::vector<ArchiveEntry> GetAllEntries() const;
    const std::string& GetFilePath() const;

private:
    mutable std::mutex IndexMutex;

    std::string IndexFilePath;
    std::unordered_map<std::string, ArchiveEntry> Entries;

    void EnsureIndexDirExists();
    bool AppendRecord(const ArchiveEntry& Entry);
};
