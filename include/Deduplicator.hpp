#pragma once

#include <string>
#include <unordered_map>
#include <mutex>

#include "ArchiveIndex.hpp"

enum class DedupVerdict
{
    New,
    DuplicateOfArchive,
    DuplicateInFlight
};

struct DedupDecision
{
    DedupVerdict Verdict = DedupVerdict::New;
    ArchiveEntry Existing;       // set for DuplicateOfArchive
    std::string InFlightSource;  // set for DuplicateInFlight
};

// Decides "new" vs "duplicate" for a content identity. A positive answer is a
// claim: the identity stays reserved for the caller until Commit or Release,
// so two files with the same bytes can never both be judged new. Shared by
// every file of a session and by concurrent sessions.
class Deduplicator
{
public:
    explicit Deduplicator(ArchiveIndex& Index);

    // Non-copyable
    Deduplicator(const Deduplicator&) = delete;
    Deduplicator& operator=(const Deduplicator&) = delete;

    DedupDecision Claim(const std::string& Identity, const std::string& SourcePath);

    // Persists the entry and drops the claim.
    InsertResult Commit(const ArchiveEntry& Entry);

    // Drops a claim without persisting (copy or validation failed, or cancelled).
    void Release(const std::string& Identity, const std::string& SourcePath);

    bool Lookup(const std::string& Identity, ArchiveEntry& OutEntry) const;
    size_t GetInFlightCount() const;

private:
    ArchiveIndex& Index;

    mutable std::mutex ClaimMutex;
    std::unordered_map<std::string, std::string> InFlightClaims; // identity -> claiming source path
};
