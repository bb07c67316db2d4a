#include "Deduplicator.hpp"
#include "Logger.hpp"

Deduplicator::Deduplicator(ArchiveIndex& Index) : Index(Index)
{
}

DedupDecision Deduplicator::Claim(const std::string& Identity, const std::string& SourcePath)
{
    DedupDecision Decision;
    std::lock_guard<std::mutex> Lock(ClaimMutex);

    if (Index.Lookup(Identity, Decision.Existing))
    {
        Decision.Verdict = DedupVerdict::DuplicateOfArchive;
        Log.Info("[Deduplicator] " + SourcePath + " duplicates archived " + Decision.Existing.RelativePath);
        return Decision;
    }

    auto It = InFlightClaims.find(Identity);
    if (It != InFlightClaims.end())
    {
        Decision.Verdict = DedupVerdict::DuplicateInFlight;
        Decision.InFlightSource = It->second;
        Log.Info("[Deduplicator] " + SourcePath + " duplicates in-flight " + It->second);
        return Decision;
    }

    InFlightClaims.emplace(Identity, SourcePath);
    Decision.Verdict = DedupVerdict::New;
    return Decision;
}

InsertResult Deduplicator::Commit(const ArchiveEntry& Entry)
{
    std::lock_guard<std::mutex> Lock(ClaimMutex);
    InsertResult Result = Index.Insert(Entry);
    InFlightClaims.erase(Entry.Identity);
    return Result;
}

void Deduplicator::Release(const std::string& Identity, const std::string& SourcePath)
{
    std::lock_guard<std::mutex> Lock(ClaimMutex);
    auto It = InFlightClaims.find(Identity);
    if (It != InFlightClaims.end() && It->second == SourcePath)
    {
        InFlightClaims.erase(It);
    }
}

bool Deduplicator::Lookup(const std::string& Identity, ArchiveEntry& OutEntry) const
{
    return Index.Lookup(Identity, OutEntry);
}

size_t Deduplicator::GetInFlightCount() const
{
    std::lock_guard<std::mutex> Lock(ClaimMutex);
    return InFlightClaims.size();
}
