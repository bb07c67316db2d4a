#include "IngestStrategy.hpp"
#include "ContentHasher.hpp"
#include "Logger.hpp"

#include <cerrno>

bool IngestStrategy::ClaimOrMarkDuplicate(FileDescriptor& File)
{
    DedupDecision Decision = Context.Dedup.Claim(File.Identity, File.SourcePath);
    switch (Decision.Verdict)
    {
    case DedupVerdict::DuplicateOfArchive:
        File.MarkDuplicate(Decision.Existing.RelativePath);
        return false;
    case DedupVerdict::DuplicateInFlight:
        File.AwaitingClaimOf = Decision.InFlightSource;
        return false;
    case DedupVerdict::New:
    default:
        return true;
    }
}

// ---------------------------------------------------------------- Local

const std::vector<SessionState>& LocalIngestStrategy::GetPhases() const
{
    static const std::vector<SessionState> Phases = { SessionState::Hashing, SessionState::Deduplicating, SessionState::Copying };
    return Phases;
}

size_t LocalIngestStrategy::WorkersFor(SessionState Phase, const WorkerLimits& Limits) const
{
    switch (Phase)
    {
    case SessionState::Hashing:
        return Limits.HashWorkers;
    case SessionState::Copying:
        // A network-classified archive gets the network ceiling even from a local source
        return Limits.CopyWorkersFor(Context.DestinationTransport);
    default:
        return 1; // Index lookups only
    }
}

void LocalIngestStrategy::RunPhase(SessionState Phase, FileDescriptor& File)
{
    switch (Phase)
    {
    case SessionState::Hashing:
        HashFile(File);
        break;
    case SessionState::Deduplicating:
        if (ClaimOrMarkDuplicate(File))
        {
            File.AdvanceTo(FilePhase::Deduplicated);
        }
        break;
    case SessionState::Copying:
        // Claim already held, so a successful copy moves straight on to validation
        Context.Copier.CopyLocal(File);
        break;
    default:
        break;
    }
}

void LocalIngestStrategy::RunTakeover(FileDescriptor& File)
{
    File.AdvanceTo(FilePhase::Deduplicated);
    Context.Copier.CopyLocal(File);
}

void LocalIngestStrategy::HashFile(FileDescriptor& File)
{
    for (unsigned int Attempt = 0; ; ++Attempt)
    {
        std::string Identity;
        uint64_t Bytes = 0;
        IoFailure Failure;

        if (ContentHasher::HashFile(Context.Reader, File.SourcePath, Context.BufferSize, Identity, Bytes, Failure))
        {
            File.Identity = Identity;
            File.AdvanceTo(FilePhase::Hashed);
            return;
        }

        if (Failure.Category != FailureCategory::Transient || Attempt >= Context.Retry.MaxRetries)
        {
            Log.Error("[Hasher] Failed to hash " + File.SourcePath + " | Code: " + std::to_string(Failure.Code) + " | Reason: " + Failure.Reason);
            File.MarkFailed(Failure);
            return;
        }

        ++File.RetryCount;
        Log.Warn("[Hasher] Transient error on " + File.SourcePath + ", retry " + std::to_string(Attempt + 1) + ": " + Failure.Reason);
        if (!Context.Retry.WaitBeforeRetry(Attempt, Context.Cancelled))
        {
            IoFailure CancelFailure;
            CancelFailure.Category = FailureCategory::Cancelled;
            CancelFailure.Code = ECANCELED;
            CancelFailure.Reason = "Import cancelled during retry backoff";
            File.MarkFailed(CancelFailure);
            return;
        }
    }
}

// -------------------------------------------------------------- Network

const std::vector<SessionState>& NetworkIngestStrategy::GetPhases() const
{
    static const std::vector<SessionState> Phases = { SessionState::Copying, SessionState::Deduplicating };
    return Phases;
}

size_t NetworkIngestStrategy::WorkersFor(SessionState, const WorkerLimits& Limits) const
{
    // Publishing stays at the same ceiling as the streaming copy
    return Limits.CopyWorkersNetwork;
}

void NetworkIngestStrategy::RunPhase(SessionState Phase, FileDescriptor& File)
{
    switch (Phase)
    {
    case SessionState::Copying:
        Context.Copier.CopyStreaming(File);
        break;
    case SessionState::Deduplicating:
        DeduplicateStaged(File);
        break;
    default:
        break;
    }
}

void NetworkIngestStrategy::DeduplicateStaged(FileDescriptor& File)
{
    if (!ClaimOrMarkDuplicate(File))
    {
        // A file parked on an in-flight claim keeps its staged bytes in case it has to take over
        if (!File.IsAwaitingClaim())
        {
            Context.Copier.DiscardTemp(File);
        }
        return;
    }
    PublishClaimed(File);
}

void NetworkIngestStrategy::RunTakeover(FileDescriptor& File)
{
    PublishClaimed(File);
}

void NetworkIngestStrategy::PublishClaimed(FileDescriptor& File)
{
    IoFailure Failure;
    if (!Context.Copier.Publish(File, Failure))
    {
        Log.Error("[Copier] Failed to publish " + File.SourcePath + ": " + Failure.Reason);
        Context.Copier.DiscardTemp(File);
        Context.Dedup.Release(File.Identity, File.SourcePath);
        File.MarkFailed(Failure);
        return;
    }
    File.AdvanceTo(FilePhase::Deduplicated);
}

std::unique_ptr<IngestStrategy> MakeIngestStrategy(TransportClass Transport, IngestContext Context)
{
    if (Transport == TransportClass::Network)
    {
        return std::make_unique<NetworkIngestStrategy>(Context);
    }
    return std::make_unique<LocalIngestStrategy>(Context);
}
