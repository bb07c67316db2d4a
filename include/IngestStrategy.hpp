#pragma once

#include <string>
#include <vector>
#include <memory>
#include <atomic>

#include "ImportTypes.hpp"
#include "HardwareProfile.hpp"
#include "FileCopier.hpp"
#include "Deduplicator.hpp"
#include "FileReader.hpp"
#include "RetryPolicy.hpp"

// Everything a strategy needs to process one file. Owned by the orchestrator
// for the lifetime of a session.
struct IngestContext
{
    FileCopier& Copier;
    Deduplicator& Dedup;
    FileReader& Reader;
    RetryPolicy Retry;
    size_t BufferSize;
    const std::atomic<bool>* Cancelled;
    TransportClass DestinationTransport = TransportClass::Local;
};

// Per-session choice of how identity, copy and dedup are ordered. The
// orchestrator runs GetPhases() in order, each behind its own worker pool
// barrier, and calls RunPhase for every file that is not yet terminal.
class IngestStrategy
{
public:
    explicit IngestStrategy(IngestContext Context) : Context(Context) {}
    virtual ~IngestStrategy() = default;

    virtual TransportClass GetTransport() const = 0;
    virtual const std::vector<SessionState>& GetPhases() const = 0;
    virtual size_t WorkersFor(SessionState Phase, const WorkerLimits& Limits) const = 0;
    virtual void RunPhase(SessionState Phase, FileDescriptor& File) = 0;

    // A file that waited on an in-flight claimant and now holds the claim
    // itself runs the rest of its pre-validation work in this phase.
    virtual SessionState GetTakeoverPhase() const = 0;
    virtual void RunTakeover(FileDescriptor& File) = 0;

protected:
    IngestContext Context;

    // Applies a Deduplicator verdict. Returns true if the caller now holds the claim.
    // A duplicate of an in-flight file is parked on that claim rather than finished,
    // because the claimant may still fail.
    bool ClaimOrMarkDuplicate(FileDescriptor& File);
};

// Source on fast storage: bulk hash first, skip known content, copy only new files.
class LocalIngestStrategy : public IngestStrategy
{
public:
    explicit LocalIngestStrategy(IngestContext Context) : IngestStrategy(Context) {}

    TransportClass GetTransport() const override { return TransportClass::Local; }
    const std::vector<SessionState>& GetPhases() const override;
    size_t WorkersFor(SessionState Phase, const WorkerLimits& Limits) const override;
    void RunPhase(SessionState Phase, FileDescriptor& File) override;

    SessionState GetTakeoverPhase() const override { return SessionState::Copying; }
    void RunTakeover(FileDescriptor& File) override;

private:
    void HashFile(FileDescriptor& File);
};

// Source on a network share: one streaming read that copies and hashes
// together, dedup afterwards.
class NetworkIngestStrategy : public IngestStrategy
{
public:
    explicit NetworkIngestStrategy(IngestContext Context) : IngestStrategy(Context) {}

    TransportClass GetTransport() const override { return TransportClass::Network; }
    const std::vector<SessionState>& GetPhases() const override;
    size_t WorkersFor(SessionState Phase, const WorkerLimits& Limits) const override;
    void RunPhase(SessionState Phase, FileDescriptor& File) override;

    SessionState GetTakeoverPhase() const override { return SessionState::Deduplicating; }
    void RunTakeover(FileDescriptor& File) override;

private:
    void DeduplicateStaged(FileDescriptor& File);
    void PublishClaimed(FileDescriptor& File);
};

std::unique_ptr<IngestStrategy> MakeIngestStrategy(TransportClass Transport, IngestContext Context);
