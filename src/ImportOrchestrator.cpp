#include "ImportOrchestrator.hpp"
#include "IngestStrategy.hpp"
#include "FileCopier.hpp"
#include "Validator.hpp"
#include "SessionRecovery.hpp"
#include "ThreadPool.hpp"
#include "TimeUtils.hpp"
#include "Logger.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <cerrno>
#include <unistd.h>

namespace FS = std::filesystem;

std::vector<FailedFile> ImportSession::GetFailedFiles() const
{
    std::vector<FailedFile> Failed;
    for (const auto& File : Files)
    {
        if (File.GetPhase() == FilePhase::Failed)
        {
            Failed.push_back({ File.SourcePath, File.Error.Category, File.Error.Reason });
        }
    }
    return Failed;
}

std::vector<std::string> ImportSession::FailedPaths() const
{
    std::vector<std::string> Paths;
    for (const auto& File : Files)
    {
        if (File.GetPhase() == FilePhase::Failed)
        {
            Paths.push_back(File.SourcePath);
        }
    }
    return Paths;
}

ImportOrchestrator::ImportOrchestrator(const WorkerLimits& Limits, Deduplicator& Dedup, TransportRules Rules, const RetryPolicy& Retry,
    size_t BufferSize, std::shared_ptr<FileReader> Reader)
    : Limits(Limits), Dedup(Dedup), Classifier(std::move(Rules)), Retry(Retry), BufferSize(BufferSize), Reader(std::move(Reader))
{
    if (!this->Reader)
    {
        this->Reader = MakePosixFileReader();
    }
}

ImportOrchestrator::~ImportOrchestrator() = default;

void ImportOrchestrator::Cancel()
{
    if (!Cancelled.exchange(true))
    {
        Log.Warn("[Orchestrator] Cancellation requested");
    }
}

bool ImportOrchestrator::IsCancelled() const
{
    return Cancelled.load();
}

void ImportOrchestrator::SetCompletionListener(CompletionListener NewListener)
{
    Listener = std::move(NewListener);
}

SessionState ImportOrchestrator::GetState() const
{
    return State.load();
}

std::string ImportOrchestrator::NewSessionID()
{
    static std::atomic<uint64_t> Sequence{ 0 };
    return Logger::GetTimestampForFilename() + "-" + std::to_string(static_cast<long>(getpid())) + "-" + std::to_string(Sequence.fetch_add(1));
}

void ImportOrchestrator::EnterState(ImportSession& Session, SessionState Next)
{
    State = Next;
    Session.StateHistory.push_back(Next);
    Log.Info("[Orchestrator] Session " + Session.SessionID + " -> " + SessionStateToString(Next));
}

void ImportOrchestrator::RunPhase(ImportSession& Session, SessionState Phase, size_t Workers, const std::function<void(FileDescriptor&)>& Work)
{
    if (Cancelled)
    {
        return;
    }

    ThreadPool Pool(Workers);
    for (auto& File : Session.Files)
    {
        if (File.IsTerminal() || File.IsAwaitingClaim())
        {
            continue;
        }

        FileDescriptor* Target = &File;
        Pool.Submit([this, Target, Phase, &Work]()
        {
            if (Cancelled)
            {
                return;
            }
            try
            {
                Work(*Target);
            }
            catch (const std::exception& e)
            {
                IoFailure Failure;
                Failure.Category = FailureCategory::Permanent;
                Failure.Code = EIO;
                Failure.Reason = "Unexpected error while " + SessionStateToString(Phase) + ": " + e.what();
                Log.Error("[Orchestrator] " + Target->SourcePath + " | " + Failure.Reason);
                Target->MarkFailed(Failure);
            }
        });
    }
    Pool.Join();
}

void ImportOrchestrator::EmitNewlyTerminal(ImportSession& Session, std::vector<bool>& Reported)
{
    Reported.resize(Session.Files.size(), false);
    for (size_t i = 0; i < Session.Files.size(); ++i)
    {
        const FileDescriptor& File = Session.Files[i];
        if (Reported[i] || !File.IsTerminal())
        {
            continue;
        }
        Reported[i] = true;

        FileCompletionEvent Event;
        Event.Path = File.SourcePath;
        Event.Identity = File.Identity;
        Event.BytesProcessed = File.BytesProcessed;
        switch (File.GetPhase())
        {
        case FilePhase::Complete:
            Event.Outcome = FileOutcome::Succeeded;
            break;
        case FilePhase::Duplicate:
            Event.Outcome = FileOutcome::Duplicate;
            break;
        default:
            Event.Outcome = FileOutcome::Failed;
            Event.ErrorReason = File.Error.Reason;
            break;
        }

        if (Listener)
        {
            Listener(Event);
        }
    }
}

void ImportOrchestrator::ValidateAll(ImportSession& Session, FileCopier& Copier)
{
    Validator Checker(Reader, Retry, BufferSize, &Cancelled);
    size_t Workers = Limits.ValidateWorkersFor(Session.DestinationTransport);

    RunPhase(Session, SessionState::Validating, Workers, [&Checker, &Copier](FileDescriptor& File)
    {
        if (File.ArchivePath.empty())
        {
            // Phase work ended without publishing and without recording why
            Copier.DiscardTemp(File);
            IoFailure Failure;
            Failure.Category = FailureCategory::Permanent;
            Failure.Code = EIO;
            Failure.Reason = "File was not published to the archive";
            File.MarkFailed(Failure);
            return;
        }
        Checker.Validate(File);
    });
}

void ImportOrchestrator::FinalizeAll(ImportSession& Session, const ImportRequest& Request)
{
    for (auto& File : Session.Files)
    {
        if (File.GetPhase() != FilePhase::Validated)
        {
            continue;
        }

        ArchiveEntry Entry;
        Entry.Identity = File.Identity;
        Entry.RelativePath = FileCopier::ArchiveFileName(File.Identity, File.Extension);
        Entry.Size = File.BytesProcessed;
        Entry.IngestedAt = NowUnixSeconds();
        Entry.Collection = Request.Collection;

        InsertResult Result = Dedup.Commit(Entry);
        if (Result == InsertResult::Inserted)
        {
            File.AdvanceTo(FilePhase::Complete);
            Session.IngestedEntries.push_back(Entry);
            Log.Info("[Orchestrator] Archived " + File.SourcePath + " as " + Entry.RelativePath);
            continue;
        }

        std::error_code ec;
        if (Result == InsertResult::AlreadyExists)
        {
            // Another index writer got there first
            ArchiveEntry Existing;
            Dedup.Lookup(File.Identity, Existing);
            if (Existing.RelativePath != Entry.RelativePath)
            {
                FS::remove(File.ArchivePath, ec);
            }
            File.MarkDuplicate(Existing.RelativePath);
            continue;
        }

        FS::remove(File.ArchivePath, ec);
        File.ArchivePath.clear();

        IoFailure Failure;
        Failure.Category = FailureCategory::Permanent;
        Failure.Code = EIO;
        Failure.Reason = "Failed to record " + Entry.RelativePath + " in the archive index";
        Log.Error("[Orchestrator] " + File.SourcePath + " | " + Failure.Reason);
        File.MarkFailed(Failure);
    }
}

void ImportOrchestrator::CleanupAfterCancel(ImportSession& Session, FileCopier& Copier)
{
    size_t Removed = 0;
    for (auto& File : Session.Files)
    {
        FilePhase Phase = File.GetPhase();
        if (Phase == FilePhase::Complete || Phase == FilePhase::Duplicate)
        {
            continue;
        }

        if (!File.TempPath.empty())
        {
            Copier.DiscardTemp(File);
            ++Removed;
        }
        if (!File.ArchivePath.empty())
        {
            std::error_code ec;
            if (FS::remove(File.ArchivePath, ec))
            {
                ++Removed;
            }
            else if (ec)
            {
                Log.Error("[Orchestrator] Failed to remove unvalidated file " + File.ArchivePath + ": " + ec.message());
            }
            File.ArchivePath.clear();
        }

        if (!File.IsTerminal())
        {
            IoFailure Failure;
            Failure.Category = FailureCategory::Cancelled;
            Failure.Code = ECANCELED;
            Failure.Reason = "Import cancelled before this file finished";
            File.MarkFailed(Failure);
        }
    }
    Log.Info("[Orchestrator] Cancel cleanup removed " + std::to_string(Removed) + " staged or unvalidated files");
}

void ImportOrchestrator::ReleaseFailedClaims(ImportSession& Session)
{
    for (const auto& File : Session.Files)
    {
        if (File.GetPhase() == FilePhase::Failed && File.HasIdentity())
        {
            Dedup.Release(File.Identity, File.SourcePath);
        }
    }
}

// Called once no file of this session holds a claim. Returns how many waiting
// files took over a claim whose holder failed; those still need copy and validation.
size_t ImportOrchestrator::ResolveWaitingFiles(ImportSession& Session, FileCopier& Copier)
{
    size_t TakenOver = 0;
    std::vector<FileDescriptor*> StillWaiting;

    for (auto& File : Session.Files)
    {
        if (!File.IsAwaitingClaim())
        {
            continue;
        }

        DedupDecision Decision = Dedup.Claim(File.Identity, File.SourcePath);
        switch (Decision.Verdict)
        {
        case DedupVerdict::DuplicateOfArchive:
            Copier.DiscardTemp(File);
            File.MarkDuplicate(Decision.Existing.RelativePath);
            break;
        case DedupVerdict::DuplicateInFlight:
            File.AwaitingClaimOf = Decision.InFlightSource;
            StillWaiting.push_back(&File);
            break;
        case DedupVerdict::New:
        default:
            Log.Warn("[Orchestrator] " + File.SourcePath + " takes over from failed " + File.AwaitingClaimOf);
            File.AwaitingClaimOf.clear();
            ++TakenOver;
            break;
        }
    }

    if (TakenOver == 0)
    {
        // Only claimants of other sessions are left and their outcome is unknown here
        for (FileDescriptor* File : StillWaiting)
        {
            Copier.DiscardTemp(*File);
            IoFailure Failure;
            Failure.Category = FailureCategory::Transient;
            Failure.Code = EBUSY;
            Failure.Reason = "Identical content is still being imported by " + File->AwaitingClaimOf;
            Log.Warn("[Orchestrator] " + File->SourcePath + " | " + Failure.Reason);
            File->MarkFailed(Failure);
        }
    }
    return TakenOver;
}

void ImportOrchestrator::ComputeMetrics(ImportSession& Session) const
{
    SessionMetrics& Metrics = Session.Metrics;
    Metrics.Duplicates = 0;
    Metrics.Succeeded = 0;
    Metrics.Failed = 0;
    Metrics.BytesProcessed = 0;
    Metrics.Retries = 0;

    for (const auto& File : Session.Files)
    {
        switch (File.GetPhase())
        {
        case FilePhase::Complete:
            ++Metrics.Succeeded;
            break;
        case FilePhase::Duplicate:
            ++Metrics.Duplicates;
            break;
        case FilePhase::Failed:
            ++Metrics.Failed;
            break;
        default:
            break;
        }
        Metrics.BytesProcessed += File.BytesProcessed;
        Metrics.Retries += File.RetryCount;
    }

    if (Metrics.ElapsedSeconds > 0.0)
    {
        Metrics.ThroughputMBps = (static_cast<double>(Metrics.BytesProcessed) / (1024.0 * 1024.0)) / Metrics.ElapsedSeconds;
    }
}

SessionState ImportOrchestrator::DecideStatus(const ImportSession& Session) const
{
    if (Cancelled)
    {
        return SessionState::Cancelled;
    }

    const SessionMetrics& Metrics = Session.Metrics;
    if (Metrics.Failed == 0)
    {
        return SessionState::Complete;
    }
    if (Metrics.Succeeded + Metrics.Duplicates > 0)
    {
        return SessionState::FailedPartial;
    }
    return SessionState::Failed;
}

ImportSession ImportOrchestrator::Run(const ImportRequest& Request)
{
    std::lock_guard<std::mutex> RunLock(RunMutex);
    Cancelled = false;

    auto StartClock = std::chrono::steady_clock::now();

    ImportSession Session;
    Session.SessionID = NewSessionID();
    Session.StartedAt = NowUnixSeconds();
    std::vector<bool> Reported;

    Log.Info("[Orchestrator] Starting session " + Session.SessionID + " into " + Request.DestinationRoot);

    if (!SessionRecovery::MarkSessionStarted(Request.DestinationRoot, Session.SessionID))
    {
        Log.Warn("[Orchestrator] Continuing without a session marker; an interruption will leave staged files behind");
    }

    // Scanning
    EnterState(Session, SessionState::Scanning);
    FileScanner Scanner;
    Scanner.SetExcludes(Request.Excludes);
    Scanner.Scan(Request.SourceRoots);

    Session.Files = Scanner.GetFiles();
    Session.ScanErrors = Scanner.GetErrors();
    for (const auto& Error : Session.ScanErrors)
    {
        FileDescriptor Unreadable;
        Unreadable.SourcePath = Error.Path;
        Unreadable.MarkFailed(Error.Error);
        Session.Files.push_back(std::move(Unreadable));
    }
    Session.Metrics.FilesScanned = Session.Files.size();
    EmitNewlyTerminal(Session, Reported);

    // Classifying
    EnterState(Session, SessionState::Classifying);
    Session.Transport = Classifier.ClassifyBatch(Request.SourceRoots);
    Session.DestinationTransport = Classifier.Classify(Request.DestinationRoot);
    for (auto& File : Session.Files)
    {
        File.Transport = Session.Transport;
    }
    Log.Info("[Orchestrator] Source transport: " + TransportToString(Session.Transport) +
        " | Destination transport: " + TransportToString(Session.DestinationTransport) +
        " | Files: " + std::to_string(Session.Metrics.FilesScanned));

    FileCopier Copier(Request.DestinationRoot, Session.SessionID, Reader, Retry, BufferSize, &Cancelled);
    IngestContext Context{ Copier, Dedup, *Reader, Retry, BufferSize, &Cancelled, Session.DestinationTransport };
    std::unique_ptr<IngestStrategy> Strategy = MakeIngestStrategy(Session.Transport, Context);

    for (SessionState Phase : Strategy->GetPhases())
    {
        if (Cancelled)
        {
            break;
        }
        EnterState(Session, Phase);
        RunPhase(Session, Phase, Strategy->WorkersFor(Phase, Limits), [&Strategy, Phase](FileDescriptor& File)
        {
            Strategy->RunPhase(Phase, File);
        });
        EmitNewlyTerminal(Session, Reported);
    }

    if (!Cancelled)
    {
        EnterState(Session, SessionState::Validating);
        ValidateAll(Session, Copier);
        EmitNewlyTerminal(Session, Reported);
    }

    // Verified files are committed even when a cancel arrived during validation
    EnterState(Session, SessionState::Finalizing);
    FinalizeAll(Session, Request);
    ReleaseFailedClaims(Session);

    // Duplicates of a claimant that failed take its place, one per identity per round
    while (!Cancelled && ResolveWaitingFiles(Session, Copier) > 0)
    {
        SessionState Takeover = Strategy->GetTakeoverPhase();
        EnterState(Session, Takeover);
        RunPhase(Session, Takeover, Strategy->WorkersFor(Takeover, Limits), [&Strategy](FileDescriptor& File)
        {
            Strategy->RunTakeover(File);
        });
        EmitNewlyTerminal(Session, Reported);
        if (Cancelled)
        {
            break;
        }

        EnterState(Session, SessionState::Validating);
        ValidateAll(Session, Copier);
        EmitNewlyTerminal(Session, Reported);

        EnterState(Session, SessionState::Finalizing);
        FinalizeAll(Session, Request);
        ReleaseFailedClaims(Session);
    }

    if (Cancelled)
    {
        CleanupAfterCancel(Session, Copier);
    }
    ReleaseFailedClaims(Session);
    EmitNewlyTerminal(Session, Reported);

    SessionRecovery::MarkSessionFinished(Request.DestinationRoot, Session.SessionID);

    Session.FinishedAt = NowUnixSeconds();
    Session.Metrics.ElapsedSeconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - StartClock).count();
    ComputeMetrics(Session);

    Session.Status = DecideStatus(Session);
    EnterState(Session, Session.Status);

    Log.Info("[Orchestrator] Session " + Session.SessionID + " finished: " + SessionStateToString(Session.Status) +
        " | Succeeded: " + std::to_string(Session.Metrics.Succeeded) +
        " | Duplicates: " + std::to_string(Session.Metrics.Duplicates) +
        " | Failed: " + std::to_string(Session.Metrics.Failed));
    return Session;
}
