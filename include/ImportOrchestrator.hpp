#pragma once

#include <string>
#include <vector>
#include <memory>
#include <atomic>
#include <mutex>
#include <functional>

#include "ImportTypes.hpp"
#include "HardwareProfile.hpp"
#include "TransportClassifier.hpp"
#include "Deduplicator.hpp"
#include "FileReader.hpp"
#include "RetryPolicy.hpp"
#include "FileScanner.hpp"

class FileCopier;
class IngestStrategy;

struct ImportRequest
{
    std::vector<std::string> SourceRoots;
    std::string DestinationRoot;
    std::string Collection = "default";
    std::vector<std::string> Excludes;
};

struct SessionMetrics
{
    size_t FilesScanned = 0;
    size_t Duplicates = 0;
    size_t Succeeded = 0;
    size_t Failed = 0;
    uint64_t BytesProcessed = 0;
    uint64_t Retries = 0;
    double ElapsedSeconds = 0.0;
    double ThroughputMBps = 0.0;
};

struct FailedFile
{
    std::string Path;
    FailureCategory Category = FailureCategory::None;
    std::string Reason;
};

// Result of one Run(). Read-only once returned.
struct ImportSession
{
    std::string SessionID;
    TransportClass Transport = TransportClass::Local;
    TransportClass DestinationTransport = TransportClass::Local;
    SessionState Status = SessionState::Pending;
    std::vector<SessionState> StateHistory;

    std::vector<FileDescriptor> Files;
    std::vector<ScanError> ScanErrors;
    std::vector<ArchiveEntry> IngestedEntries;

    int64_t StartedAt = 0;
    int64_t FinishedAt = 0;
    SessionMetrics Metrics;

    std::vector<FailedFile> GetFailedFiles() const;

    // Source paths that can be fed back as the next request's sources.
    std::vector<std::string> FailedPaths() const;
};

using CompletionListener = std::function<void(const FileCompletionEvent&)>;

// Runs import sessions one at a time: scan, classify, pick a strategy, push
// every file through the strategy's phases and validation, then commit
// verified files to the shared index.
class ImportOrchestrator
{
public:
    ImportOrchestrator(const WorkerLimits& Limits, Deduplicator& Dedup, TransportRules Rules, const RetryPolicy& Retry,
        size_t BufferSize, std::shared_ptr<FileReader> Reader = MakePosixFileReader());
    ~ImportOrchestrator();

    // Non-copyable
    ImportOrchestrator(const ImportOrchestrator&) = delete;
    ImportOrchestrator& operator=(const ImportOrchestrator&) = delete;

    ImportSession Run(const ImportRequest& Request);

    // Safe from any thread. Files already in a phase finish it; nothing new starts.
    void Cancel();
    bool IsCancelled() const;

    void SetCompletionListener(CompletionListener Listener);
    SessionState GetState() const;

private:
    WorkerLimits Limits;
    Deduplicator& Dedup;
    TransportClassifier Classifier;
    RetryPolicy Retry;
    size_t BufferSize;
    std::shared_ptr<FileReader> Reader;

    std::atomic<bool> Cancelled{ false };
    std::atomic<SessionState> State{ SessionState::Pending };
    CompletionListener Listener;

    std::mutex RunMutex;

    void EnterState(ImportSession& Session, SessionState Next);
    void RunPhase(ImportSession& Session, SessionState Phase, size_t Workers, const std::function<void(FileDescriptor&)>& Work);
    void EmitNewlyTerminal(ImportSession& Session, std::vector<bool>& Reported);

    void ValidateAll(ImportSession& Session, FileCopier& Copier);
    void FinalizeAll(ImportSession& Session, const ImportRequest& Request);
    void CleanupAfterCancel(ImportSession& Session, FileCopier& Copier);
    void ReleaseFailedClaims(ImportSession& Session);
    size_t ResolveWaitingFiles(ImportSession& Session, FileCopier& Copier);
    void ComputeMetrics(ImportSession& Session) const;
    SessionState DecideStatus(const ImportSession& Session) const;

    static std::string NewSessionID();
};
