#pragma once

#include <string>
#include <vector>
#include <cstdint>

#include "TransportClassifier.hpp"

enum class FailureCategory
{
    None,
    Scan,
    Transient,
    Permanent,
    Integrity,
    Cancelled
};

std::string FailureCategoryToString(FailureCategory Category);

struct IoFailure
{
    FailureCategory Category = FailureCategory::None;
    int Code = 0;
    std::string Reason;

    bool IsSet() const { return Category != FailureCategory::None; }

    // Builds a failure from an errno value, classifying it as transient or permanent.
    static IoFailure FromErrno(int ErrorCode, const std::string& Context);
};

// Phases only move forward. Complete, Duplicate and Failed are terminal.
enum class FilePhase
{
    Scanned,
    Hashed,
    Copied,
    Deduplicated,
    Validated,
    Complete,
    Duplicate,
    Failed
};

std::string FilePhaseToString(FilePhase Phase);

struct FileDescriptor
{
    std::string SourcePath;
    std::string Extension;
    uint64_t Size = 0;
    int64_t MTime = 0;
    TransportClass Transport = TransportClass::Local;

    std::string Identity;       // empty until hashed
    bool IsDuplicate = false;
    std::string DuplicateOf;    // archive-relative path of the original
    std::string AwaitingClaimOf; // in-flight claimant with the same identity, until it commits or fails

    std::string TempPath;
    std::string ArchivePath;    // absolute destination path once renamed
    uint64_t BytesProcessed = 0;
    unsigned int RetryCount = 0;

    IoFailure Error;

    FilePhase GetPhase() const { return Phase; }
    bool IsTerminal() const;
    bool HasIdentity() const { return !Identity.empty(); }
    bool IsAwaitingClaim() const { return !AwaitingClaimOf.empty(); }

    // Returns false (and leaves the phase alone) for backwards or post-terminal moves.
    bool AdvanceTo(FilePhase Next);
    bool MarkDuplicate(const std::string& Original);
    bool MarkFailed(const IoFailure& Failure);

private:
    FilePhase Phase = FilePhase::Scanned;
};

struct ArchiveEntry
{
    std::string Identity;
    std::string RelativePath;
    uint64_t Size = 0;
    int64_t IngestedAt = 0;
    std::string Collection;
};

enum class FileOutcome
{
    Succeeded,
    Duplicate,
    Failed
};

std::string FileOutcomeToString(FileOutcome Outcome);

struct FileCompletionEvent
{
    std::string Path;
    std::string Identity;
    FileOutcome Outcome = FileOutcome::Failed;
    uint64_t BytesProcessed = 0;
    std::string ErrorReason;
};

// Orchestrator states. Terminal: Complete, FailedPartial, Failed, Cancelled.
enum class SessionState
{
    Pending,
    Scanning,
    Classifying,
    Hashing,
    Copying,
    Deduplicating,
    Validating,
    Finalizing,
    Complete,
    FailedPartial,
    Failed,
    Cancelled
};

std::string SessionStateToString(SessionState State);
bool IsTerminalState(SessionState State);
