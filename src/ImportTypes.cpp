#include "ImportTypes.hpp"
#include "RetryPolicy.hpp"

#include <cstring>

std::string FailureCategoryToString(FailureCategory Category)
{
    switch (Category)
    {
    case FailureCategory::None:      return "none";
    case FailureCategory::Scan:      return "scan";
    case FailureCategory::Transient: return "transient";
    case FailureCategory::Permanent: return "permanent";
    case FailureCategory::Integrity: return "integrity";
    case FailureCategory::Cancelled: return "cancelled";
    default:                         return "unknown";
    }
}

IoFailure IoFailure::FromErrno(int ErrorCode, const std::string& Context)
{
    IoFailure Failure;
    Failure.Category = RetryPolicy::IsTransientError(ErrorCode) ? FailureCategory::Transient : FailureCategory::Permanent;
    Failure.Code = ErrorCode;
    Failure.Reason = Context + ": " + std::strerror(ErrorCode);
    return Failure;
}

std::string FilePhaseToString(FilePhase Phase)
{
    switch (Phase)
    {
    case FilePhase::Scanned:      return "scanned";
    case FilePhase::Hashed:       return "hashed";
    case FilePhase::Copied:       return "copied";
    case FilePhase::Deduplicated: return "deduplicated";
    case FilePhase::Validated:    return "validated";
    case FilePhase::Complete:     return "complete";
    case FilePhase::Duplicate:    return "duplicate";
    case FilePhase::Failed:       return "failed";
    default:                      return "unknown";
    }
}

bool FileDescriptor::IsTerminal() const
{
    return Phase == FilePhase::Complete || Phase == FilePhase::Duplicate || Phase == FilePhase::Failed;
}

bool FileDescriptor::AdvanceTo(FilePhase Next)
{
    if (IsTerminal() || static_cast<int>(Next) <= static_cast<int>(Phase))
    {
        return false;
    }
    Phase = Next;
    return true;
}

bool FileDescriptor::MarkDuplicate(const std::string& Original)
{
    if (IsTerminal())
    {
        return false;
    }
    IsDuplicate = true;
    DuplicateOf = Original;
    AwaitingClaimOf.clear();
    Phase = FilePhase::Duplicate;
    return true;
}

bool FileDescriptor::MarkFailed(const IoFailure& Failure)
{
    if (IsTerminal())
    {
        return false;
    }
    Error = Failure;
    AwaitingClaimOf.clear();
    Phase = FilePhase::Failed;
    return true;
}

std::string FileOutcomeToString(FileOutcome Outcome)
{
    switch (Outcome)
    {
    case FileOutcome::Succeeded: return "succeeded";
    case FileOutcome::Duplicate: return "duplicate";
    case FileOutcome::Failed:    return "failed";
    default:                     return "unknown";
    }
}

std::string SessionStateToString(SessionState State)
{
    switch (State)
    {
    case SessionState::Pending:       return "pending";
    case SessionState::Scanning:      return "scanning";
    case SessionState::Classifying:   return "classifying";
    case SessionState::Hashing:       return "hashing";
    case SessionState::Copying:       return "copying";
    case SessionState::Deduplicating: return "deduplicating";
    case SessionState::Validating:    return "validating";
    case SessionState::Finalizing:    return "finalizing";
    case SessionState::Complete:      return "complete";
    case SessionState::FailedPartial: return "failed-partial";
    case SessionState::Failed:        return "failed";
    case SessionState::Cancelled:     return "cancelled";
    default:                          return "unknown";
    }
}

bool IsTerminalState(SessionState State)
{
    return State == SessionState::Complete || State == SessionState::FailedPartial ||
        State == SessionState::Failed || State == SessionState::Cancelled;
}
