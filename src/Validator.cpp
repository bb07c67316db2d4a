#include "Validator.hpp"
#include "ContentHasher.hpp"
#include "Logger.hpp"

#include <filesystem>
#include <cerrno>

namespace FS = std::filesystem;

Validator::Validator(std::shared_ptr<FileReader> Reader, const RetryPolicy& Retry, size_t BufferSize, const std::atomic<bool>* Cancelled)
    : Reader(std::move(Reader)), Retry(Retry), BufferSize(BufferSize > 0 ? BufferSize : 1024 * 1024), Cancelled(Cancelled)
{
}

bool Validator::Verify(const std::string& Path, const std::string& ExpectedIdentity, IoFailure& OutError)
{
    for (unsigned int Attempt = 0; ; ++Attempt)
    {
        std::string ActualIdentity;
        uint64_t BytesRead = 0;
        IoFailure ReadFailure;

        if (ContentHasher::HashFile(*Reader, Path, BufferSize, ActualIdentity, BytesRead, ReadFailure))
        {
            if (ActualIdentity == ExpectedIdentity)
            {
                return true;
            }
            OutError.Category = FailureCategory::Integrity;
            OutError.Code = EIO;
            OutError.Reason = "Corruption detected: expected identity " + ExpectedIdentity + ", destination hashes to " + ActualIdentity;
            return false;
        }

        if (ReadFailure.Category != FailureCategory::Transient || Attempt >= Retry.MaxRetries)
        {
            OutError.Category = FailureCategory::Integrity;
            OutError.Code = ReadFailure.Code;
            OutError.Reason = "Corruption suspected, destination unreadable: " + ReadFailure.Reason;
            return false;
        }

        Log.Warn("[Validator] Transient read error on " + Path + ", retry " + std::to_string(Attempt + 1) + ": " + ReadFailure.Reason);
        if (!Retry.WaitBeforeRetry(Attempt, Cancelled))
        {
            OutError.Category = FailureCategory::Cancelled;
            OutError.Code = ECANCELED;
            OutError.Reason = "Import cancelled during validation";
            return false;
        }
    }
}

bool Validator::Validate(FileDescriptor& File)
{
    if (File.ArchivePath.empty() || !File.HasIdentity())
    {
        IoFailure Failure;
        Failure.Category = FailureCategory::Permanent;
        Failure.Code = EINVAL;
        Failure.Reason = "Nothing to validate";
        File.MarkFailed(Failure);
        return false;
    }

    IoFailure Failure;
    if (Verify(File.ArchivePath, File.Identity, Failure))
    {
        File.AdvanceTo(FilePhase::Validated);
        return true;
    }

    if (Failure.Category == FailureCategory::Cancelled)
    {
        // Left for the orchestrator's cancellation cleanup
        File.MarkFailed(Failure);
        return false;
    }

    Log.Error("[Validator] " + File.SourcePath + " -> " + File.ArchivePath + " | " + Failure.Reason);
    DeleteCorruptFile(File);
    File.MarkFailed(Failure);
    return false;
}

void Validator::DeleteCorruptFile(FileDescriptor& File)
{
    std::error_code ec;
    FS::remove(File.ArchivePath, ec);
    if (ec)
    {
        Log.Error("[Validator] Failed to delete corrupt file " + File.ArchivePath + ": " + ec.message());
        return;
    }
    Log.Info("[Validator] Deleted corrupt file " + File.ArchivePath);
    File.ArchivePath.clear();
}
