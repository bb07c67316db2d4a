#include "FileCopier.hpp"
#include "ContentHasher.hpp"
#include "Logger.hpp"
#include "SessionRecovery.hpp"
#include <filesystem>
#include <iostream>
#include <vector>
#include <mutex>
#include <cstdio>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

namespace FS = std::filesystem;

bool FileCopier::CopyFileRangeSupported = true;

// Kernels without copy_file_range answer ENOSYS for any descriptor pair
void FileCopier::CheckCopyFileRangeSupport()
{
    int ProbeIn = open("/dev/null", O_RDONLY | O_CLOEXEC);
    int ProbeOut = open("/dev/null", O_WRONLY | O_CLOEXEC);

    if (ProbeIn >= 0 && ProbeOut >= 0)
    {
        ssize_t Result = copy_file_range(ProbeIn, nullptr, ProbeOut, nullptr, 1, 0);
        CopyFileRangeSupported = Result >= 0 || errno != ENOSYS;
    }
    else
    {
        CopyFileRangeSupported = false;
    }

    if (ProbeIn >= 0)
    {
        close(ProbeIn);
    }
    if (ProbeOut >= 0)
    {
        close(ProbeOut);
    }

    Log.Info(std::string("[Copier] Kernel copy_file_range ") + (CopyFileRangeSupported ? "available" : "unavailable, using read/write loop"));
}

namespace
{
    // Returns 0 or the errno of the failed write.
    int WriteAll(int Fd, const uint8_t* Data, size_t Length)
    {
        size_t Written = 0;
        while (Written < Length)
        {
            ssize_t Count = write(Fd, Data + Written, Length - Written);
            if (Count < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                return errno;
            }
            Written += static_cast<size_t>(Count);
        }
        return 0;
    }

    int OpenTempForWrite(const std::string& TempPath)
    {
        return open(TempPath.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    }

    // fsync + close, reporting the first failure.
    int SyncAndClose(int Fd)
    {
        int Error = 0;
        if (fsync(Fd) != 0)
        {
            Error = errno;
        }
        if (close(Fd) != 0 && Error == 0)
        {
            Error = errno;
        }
        return Error;
    }

    bool IsKernelCopyFallbackError(int Error)
    {
        return Error == ENOSYS || Error == EXDEV || Error == EINVAL || Error == EOPNOTSUPP || Error == EBADF;
    }
}

FileCopier::FileCopier(const std::string& DestinationRoot, const std::string& SessionID, std::shared_ptr<FileReader> Reader,
    const RetryPolicy& Retry, size_t BufferSize, const std::atomic<bool>* Cancelled)
    : DestinationRoot(DestinationRoot), SessionID(SessionID), Reader(std::move(Reader)), Retry(Retry),
      BufferSize(BufferSize > 0 ? BufferSize : 1024 * 1024), Cancelled(Cancelled)
{
    static std::once_flag ProbeOnce;
    std::call_once(ProbeOnce, &FileCopier::CheckCopyFileRangeSupport);
}

std::string FileCopier::ArchiveFileName(const std::string& Identity, const std::string& Extension)
{
    if (Extension.empty())
    {
        return Identity;
    }
    return Identity + "." + Extension;
}

std::string FileCopier::FinalPathFor(const std::string& Identity, const std::string& Extension) const
{
    return (FS::path(DestinationRoot) / ArchiveFileName(Identity, Extension)).string();
}

std::string FileCopier::GetTempDir() const
{
    return (FS::path(DestinationRoot) / TempDirName).string();
}

std::string FileCopier::NewTempPath()
{
    uint64_t Sequence = TempCounter.fetch_add(1);
    return (FS::path(GetTempDir()) / (SessionID + "-" + std::to_string(Sequence) + ".tmp")).string();
}

bool FileCopier::EnsureDirectory(const std::string& Dir, IoFailure& OutError)
{
    std::error_code ec;
    FS::create_directories(Dir, ec);
    if (ec)
    {
        OutError = IoFailure::FromErrno(ec.value(), "create directory " + Dir);
        return false;
    }
    return true;
}

template<typename AttemptFn>
bool FileCopier::RunWithRetry(FileDescriptor& File, const std::string& Operation, AttemptFn Attempt)
{
    for (unsigned int AttemptIndex = 0; ; ++AttemptIndex)
    {
        IoFailure Failure;
        std::string TempPath = NewTempPath();

        if (Attempt(TempPath, Failure))
        {
            File.TempPath = TempPath;
            return true;
        }

        std::error_code ec;
        FS::remove(TempPath, ec);

        bool CanRetry = Failure.Category == FailureCategory::Transient && AttemptIndex < Retry.MaxRetries;
        if (!CanRetry)
        {
            if (Failure.Category == FailureCategory::Transient)
            {
                Failure.Reason += " (gave up after " + std::to_string(AttemptIndex) + " retries)";
            }
            Log.Error("[Copier] " + Operation + " failed: " + File.SourcePath + " | Code: " + std::to_string(Failure.Code) + " | Reason: " + Failure.Reason);
            File.MarkFailed(Failure);
            return false;
        }

        Log.Warn("[Copier] Transient error on " + File.SourcePath + ", retry " + std::to_string(AttemptIndex + 1) + "/" +
            std::to_string(Retry.MaxRetries) + " after " + std::to_string(Retry.DelayForAttempt(AttemptIndex)) + "ms: " + Failure.Reason);
        ++File.RetryCount;

        if (!Retry.WaitBeforeRetry(AttemptIndex, Cancelled))
        {
            IoFailure CancelFailure;
            CancelFailure.Category = FailureCategory::Cancelled;
            CancelFailure.Code = ECANCELED;
            CancelFailure.Reason = "Import cancelled during retry backoff";
            File.MarkFailed(CancelFailure);
            return false;
        }
    }
}

bool FileCopier::KernelCopyOnce(const FileDescriptor& File, const std::string& TempPath, uint64_t& OutBytes, IoFailure& OutError)
{
    int SrcFd = Reader->Open(File.SourcePath);
    if (SrcFd < 0)
    {
        OutError = IoFailure::FromErrno(-SrcFd, "open source " + File.SourcePath);
        return false;
    }

    int DestFd = OpenTempForWrite(TempPath);
    if (DestFd < 0)
    {
        OutError = IoFailure::FromErrno(errno, "open temp " + TempPath);
        Reader->Close(SrcFd);
        return false;
    }

    uint64_t Copied = 0;
    bool UseKernelCopy = CopyFileRangeSupported;

    while (UseKernelCopy)
    {
        ssize_t Count = copy_file_range(SrcFd, nullptr, DestFd, nullptr, BufferSize, 0);
        if (Count > 0)
        {
            Copied += static_cast<uint64_t>(Count);
            continue;
        }
        if (Count == 0)
        {
            break;
        }

        int Error = errno;
        if (Error == EINTR)
        {
            continue;
        }
        if (Copied == 0 && IsKernelCopyFallbackError(Error))
        {
            // Filesystem pair does not support it; fall through to the read/write loop
            UseKernelCopy = false;
            break;
        }
        OutError = IoFailure::FromErrno(Error, "copy " + File.SourcePath);
        Reader->Close(SrcFd);
        close(DestFd);
        return false;
    }

    if (!UseKernelCopy)
    {
        std::vector<uint8_t> Buffer(BufferSize);
        while (true)
        {
            ssize_t Count = Reader->Read(SrcFd, Buffer.data(), Buffer.size());
            if (Count < 0)
            {
                OutError = IoFailure::FromErrno(static_cast<int>(-Count), "read " + File.SourcePath);
                Reader->Close(SrcFd);
                close(DestFd);
                return false;
            }
            if (Count == 0)
            {
                break;
            }
            int WriteError = WriteAll(DestFd, Buffer.data(), static_cast<size_t>(Count));
            if (WriteError != 0)
            {
                OutError = IoFailure::FromErrno(WriteError, "write " + TempPath);
                Reader->Close(SrcFd);
                close(DestFd);
                return false;
            }
            Copied += static_cast<uint64_t>(Count);
        }
    }

    Reader->Close(SrcFd);

    int CloseError = SyncAndClose(DestFd);
    if (CloseError != 0)
    {
        OutError = IoFailure::FromErrno(CloseError, "flush " + TempPath);
        return false;
    }

    OutBytes = Copied;
    return true;
}

bool FileCopier::StreamCopyOnce(const FileDescriptor& File, const std::string& TempPath, std::string& OutIdentity, uint64_t& OutBytes, IoFailure& OutError)
{
    int SrcFd = Reader->Open(File.SourcePath);
    if (SrcFd < 0)
    {
        OutError = IoFailure::FromErrno(-SrcFd, "open source " + File.SourcePath);
        return false;
    }

    int DestFd = OpenTempForWrite(TempPath);
    if (DestFd < 0)
    {
        OutError = IoFailure::FromErrno(errno, "open temp " + TempPath);
        Reader->Close(SrcFd);
        return false;
    }

    ContentHasher Hasher;
    std::vector<uint8_t> Buffer(BufferSize);

    // Each chunk is fully written before the next read is issued, so the
    // destination's write rate drains the source and memory stays at one buffer.
    while (true)
    {
        ssize_t Count = Reader->Read(SrcFd, Buffer.data(), Buffer.size());
        if (Count < 0)
        {
            OutError = IoFailure::FromErrno(static_cast<int>(-Count), "read " + File.SourcePath);
            Reader->Close(SrcFd);
            close(DestFd);
            return false;
        }
        if (Count == 0)
        {
            break;
        }

        int WriteError = WriteAll(DestFd, Buffer.data(), static_cast<size_t>(Count));
        if (WriteError != 0)
        {
            OutError = IoFailure::FromErrno(WriteError, "write " + TempPath);
            Reader->Close(SrcFd);
            close(DestFd);
            return false;
        }
        Hasher.Update(Buffer.data(), static_cast<size_t>(Count));
    }

    Reader->Close(SrcFd);

    int CloseError = SyncAndClose(DestFd);
    if (CloseError != 0)
    {
        OutError = IoFailure::FromErrno(CloseError, "flush " + TempPath);
        return false;
    }

    OutIdentity = Hasher.Finalize();
    OutBytes = Hasher.GetBytesHashed();
    return true;
}

bool FileCopier::CopyLocal(FileDescriptor& File)
{
    if (!File.HasIdentity())
    {
        IoFailure Failure;
        Failure.Category = FailureCategory::Permanent;
        Failure.Code = EINVAL;
        Failure.Reason = "Local copy requested without a content identity";
        File.MarkFailed(Failure);
        return false;
    }

    IoFailure DirFailure;
    if (!EnsureDirectory(GetTempDir(), DirFailure))
    {
        File.MarkFailed(DirFailure);
        return false;
    }

    uint64_t BytesCopied = 0;
    bool Copied = RunWithRetry(File, "Local copy", [&](const std::string& TempPath, IoFailure& Failure)
    {
        return KernelCopyOnce(File, TempPath, BytesCopied, Failure);
    });
    if (!Copied)
    {
        return false;
    }

    File.BytesProcessed = BytesCopied;
    File.AdvanceTo(FilePhase::Copied);

    IoFailure PublishFailure;
    if (!Publish(File, PublishFailure))
    {
        DiscardTemp(File);
        File.MarkFailed(PublishFailure);
        return false;
    }

    Log.Info("[Copier] Copied " + File.SourcePath + " -> " + File.ArchivePath);
    return true;
}

bool FileCopier::CopyStreaming(FileDescriptor& File)
{
    IoFailure DirFailure;
    if (!EnsureDirectory(GetTempDir(), DirFailure))
    {
        File.MarkFailed(DirFailure);
        return false;
    }

    std::string Identity;
    uint64_t BytesCopied = 0;
    bool Copied = RunWithRetry(File, "Streaming copy", [&](const std::string& TempPath, IoFailure& Failure)
    {
        return StreamCopyOnce(File, TempPath, Identity, BytesCopied, Failure);
    });
    if (!Copied)
    {
        return false;
    }

    File.Identity = Identity;
    File.BytesProcessed = BytesCopied;
    File.AdvanceTo(FilePhase::Copied);
    Log.Info("[Copier] Streamed " + File.SourcePath + " (" + std::to_string(BytesCopied) + " bytes, identity " + Identity + ")");
    return true;
}

bool FileCopier::Publish(FileDescriptor& File, IoFailure& OutError)
{
    if (File.TempPath.empty() || !File.HasIdentity())
    {
        OutError.Category = FailureCategory::Permanent;
        OutError.Code = ENOENT;
        OutError.Reason = "Nothing staged to publish";
        return false;
    }

    const std::string FinalPath = FinalPathFor(File.Identity, File.Extension);
    if (std::rename(File.TempPath.c_str(), FinalPath.c_str()) != 0)
    {
        OutError = IoFailure::FromErrno(errno, "rename " + File.TempPath + " -> " + FinalPath);
        return false;
    }

    File.TempPath.clear();
    File.ArchivePath = FinalPath;
    if (!SessionRecovery::RecordPublished(DestinationRoot, SessionID, ArchiveFileName(File.Identity, File.Extension)))
    {
        Log.Warn("[Copier] " + FinalPath + " is not tracked for recovery if this session is interrupted");
    }
    return true;
}

void FileCopier::DiscardTemp(FileDescriptor& File)
{
    if (File.TempPath.empty())
    {
        return;
    }

    std::error_code ec;
    FS::remove(File.TempPath, ec);
    if (ec)
    {
        Log.Error("[Copier] Failed to delete temp file " + File.TempPath + ": " + ec.message());
    }
    File.TempPath.clear();
}
