#pragma once

#include <string>
#include <memory>
#include <atomic>

#include "ImportTypes.hpp"
#include "FileReader.hpp"
#include "RetryPolicy.hpp"

// Moves source bytes into the archive. Everything is written under
// <DestinationRoot>/.ingest-tmp/ first and only renamed to <identity>.<ext>
// once the write has closed successfully.
class FileCopier
{
public:
    static constexpr const char* TempDirName = ".ingest-tmp";

    FileCopier(const std::string& DestinationRoot, const std::string& SessionID, std::shared_ptr<FileReader> Reader,
        const RetryPolicy& Retry, size_t BufferSize, const std::atomic<bool>* Cancelled = nullptr);

    static bool CopyFileRangeSupported;
    static void CheckCopyFileRangeSupport();

    // Local mode: File.Identity is already known. Copies, then publishes under the hash name.
    bool CopyLocal(FileDescriptor& File);

    // Network mode: one streaming read feeds both the temp file and the hasher.
    // On success File.Identity is set and the bytes wait at File.TempPath for the dedup decision.
    bool CopyStreaming(FileDescriptor& File);

    // Renames a staged temp file to its final hash-named path.
    bool Publish(FileDescriptor& File, IoFailure& OutError);

    // Deletes File.TempPath if it still exists.
    void DiscardTemp(FileDescriptor& File);

    static std::string ArchiveFileName(const std::string& Identity, const std::string& Extension);
    std::string FinalPathFor(const std::string& Identity, const std::string& Extension) const;
    std::string GetTempDir() const;

private:
    std::string DestinationRoot;
    std::string SessionID;
    std::shared_ptr<FileReader> Reader;
    RetryPolicy Retry;
    size_t BufferSize;
    const std::atomic<bool>* Cancelled;
    std::atomic<uint64_t> TempCounter{ 0 };

    std::string NewTempPath();
    bool EnsureDirectory(const std::string& Dir, IoFailure& OutError);

    bool KernelCopyOnce(const FileDescriptor& File, const std::string& TempPath, uint64_t& OutBytes, IoFailure& OutError);
    bool StreamCopyOnce(const FileDescriptor& File, const std::string& TempPath, std::string& OutIdentity, uint64_t& OutBytes, IoFailure& OutError);

    // Runs Attempt with the retry policy. Cleans the temp file between attempts.
    template<typename AttemptFn>
    bool RunWithRetry(FileDescriptor& File, const std::string& Operation, AttemptFn Attempt);
};
