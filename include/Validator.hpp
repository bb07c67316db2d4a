#pragma once

#include <string>
#include <memory>
#include <atomic>

#include "ImportTypes.hpp"
#include "FileReader.hpp"
#include "RetryPolicy.hpp"

// Independently re-reads a published archive file and checks its bytes still
// hash to the identity recorded for it. A file that fails this check is deleted.
class Validator
{
public:
    Validator(std::shared_ptr<FileReader> Reader, const RetryPolicy& Retry, size_t BufferSize, const std::atomic<bool>* Cancelled = nullptr);

    bool Validate(FileDescriptor& File);

    // Re-hash only; no side effects on the file or the descriptor.
    bool Verify(const std::string& Path, const std::string& ExpectedIdentity, IoFailure& OutError);

private:
    std::shared_ptr<FileReader> Reader;
    RetryPolicy Retry;
    size_t BufferSize;
    const std::atomic<bool>* Cancelled;

    void DeleteCorruptFile(FileDescriptor& File);
};
