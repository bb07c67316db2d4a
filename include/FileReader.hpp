#pragma once

#include <string>
#include <memory>
#include <cstdint>
#include <sys/types.h>

// Read-side I/O used for every source and destination read in the pipeline.
// Handles are file descriptors; failures are reported as -errno.
class FileReader
{
public:
    virtual ~FileReader() = default;

    virtual int Open(const std::string& Path) = 0;
    virtual ssize_t Read(int Handle, uint8_t* Buffer, size_t Length) = 0;
    virtual void Close(int Handle) = 0;
};

class PosixFileReader : public FileReader
{
public:
    int Open(const std::string& Path) override;
    ssize_t Read(int Handle, uint8_t* Buffer, size_t Length) override;
    void Close(int Handle) override;
};

std::shared_ptr<FileReader> MakePosixFileReader();
