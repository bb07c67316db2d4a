#include "FileReader.hpp"

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

int PosixFileReader::Open(const std::string& Path)
{
    int Fd = open(Path.c_str(), O_RDONLY | O_CLOEXEC);
    if (Fd < 0)
    {
        return -errno;
    }
    return Fd;
}

ssize_t PosixFileReader::Read(int Handle, uint8_t* Buffer, size_t Length)
{
    while (true)
    {
        ssize_t Count = read(Handle, Buffer, Length);
        if (Count >= 0)
        {
            return Count;
        }
        if (errno != EINTR)
        {
            return -errno;
        }
    }
}

void PosixFileReader::Close(int Handle)
{
    if (Handle >= 0)
    {
        close(Handle);
    }
}

std::shared_ptr<FileReader> MakePosixFileReader()
{
    return std::make_shared<PosixFileReader>();
}
