#include "ContentHasher.hpp"
#include "Logger.hpp"

#include <array>

namespace
{
    std::string ToHex(const uint8_t* Bytes, size_t Length)
    {
        static const char Digits[] = "0123456789abcdef";
        std::string Hex;
        Hex.reserve(Length * 2);
        for (size_t i = 0; i < Length; ++i)
        {
            Hex.push_back(Digits[Bytes[i] >> 4]);
            Hex.push_back(Digits[Bytes[i] & 0x0F]);
        }
        return Hex;
    }
}

ContentHasher::ContentHasher()
{
    blake3_hasher_init(&Hasher);
}

void ContentHasher::Update(const uint8_t* Data, size_t Length)
{
    blake3_hasher_update(&Hasher, Data, Length);
    BytesHashed += Length;
}

void ContentHasher::Update(const std::string& Data)
{
    Update(reinterpret_cast<const uint8_t*>(Data.data()), Data.size());
}

std::string ContentHasher::Finalize() const
{
    // BLAKE3 output is extendable, so a short output equals the digest prefix
    std::array<uint8_t, IdentityBytes> Out{};
    blake3_hasher_finalize(&Hasher, Out.data(), Out.size());
    return ToHex(Out.data(), Out.size());
}

uint64_t ContentHasher::GetBytesHashed() const
{
    return BytesHashed;
}

void ContentHasher::Reset()
{
    blake3_hasher_reset(&Hasher);
    BytesHashed = 0;
}

std::string ContentHasher::HashBuffer(const uint8_t* Data, size_t Length)
{
    ContentHasher Hasher;
    Hasher.Update(Data, Length);
    return Hasher.Finalize();
}

bool ContentHasher::IsValidIdentity(const std::string& Identity)
{
    if (Identity.size() != IdentityHexLength)
    {
        return false;
    }
    for (char Ch : Identity)
    {
        bool IsDigit = Ch >= '0' && Ch <= '9';
        bool IsLowerHex = Ch >= 'a' && Ch <= 'f';
        if (!IsDigit && !IsLowerHex)
        {
            return false;
        }
    }
    return true;
}

bool ContentHasher::HashFile(FileReader& Reader, const std::string& Path, size_t BufferSize, std::string& OutIdentity, uint64_t& OutBytes, IoFailure& OutError)
{
    int Handle = Reader.Open(Path);
    if (Handle < 0)
    {
        OutError = IoFailure::FromErrno(-Handle, "open " + Path);
        return false;
    }

    ContentHasher Hasher;
    std::vector<uint8_t> Buffer(BufferSize > 0 ? BufferSize : 64 * 1024);

    while (true)
    {
        ssize_t Count = Reader.Read(Handle, Buffer.data(), Buffer.size());
        if (Count < 0)
        {
            OutError = IoFailure::FromErrno(static_cast<int>(-Count), "read " + Path);
            Reader.Close(Handle);
            return false;
        }
        if (Count == 0)
        {
            break;
        }
        Hasher.Update(Buffer.data(), static_cast<size_t>(Count));
    }

    Reader.Close(Handle);
    OutIdentity = Hasher.Finalize();
    OutBytes = Hasher.GetBytesHashed();
    return true;
}
