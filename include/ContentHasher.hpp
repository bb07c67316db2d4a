#pragma once

#include <string>
#include <vector>
#include <memory>
#include <cstdint>

#include "ImportTypes.hpp"
#include "FileReader.hpp"

extern "C" {
#include <blake3.h>
}

// Incremental BLAKE3 accumulator producing a content identity: the first
// IdentityBytes of the digest as lowercase hex. Chunk boundaries never affect
// the result, so the same object serves a bulk file read or a copy stream.
class ContentHasher
{
public:
    static constexpr size_t IdentityBytes = 8;
    static constexpr size_t IdentityHexLength = IdentityBytes * 2;

    ContentHasher();

    void Update(const uint8_t* Data, size_t Length);
    void Update(const std::string& Data);

    std::string Finalize() const;
    uint64_t GetBytesHashed() const;
    void Reset();

    static std::string HashBuffer(const uint8_t* Data, size_t Length);
    static bool IsValidIdentity(const std::string& Identity);

    // Bulk read of a whole file through Reader. Fills OutError on failure.
    static bool HashFile(FileReader& Reader, const std::string& Path, size_t BufferSize, std::string& OutIdentity, uint64_t& OutBytes, IoFailure& OutError);

private:
    blake3_hasher Hasher;
    uint64_t BytesHashed = 0;
};
