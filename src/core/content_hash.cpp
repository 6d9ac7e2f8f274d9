#include "core/content_hash.hpp"
#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <openssl/sha.h>

uint32_t ContentHash::jenkinsHash(BufferView buffer)
{
    uint32_t hash = 0;
    const std::size_t sample_size = std::min(buffer.size, kSampleSize);

    for (std::size_t i = 0; i < sample_size; ++i)
    {
        hash += buffer[i];
        hash += (hash << 10);
        hash ^= (hash >> 6);
    }

    hash += (hash << 3);
    hash ^= (hash >> 11);
    hash += (hash << 15);
    return hash;
}

uint32_t ContentHash::reduce(uint32_t hash, uint32_t modulo)
{
    if (modulo == 0)
        return 0;

    // abs() of INT32_MIN does not fit in 32 bits
    const int64_t signed_hash = static_cast<int32_t>(hash);
    return static_cast<uint32_t>(std::llabs(signed_hash) % modulo);
}

uint32_t ContentHash::score(BufferView buffer, uint32_t modulo)
{
    return reduce(jenkinsHash(buffer), modulo);
}

std::string ContentHash::sha256Hex(BufferView buffer)
{
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_CTX sha256;
    if (SHA256_Init(&sha256) != 1)
        return "";
    if (buffer.size > 0 && SHA256_Update(&sha256, buffer.data, buffer.size) != 1)
        return "";
    if (SHA256_Final(hash, &sha256) != 1)
        return "";

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++)
    {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}
