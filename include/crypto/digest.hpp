#ifndef BACKUPER_CRYPTO_DIGEST_HPP
#define BACKUPER_CRYPTO_DIGEST_HPP

#include <cstddef>
#include <istream>
#include <memory>
#include <string>
#include "crypto_error.hpp"

namespace backuper::crypto {

// Forward declaration for OpenSSL digest context
struct DigestContext;

class Sha256 {
public:
    static constexpr size_t DIGEST_SIZE = 32;   // 256 bits

    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;


    // ---- HASHING ----
    // Feeds the next block of bytes into the accumulator
    void update(const char* data, size_t size);
    // Finalizes the digest and returns it hex encoded; the accumulator
    // cannot be updated afterwards
    std::string hex_digest();

private:
    std::unique_ptr<DigestContext> context_;
    bool finalized_ = false;
};

class Digest {
public:
    static constexpr size_t BLOCK_SIZE = 65536;

    // Hashes the whole content of input in BLOCK_SIZE reads and returns
    // the hex encoded SHA-256. The read position of input is restored
    // before returning.
    static std::string sha256_hex(std::istream& input);

    // Convenience overload for in-memory data
    static std::string sha256_hex(const std::string& data);
};

// Hex encoding of count random bytes taken from the OpenSSL CSPRNG
std::string random_hex(size_t count);

} // namespace backuper::crypto

#endif // BACKUPER_CRYPTO_DIGEST_HPP
