#pragma once

#include <array>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <openssl/evp.h>

/** 32-byte SHA-256 digest, the unit of every chain hash. */
using Digest = std::array<unsigned char, 32>;

/** Raw byte buffer for blocks and served payloads. */
using Bytes = std::vector<unsigned char>;

/**
 * Incremental SHA-256 built on the OpenSSL EVP interface.
 * Lets the chain builder hash "block || carried hash" without
 * concatenating the two buffers first.
 */
class Sha256
{
public:
    Sha256();

    Sha256(const Sha256 &) = delete;
    Sha256 &operator=(const Sha256 &) = delete;

    void update(const unsigned char *data, size_t size);
    void update(const Bytes &data) { update(data.data(), data.size()); }
    void update(const Digest &digest) { update(digest.data(), digest.size()); }

    /**
     * Finish the digest. The hasher cannot be updated afterwards.
     * @throws std::runtime_error if OpenSSL fails to finalize
     */
    Digest finalize();

    /** One-shot digest of a byte buffer. */
    static Digest digest(const Bytes &data);

    /** One-shot digest of a string (used for path-derived cache keys). */
    static Digest digest(const std::string &text);

    /**
     * Compute SHA-256 of a whole file.
     * Reads the file in chunks to avoid loading it into memory.
     *
     * @param filePath Path to file to hash
     * @throws ChainError (IOFailure) if the file cannot be read
     */
    static Digest digestFile(const std::filesystem::path &filePath);

private:
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context_;
    bool finalized_ = false;

    // Chunk size for file reading (1 MB)
    static constexpr size_t CHUNK_SIZE = 1024 * 1024;
};

/** Lowercase hex rendering, e.g. {0x01, 0xFF} -> "01ff". */
std::string toHex(const Digest &digest);

/**
 * Parse a digest given as "sha256:hexhash" or as bare hex.
 * Whitespace and ':' / '-' separators are ignored, case does not matter.
 *
 * @throws std::runtime_error on an unsupported algorithm, a non-hex
 *         character or a length other than 64 hex digits
 */
Digest parseDigest(const std::string &text);

/** The all-zero digest appended to the last block as end-of-chain sentinel. */
Digest zeroDigest();

bool isZeroDigest(const Digest &digest);
