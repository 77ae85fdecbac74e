#pragma once

#include "block_file.hpp"
#include "chain_builder.hpp"
#include "hash_cache.hpp"

#include <memory>
#include <optional>

/**
 * Serves a pre-processed file forward, one request at a time.
 *
 * Request 0 is the root hash. Request n >= 1 is block n-1 followed by the
 * chain hash of block n, or by 32 zero bytes when block n-1 is the last
 * one. Every request after the last block returns an empty optional
 * (end of stream).
 *
 * The file is opened on the first block request and released when the
 * last block has been served, when close() is called, when a read fails,
 * or on destruction.
 */
class BlockServer
{
public:
    BlockServer(const HashCache &cache, ChainInfo info);

    BlockServer(const BlockServer &) = delete;
    BlockServer &operator=(const BlockServer &) = delete;

    /**
     * @param requestNumber 0 for the root hash, n >= 1 for block n-1
     * @return Payload bytes, or std::nullopt once the stream is exhausted
     * @throws ChainError CacheMiss when a needed hash was never built,
     *         IOFailure on open/seek/read errors (with the partial block)
     * @throws std::invalid_argument for a negative request number
     */
    std::optional<Bytes> request(std::int64_t requestNumber);

    /** End the session early. Safe to call repeatedly. */
    void close();

    bool isOpen() const { return file_ != nullptr; }
    bool exhausted() const { return exhausted_; }

    const ChainInfo &info() const { return info_; }

private:
    Bytes serveBlock(std::int64_t blockIndex);

    const HashCache &cache_;
    ChainInfo info_;
    std::unique_ptr<BlockFile> file_;
    bool exhausted_ = false;
};
