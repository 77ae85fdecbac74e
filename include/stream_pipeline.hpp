#pragma once

#include "config.hpp"
#include "hash_cache.hpp"

#include <cstdint>

/** Outcome of a successful transfer. */
struct StreamReport
{
    Digest rootHash{};
    std::int64_t blocks = 0;
    std::int64_t bytes = 0;
    bool cacheHit = false;
};

/**
 * Build the chain for config.inputPath, print and return its root hash.
 */
Digest publishRoot(HashCache &cache, const StreamConfig &config);

/**
 * Move config.inputPath to config.outputPath through the chain protocol:
 * pre-process, fetch the root hash, then request, verify and append every
 * block until end of stream.
 *
 * When config.expectedRoot is set the served root must match it before any
 * block is consumed. The output file is replaced. On failure it holds only
 * the blocks verified so far.
 *
 * @throws ChainError on any build, cache, I/O or verification failure
 */
StreamReport streamFile(HashCache &cache, const StreamConfig &config);
