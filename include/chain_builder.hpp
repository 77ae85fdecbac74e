#pragma once

#include "block_layout.hpp"
#include "hash_cache.hpp"

#include <filesystem>
#include <string>

/**
 * Result of pre-processing one file: everything a BlockServer needs to
 * serve it without recomputing anything.
 */
struct ChainInfo
{
    std::filesystem::path path;
    std::string cacheKey;
    BlockLayout layout;
    bool cacheHit = false;
};

/**
 * Pre-processing pass that turns a file into a backward hash chain.
 *
 * hash(numBlocks-1) = SHA256(block[numBlocks-1] || zero32)
 * hash(i)           = SHA256(block[i] || hash(i+1))
 *
 * so hash(0), the root hash, commits to the whole file.
 */
class ChainBuilder
{
public:
    explicit ChainBuilder(HashCache &cache) : cache_(cache) {}

    /**
     * Build (or reuse) the chain for @p filePath.
     *
     * A non-positive @p blockSize is replaced by the default with a warning.
     * If the cache already holds this file's key the pass is skipped; the
     * key depends on the path only, so a file edited in place keeps its
     * old chain until the cache entry is removed. A hit recorded with a
     * different block size is refused rather than served.
     *
     * @throws ChainError NotARegularFile, CacheCorrupt, IOFailure
     */
    ChainInfo build(const std::filesystem::path &filePath,
                    std::int64_t blockSize = BlockLayout::DEFAULT_BLOCK_SIZE);

private:
    void hashBlocks(const ChainInfo &info, const std::string &stagingKey);

    HashCache &cache_;
};
