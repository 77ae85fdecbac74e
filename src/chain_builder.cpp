#include "chain_builder.hpp"
#include "block_file.hpp"
#include "chain_error.hpp"

#include <system_error>
#include <fmt/core.h>

namespace fs = std::filesystem;

namespace
{
    // Discards the staging area unless the build reached publish()
    class StagingGuard
    {
    public:
        StagingGuard(HashCache &cache, std::string stagingKey)
            : cache_(cache), stagingKey_(std::move(stagingKey))
        {
        }

        ~StagingGuard()
        {
            if (active_)
            {
                cache_.discard(stagingKey_);
            }
        }

        StagingGuard(const StagingGuard &) = delete;
        StagingGuard &operator=(const StagingGuard &) = delete;

        const std::string &key() const { return stagingKey_; }
        void release() { active_ = false; }

    private:
        HashCache &cache_;
        std::string stagingKey_;
        bool active_ = true;
    };
}

ChainInfo ChainBuilder::build(const fs::path &filePath, std::int64_t blockSize)
{
    // 1. Stat and check the file
    std::error_code ec;
    fs::file_status status = fs::status(filePath, ec);
    if (status.type() == fs::file_type::not_found)
    {
        throw ChainError(ChainErrorKind::NotARegularFile,
                         fmt::format("{} does not exist", filePath.string()));
    }
    if (ec)
    {
        throw ChainError(ChainErrorKind::IOFailure,
                         fmt::format("Cannot stat {}: {}", filePath.string(), ec.message()));
    }
    if (!fs::is_regular_file(status))
    {
        throw ChainError(ChainErrorKind::NotARegularFile,
                         fmt::format("\"{}\" is not a regular file", filePath.string()));
    }

    std::uintmax_t fileSize = fs::file_size(filePath, ec);
    if (ec)
    {
        throw ChainError(ChainErrorKind::IOFailure,
                         fmt::format("Cannot read size of {}: {}", filePath.string(), ec.message()));
    }

    // 2. Block layout
    blockSize = BlockLayout::coerceBlockSize(blockSize);
    ChainInfo info{filePath, cacheKeyFor(filePath),
                   BlockLayout::fromFileSize(static_cast<std::int64_t>(fileSize), blockSize)};
    fmt::print("[builder] numBlocks: {}, highestBlockSize: {}\n",
               info.layout.numBlocks(), info.layout.highestBlockSize());

    // 3. Cache hit short-circuit
    if (cache_.contains(info.cacheKey))
    {
        // Hashes sliced at another block size would fail every verification
        std::int64_t cachedBlockSize = cache_.getBlockSize(info.cacheKey);
        if (cachedBlockSize != blockSize)
        {
            throw ChainError(ChainErrorKind::CacheCorrupt,
                             fmt::format("Cached chain for \"{}\" was built with block size {}, not {}; "
                                         "use --block-size {} or remove {}",
                                         filePath.string(), cachedBlockSize, blockSize,
                                         cachedBlockSize, info.cacheKey));
        }
        fmt::print("[builder] Cache hit for \"{}\"\n", filePath.string());
        info.cacheHit = true;
        return info;
    }

    // 4. Build into a private location and publish it in one step
    StagingGuard staging(cache_, cache_.stage(info.cacheKey));
    cache_.putBlockSize(staging.key(), blockSize);
    hashBlocks(info, staging.key());

    bool published = cache_.publish(staging.key(), info.cacheKey);
    staging.release();
    if (!published)
    {
        // Another builder finished first; its chain is identical
        fmt::print("[builder] Chain for \"{}\" was published concurrently\n", filePath.string());
    }

    return info;
}

void ChainBuilder::hashBlocks(const ChainInfo &info, const std::string &stagingKey)
{
    BlockFile file(info.path);

    // The last block has no successor, it is padded with the zero hash
    Digest carried = zeroDigest();

    for (std::int64_t i = info.layout.numBlocks() - 1; i >= 0; --i)
    {
        Bytes block = file.readBlock(info.layout, i);

        Sha256 hasher;
        hasher.update(block);
        hasher.update(carried);
        carried = hasher.finalize();

        cache_.put(stagingKey, i, carried);
    }
}
