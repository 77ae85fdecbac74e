#include "hash_cache.hpp"
#include "chain_error.hpp"

#include <algorithm>
#include <exception>
#include <fstream>
#include <random>
#include <system_error>
#include <fmt/core.h>

namespace fs = std::filesystem;

std::string cacheKeyFor(const fs::path &filePath)
{
    // absolute() does not touch the file system beyond the cwd, and
    // lexically_normal() folds "a/./b" and "a/x/../b" into one key
    fs::path absolutePath = fs::absolute(filePath).lexically_normal();
    return toHex(Sha256::digest(absolutePath.string()));
}

// ---------------------------------------------------------------------------
// DirectoryHashCache
// ---------------------------------------------------------------------------

DirectoryHashCache::DirectoryHashCache(fs::path root) : root_(std::move(root))
{
}

fs::path DirectoryHashCache::hashFile(const std::string &key, std::int64_t index) const
{
    return keyDir(key) / fmt::format("{}.sha256", index);
}

bool DirectoryHashCache::contains(const std::string &key) const
{
    std::error_code ec;
    fs::file_status status = fs::status(keyDir(key), ec);
    if (status.type() == fs::file_type::not_found)
    {
        return false;
    }
    if (ec)
    {
        throw ChainError(ChainErrorKind::IOFailure,
                         fmt::format("Cannot stat cache dir {}: {}", keyDir(key).string(), ec.message()));
    }
    if (status.type() != fs::file_type::directory)
    {
        throw ChainError(ChainErrorKind::CacheCorrupt,
                         fmt::format("Cache dir {} is not a directory", keyDir(key).string()));
    }
    return true;
}

std::string DirectoryHashCache::stage(const std::string &key)
{
    try
    {
        fs::create_directories(root_);
    }
    catch (const fs::filesystem_error &e)
    {
        throw ChainError(ChainErrorKind::IOFailure,
                         fmt::format("Cannot create cache root {}: {}", root_.string(), e.what()));
    }

    std::random_device rd;
    std::mt19937_64 gen(rd());

    // Each builder gets its own directory, even within one process
    for (int attempt = 0; attempt < 16; ++attempt)
    {
        std::string stagingKey = fmt::format(".staging-{}-{:016x}{:04x}", key, gen(),
                                             stagingCounter_.fetch_add(1) & 0xffff);
        std::error_code ec;
        if (fs::create_directory(keyDir(stagingKey), ec))
        {
            fs::permissions(keyDir(stagingKey), fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec, ec);
            if (ec)
            {
                discard(stagingKey);
                throw ChainError(ChainErrorKind::IOFailure,
                                 fmt::format("Cannot set permissions on {}: {}",
                                             keyDir(stagingKey).string(), ec.message()));
            }
            return stagingKey;
        }
        if (ec)
        {
            throw ChainError(ChainErrorKind::IOFailure,
                             fmt::format("Cannot create staging dir {}: {}",
                                         keyDir(stagingKey).string(), ec.message()));
        }
    }

    throw ChainError(ChainErrorKind::IOFailure,
                     fmt::format("Cannot allocate a staging dir for {} under {}", key, root_.string()));
}

void DirectoryHashCache::put(const std::string &key, std::int64_t index, const Digest &digest)
{
    fs::path target = hashFile(key, index);

    // Stored files are read-only, so an overwrite has to unlink first
    std::error_code ec;
    fs::remove(target, ec);
    if (ec)
    {
        throw ChainError(ChainErrorKind::IOFailure,
                         fmt::format("Cannot replace {}: {}", target.string(), ec.message()));
    }

    {
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char *>(digest.data()),
                  static_cast<std::streamsize>(digest.size()));
        out.close();
        if (!out)
        {
            throw ChainError(ChainErrorKind::IOFailure,
                             fmt::format("Cannot write hash file {}", target.string()));
        }
    }

    fs::permissions(target, fs::perms::owner_read | fs::perms::group_read, ec);
    if (ec)
    {
        throw ChainError(ChainErrorKind::IOFailure,
                         fmt::format("Cannot set permissions on {}: {}", target.string(), ec.message()));
    }
}

Digest DirectoryHashCache::get(const std::string &key, std::int64_t index) const
{
    fs::path source = hashFile(key, index);

    std::ifstream in(source, std::ios::binary);
    if (!in)
    {
        std::error_code ec;
        if (!fs::exists(source, ec))
        {
            throw ChainError(ChainErrorKind::CacheMiss,
                             fmt::format("No cached hash for block {} ({})", index, source.string()));
        }
        throw ChainError(ChainErrorKind::IOFailure,
                         fmt::format("Cannot read hash file {}", source.string()));
    }

    // One byte of slack detects oversized entries
    char buffer[33];
    in.read(buffer, sizeof(buffer));
    if (in.bad())
    {
        throw ChainError(ChainErrorKind::IOFailure,
                         fmt::format("Read error on hash file {}", source.string()));
    }
    if (in.gcount() != 32)
    {
        throw ChainError(ChainErrorKind::CacheCorrupt,
                         fmt::format("Hash file {} holds {}{} bytes, expected 32", source.string(),
                                     in.gcount(), in.gcount() == 33 ? "+" : ""));
    }

    Digest digest;
    std::copy(buffer, buffer + 32, digest.begin());
    return digest;
}

void DirectoryHashCache::putBlockSize(const std::string &key, std::int64_t blockSize)
{
    fs::path target = blockSizeFile(key);

    std::error_code ec;
    fs::remove(target, ec);
    if (ec)
    {
        throw ChainError(ChainErrorKind::IOFailure,
                         fmt::format("Cannot replace {}: {}", target.string(), ec.message()));
    }

    {
        std::ofstream out(target, std::ios::trunc);
        out << blockSize << '\n';
        out.close();
        if (!out)
        {
            throw ChainError(ChainErrorKind::IOFailure,
                             fmt::format("Cannot write block size file {}", target.string()));
        }
    }

    fs::permissions(target, fs::perms::owner_read | fs::perms::group_read, ec);
    if (ec)
    {
        throw ChainError(ChainErrorKind::IOFailure,
                         fmt::format("Cannot set permissions on {}: {}", target.string(), ec.message()));
    }
}

std::int64_t DirectoryHashCache::getBlockSize(const std::string &key) const
{
    fs::path source = blockSizeFile(key);

    std::ifstream in(source);
    if (!in)
    {
        throw ChainError(ChainErrorKind::CacheCorrupt,
                         fmt::format("Cache dir {} records no block size", keyDir(key).string()));
    }

    std::int64_t blockSize = 0;
    in >> blockSize;
    if (!in || blockSize <= 0)
    {
        throw ChainError(ChainErrorKind::CacheCorrupt,
                         fmt::format("Block size file {} is malformed", source.string()));
    }
    return blockSize;
}

bool DirectoryHashCache::publish(const std::string &stagingKey, const std::string &key)
{
    if (contains(key))
    {
        discard(stagingKey);
        return false;
    }

    std::error_code ec;
    fs::rename(keyDir(stagingKey), keyDir(key), ec);
    if (ec)
    {
        // Lost a race against another builder of the same file
        if (contains(key))
        {
            discard(stagingKey);
            return false;
        }
        throw ChainError(ChainErrorKind::IOFailure,
                         fmt::format("Cannot publish {} as {}: {}", keyDir(stagingKey).string(),
                                     keyDir(key).string(), ec.message()));
    }
    return true;
}

void DirectoryHashCache::discard(const std::string &stagingKey) noexcept
{
    std::error_code ec;
    fs::remove_all(keyDir(stagingKey), ec);
    if (ec)
    {
        try
        {
            fmt::print(stderr, "Warning: could not remove staging dir {}: {}\n",
                       keyDir(stagingKey).string(), ec.message());
        }
        catch (const std::exception &)
        {
            // stderr is gone; the leftover dir is never read as a cache hit
        }
    }
}

// ---------------------------------------------------------------------------
// MemoryHashCache
// ---------------------------------------------------------------------------

bool MemoryHashCache::contains(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(key) > 0;
}

std::string MemoryHashCache::stage(const std::string &key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::string stagingKey = fmt::format(".staging-{}-{}", key, stagingCounter_++);
    staging_[stagingKey];
    return stagingKey;
}

void MemoryHashCache::put(const std::string &key, std::int64_t index, const Digest &digest)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto stagingIt = staging_.find(key);
    if (stagingIt != staging_.end())
    {
        stagingIt->second[index] = digest;
        return;
    }
    entries_[key][index] = digest;
}

Digest MemoryHashCache::get(const std::string &key, std::int64_t index) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto keyIt = entries_.find(key);
    if (keyIt != entries_.end())
    {
        auto it = keyIt->second.find(index);
        if (it != keyIt->second.end())
        {
            return it->second;
        }
    }
    throw ChainError(ChainErrorKind::CacheMiss,
                     fmt::format("No cached hash for block {} under {}", index, key));
}

void MemoryHashCache::putBlockSize(const std::string &key, std::int64_t blockSize)
{
    std::lock_guard<std::mutex> lock(mutex_);
    blockSizes_[key] = blockSize;
}

std::int64_t MemoryHashCache::getBlockSize(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = blockSizes_.find(key);
    if (it == blockSizes_.end())
    {
        throw ChainError(ChainErrorKind::CacheCorrupt,
                         fmt::format("No block size recorded under {}", key));
    }
    return it->second;
}

bool MemoryHashCache::publish(const std::string &stagingKey, const std::string &key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto stagingIt = staging_.find(stagingKey);
    if (stagingIt == staging_.end())
    {
        throw ChainError(ChainErrorKind::CacheMiss,
                         fmt::format("Unknown staging key {}", stagingKey));
    }

    bool published = false;
    if (entries_.count(key) == 0)
    {
        entries_[key] = std::move(stagingIt->second);
        auto sizeIt = blockSizes_.find(stagingKey);
        if (sizeIt != blockSizes_.end())
        {
            blockSizes_[key] = sizeIt->second;
        }
        published = true;
    }
    staging_.erase(stagingIt);
    blockSizes_.erase(stagingKey);
    return published;
}

void MemoryHashCache::discard(const std::string &stagingKey) noexcept
{
    try
    {
        std::lock_guard<std::mutex> lock(mutex_);
        staging_.erase(stagingKey);
        blockSizes_.erase(stagingKey);
    }
    catch (const std::system_error &)
    {
        // Lock failed; the entry stays visible through pendingStages()
    }
}

size_t MemoryHashCache::pendingStages() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return staging_.size();
}
