#pragma once

#include "sha256.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

/**
 * File identity key: hex(SHA256(absolute path)).
 * Depends on the path only, never on the file's content.
 */
std::string cacheKeyFor(const std::filesystem::path &filePath);

/**
 * Persistent store of one chain hash per (file identity key, block index).
 *
 * Builds are written into a private staging location and made visible
 * under the real key by publish(), so a chain that was only partly
 * written is never mistaken for a complete one.
 */
class HashCache
{
public:
    virtual ~HashCache() = default;

    /**
     * Key-level existence check used for the cache-hit short-circuit.
     * @throws ChainError (CacheCorrupt) if the location exists but is not
     *         the expected container
     */
    virtual bool contains(const std::string &key) const = 0;

    /**
     * Create an empty private location for a build of @p key.
     * @return Key to pass to put() and publish()
     */
    virtual std::string stage(const std::string &key) = 0;

    /** Write or overwrite the hash of @p index under @p key. */
    virtual void put(const std::string &key, std::int64_t index, const Digest &digest) = 0;

    /**
     * @throws ChainError CacheMiss if absent, CacheCorrupt if the stored
     *         value is not a 32-byte digest
     */
    virtual Digest get(const std::string &key, std::int64_t index) const = 0;

    /** Record the block size a chain under @p key was built with. */
    virtual void putBlockSize(const std::string &key, std::int64_t blockSize) = 0;

    /**
     * @throws ChainError CacheCorrupt if no valid block size is recorded
     */
    virtual std::int64_t getBlockSize(const std::string &key) const = 0;

    /**
     * Atomically move a staged build to @p key.
     * @return false if @p key already existed; the staged build is dropped
     */
    virtual bool publish(const std::string &stagingKey, const std::string &key) = 0;

    /** Drop an abandoned staging location. Failures are reported, never thrown. */
    virtual void discard(const std::string &stagingKey) noexcept = 0;
};

/**
 * Directory-backed cache: <root>/<key>/<index>.sha256, one raw 32-byte
 * file per block, plus <root>/<key>/block_size in decimal. Staging directories live beside the keys as
 * <root>/.staging-<key>-<nonce> and are renamed into place.
 */
class DirectoryHashCache : public HashCache
{
public:
    explicit DirectoryHashCache(std::filesystem::path root);

    bool contains(const std::string &key) const override;
    std::string stage(const std::string &key) override;
    void put(const std::string &key, std::int64_t index, const Digest &digest) override;
    Digest get(const std::string &key, std::int64_t index) const override;
    void putBlockSize(const std::string &key, std::int64_t blockSize) override;
    std::int64_t getBlockSize(const std::string &key) const override;
    bool publish(const std::string &stagingKey, const std::string &key) override;
    void discard(const std::string &stagingKey) noexcept override;

    const std::filesystem::path &root() const { return root_; }

    std::filesystem::path keyDir(const std::string &key) const { return root_ / key; }
    std::filesystem::path hashFile(const std::string &key, std::int64_t index) const;
    std::filesystem::path blockSizeFile(const std::string &key) const { return keyDir(key) / "block_size"; }

private:
    std::filesystem::path root_;
    std::atomic<std::uint64_t> stagingCounter_{0};
};

/** In-process cache for tests and embedders that do not want disk state. */
class MemoryHashCache : public HashCache
{
public:
    bool contains(const std::string &key) const override;
    std::string stage(const std::string &key) override;
    void put(const std::string &key, std::int64_t index, const Digest &digest) override;
    Digest get(const std::string &key, std::int64_t index) const override;
    void putBlockSize(const std::string &key, std::int64_t blockSize) override;
    std::int64_t getBlockSize(const std::string &key) const override;
    bool publish(const std::string &stagingKey, const std::string &key) override;
    void discard(const std::string &stagingKey) noexcept override;

    /** Number of staging areas not yet published or discarded. */
    size_t pendingStages() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::map<std::int64_t, Digest>> entries_;
    std::unordered_map<std::string, std::map<std::int64_t, Digest>> staging_;
    std::unordered_map<std::string, std::int64_t> blockSizes_;
    std::uint64_t stagingCounter_ = 0;
};
