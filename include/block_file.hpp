#pragma once

#include "block_layout.hpp"
#include "sha256.hpp"

#include <filesystem>
#include <fstream>

/**
 * Read-only handle to the source file, addressed by block index.
 * The stream is released by the destructor or by close(), whichever
 * comes first.
 */
class BlockFile
{
public:
    /**
     * @throws ChainError (IOFailure) if the file cannot be opened
     */
    explicit BlockFile(const std::filesystem::path &path);

    BlockFile(const BlockFile &) = delete;
    BlockFile &operator=(const BlockFile &) = delete;

    /**
     * Seek to the block's offset and read exactly its length.
     *
     * @throws ChainError (IOFailure) on a seek error or short read; the
     *         exception carries the bytes read before the failure
     */
    Bytes readBlock(const BlockLayout &layout, std::int64_t index);

    void close();
    bool isOpen() const { return stream_.is_open(); }

    const std::filesystem::path &path() const { return path_; }

private:
    std::filesystem::path path_;
    std::ifstream stream_;
};
