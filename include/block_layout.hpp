#pragma once

#include <cstdint>

/**
 * Block addressing for a file split into fixed-size blocks.
 *
 * Index 0 is the first content of the file, index numBlocks-1 the last.
 * Every block is blockSize long except the last one, which holds the
 * remaining 1..blockSize bytes. The chain builder walks these indices
 * backward and the block server walks them forward; both go through
 * offsetOf() and lengthOf().
 */
class BlockLayout
{
public:
    static constexpr std::int64_t DEFAULT_BLOCK_SIZE = 1024;

    /**
     * @param fileSize Total byte length, must be > 0
     * @param blockSize Block length, must be > 0 (see coerceBlockSize)
     * @throws ChainError InvalidBlockSize or NotARegularFile (empty file)
     */
    static BlockLayout fromFileSize(std::int64_t fileSize, std::int64_t blockSize);

    /**
     * Replace a non-positive block size with DEFAULT_BLOCK_SIZE.
     * Prints a warning when it does.
     */
    static std::int64_t coerceBlockSize(std::int64_t requested);

    std::int64_t fileSize() const { return fileSize_; }
    std::int64_t blockSize() const { return blockSize_; }
    std::int64_t numBlocks() const { return numBlocks_; }
    std::int64_t highestBlockSize() const { return highestBlockSize_; }

    bool contains(std::int64_t index) const { return index >= 0 && index < numBlocks_; }
    bool isLast(std::int64_t index) const { return index == numBlocks_ - 1; }

    std::int64_t offsetOf(std::int64_t index) const;
    std::int64_t lengthOf(std::int64_t index) const;

private:
    BlockLayout(std::int64_t fileSize, std::int64_t blockSize);

    std::int64_t fileSize_;
    std::int64_t blockSize_;
    std::int64_t numBlocks_;
    std::int64_t highestBlockSize_;
};
