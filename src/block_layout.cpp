#include "block_layout.hpp"
#include "chain_error.hpp"

#include <cstdio>
#include <stdexcept>
#include <fmt/core.h>

BlockLayout::BlockLayout(std::int64_t fileSize, std::int64_t blockSize)
    : fileSize_(fileSize),
      blockSize_(blockSize),
      numBlocks_((fileSize - 1) / blockSize + 1),
      highestBlockSize_((fileSize - 1) % blockSize + 1) // always > 0
{
}

BlockLayout BlockLayout::fromFileSize(std::int64_t fileSize, std::int64_t blockSize)
{
    if (blockSize <= 0)
    {
        throw ChainError(ChainErrorKind::InvalidBlockSize,
                         fmt::format("Invalid block size {}", blockSize));
    }
    if (fileSize <= 0)
    {
        // An empty file has no first block for the root hash to commit to
        throw ChainError(ChainErrorKind::NotARegularFile,
                         fmt::format("Cannot chain an empty file (size {})", fileSize));
    }
    return BlockLayout(fileSize, blockSize);
}

std::int64_t BlockLayout::coerceBlockSize(std::int64_t requested)
{
    if (requested <= 0)
    {
        fmt::print(stderr, "Warning: invalid block size {}, defaulting to {}\n",
                   requested, DEFAULT_BLOCK_SIZE);
        return DEFAULT_BLOCK_SIZE;
    }
    return requested;
}

std::int64_t BlockLayout::offsetOf(std::int64_t index) const
{
    if (!contains(index))
    {
        throw std::out_of_range(
            fmt::format("Block index {} outside [0, {})", index, numBlocks_));
    }
    return blockSize_ * index;
}

std::int64_t BlockLayout::lengthOf(std::int64_t index) const
{
    if (!contains(index))
    {
        throw std::out_of_range(
            fmt::format("Block index {} outside [0, {})", index, numBlocks_));
    }
    return isLast(index) ? highestBlockSize_ : blockSize_;
}
