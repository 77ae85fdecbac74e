#include "block_server.hpp"
#include "chain_error.hpp"

#include <stdexcept>
#include <fmt/core.h>

BlockServer::BlockServer(const HashCache &cache, ChainInfo info)
    : cache_(cache), info_(std::move(info))
{
}

std::optional<Bytes> BlockServer::request(std::int64_t requestNumber)
{
    if (requestNumber < 0)
    {
        throw std::invalid_argument(
            fmt::format("Request number must be >= 0, got {}", requestNumber));
    }

    if (requestNumber == 0)
    {
        Digest root = cache_.get(info_.cacheKey, 0);
        return Bytes(root.begin(), root.end());
    }

    // request 1 returns block 0, request 2 returns block 1
    std::int64_t blockIndex = requestNumber - 1;

    // Once past the end, stay there
    if (exhausted_ || blockIndex >= info_.layout.numBlocks())
    {
        exhausted_ = true;
        close();
        return std::nullopt;
    }

    try
    {
        Bytes payload = serveBlock(blockIndex);
        if (info_.layout.isLast(blockIndex))
        {
            exhausted_ = true;
            close();
        }
        return payload;
    }
    catch (...)
    {
        close();
        throw;
    }
}

Bytes BlockServer::serveBlock(std::int64_t blockIndex)
{
    if (!file_)
    {
        fmt::print("[server] Opening \"{}\"\n", info_.path.string());
        file_ = std::make_unique<BlockFile>(info_.path);
    }

    Bytes block = file_->readBlock(info_.layout, blockIndex);

    // Next block's chain hash, or the zero sentinel after the last block
    Digest trailer = info_.layout.isLast(blockIndex)
                         ? zeroDigest()
                         : cache_.get(info_.cacheKey, blockIndex + 1);

    block.insert(block.end(), trailer.begin(), trailer.end());
    return block;
}

void BlockServer::close()
{
    if (file_)
    {
        file_->close();
        file_.reset();
    }
}
