#include "block_file.hpp"
#include "chain_error.hpp"

#include <fmt/core.h>

BlockFile::BlockFile(const std::filesystem::path &path)
    : path_(path), stream_(path, std::ios::binary)
{
    if (!stream_)
    {
        throw ChainError(ChainErrorKind::IOFailure,
                         fmt::format("Cannot open file for reading: {}", path_.string()));
    }
}

Bytes BlockFile::readBlock(const BlockLayout &layout, std::int64_t index)
{
    if (!stream_.is_open())
    {
        throw ChainError(ChainErrorKind::IOFailure,
                         fmt::format("File {} is closed", path_.string()));
    }

    std::int64_t offset = layout.offsetOf(index);
    std::int64_t length = layout.lengthOf(index);

    // A previous short read leaves eof/fail set; seekg would refuse to move
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!stream_)
    {
        throw ChainError(ChainErrorKind::IOFailure,
                         fmt::format("Seek to offset {} failed in {}", offset, path_.string()));
    }

    Bytes block(static_cast<size_t>(length));
    stream_.read(reinterpret_cast<char *>(block.data()), static_cast<std::streamsize>(length));
    std::streamsize bytesRead = stream_.gcount();
    if (bytesRead != static_cast<std::streamsize>(length))
    {
        block.resize(static_cast<size_t>(bytesRead));
        throw ChainError(
            fmt::format("Short read of block {} in {}: expected {} bytes, got {}",
                        index, path_.string(), length, bytesRead),
            std::move(block));
    }

    return block;
}

void BlockFile::close()
{
    if (stream_.is_open())
    {
        stream_.close();
    }
}
