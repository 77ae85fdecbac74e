#include "stream_pipeline.hpp"
#include "block_server.hpp"
#include "chain_builder.hpp"
#include "chain_error.hpp"
#include "chain_verifier.hpp"

#include <fstream>
#include <fmt/core.h>

Digest publishRoot(HashCache &cache, const StreamConfig &config)
{
    ChainBuilder builder(cache);
    BlockServer server(cache, builder.build(config.inputPath, config.blockSize));

    // Request 0 is never end-of-stream
    Digest root = ChainVerifier::readRootHash(server.request(0).value());
    fmt::print("sha256:{}\n", toHex(root));
    return root;
}

StreamReport streamFile(HashCache &cache, const StreamConfig &config)
{
    ChainBuilder builder(cache);
    BlockServer server(cache, builder.build(config.inputPath, config.blockSize));

    StreamReport report;
    report.cacheHit = server.info().cacheHit;
    report.rootHash = ChainVerifier::readRootHash(server.request(0).value());

    // Out-of-band trust: refuse a chain rooted anywhere else
    if (config.expectedRoot)
    {
        Digest expected = parseDigest(config.expectedRoot.value());
        if (expected != report.rootHash)
        {
            throw ChainError(ChainErrorKind::VerificationFailed,
                             fmt::format("Root hash mismatch, trusted: {}, served: {}",
                                         toHex(expected), toHex(report.rootHash)));
        }
    }

    std::ofstream out(config.outputPath, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        throw ChainError(ChainErrorKind::IOFailure,
                         fmt::format("Cannot open file for writing: {}", config.outputPath));
    }

    ChainReader reader(report.rootHash);

    for (std::int64_t i = 1;; ++i)
    {
        std::optional<Bytes> payload = server.request(i);
        if (!payload)
        {
            break;
        }
        if (reader.finished())
        {
            throw ChainError(ChainErrorKind::VerificationFailed,
                             fmt::format("Request {} served data after the terminal block", i));
        }

        Bytes block = reader.accept(payload.value());
        out.write(reinterpret_cast<const char *>(block.data()),
                  static_cast<std::streamsize>(block.size()));
        if (!out)
        {
            throw ChainError(ChainErrorKind::IOFailure,
                             fmt::format("Failed writing block {} to {}", i - 1, config.outputPath));
        }

        report.blocks += 1;
        report.bytes += static_cast<std::int64_t>(block.size());
    }

    if (!reader.finished())
    {
        throw ChainError(ChainErrorKind::VerificationFailed,
                         fmt::format("Stream ended after {} blocks without a terminal block",
                                     report.blocks));
    }

    out.close();
    if (!out)
    {
        throw ChainError(ChainErrorKind::IOFailure,
                         fmt::format("Failed to flush {}", config.outputPath));
    }

    fmt::print("[stream] Success: end of stream ({} blocks, {} bytes)\n",
               report.blocks, report.bytes);
    return report;
}
