#include "stream_pipeline.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;

namespace
{
    StreamConfig configFor(const fs::path &input, const fs::path &output, std::int64_t blockSize)
    {
        StreamConfig config;
        config.inputPath = input.string();
        config.outputPath = output.string();
        config.blockSize = blockSize;
        return config;
    }
}

int main()
{
    TestRun run("stream_roundtrip");

    try
    {
        fs::path dir = makeScratchDir("stream");
        DirectoryHashCache cache(dir / "cache");

        struct Case
        {
            const char *name;
            size_t size;
            std::int64_t blockSize;
            std::int64_t blocks;
        };
        const Case cases[] = {
            {"10blocks", 10240, 1024, 10},
            {"misaligned", 10241, 1024, 11},
            {"tiny", 11, 1024, 1},
            {"largerFile", 5411 * 4096 - 100, 4096, 5411},
        };

        unsigned seed = 30;
        for (const Case &c : cases)
        {
            fs::path input = dir / fmt::format("{}.in", c.name);
            fs::path output = dir / fmt::format("{}.out", c.name);
            writeFile(input, patternBytes(c.size, seed++));

            StreamReport report = streamFile(cache, configFor(input, output, c.blockSize));
            run.check(report.blocks == c.blocks, fmt::format("{}: {} blocks streamed", c.name, c.blocks));
            run.check(report.bytes == static_cast<std::int64_t>(c.size), fmt::format("{}: byte count", c.name));
            run.check(Sha256::digestFile(output) == Sha256::digestFile(input),
                      fmt::format("{}: output digest equals input digest", c.name));
            run.check(readFile(output) == readFile(input), fmt::format("{}: output bytes equal input", c.name));
        }

        // Second run reuses the cached chain and overwrites the output
        fs::path input = dir / "10blocks.in";
        fs::path output = dir / "10blocks.out";
        writeFile(output, Bytes(50000, 0xee));
        StreamReport cached = streamFile(cache, configFor(input, output, 1024));
        run.check(cached.cacheHit, "second run is a cache hit");
        run.check(readFile(output) == readFile(input), "stale output is replaced");

        // Out-of-band root hash
        StreamConfig rootOnly = configFor(input, "", 1024);
        Digest root = publishRoot(cache, rootOnly);
        run.check(root == cached.rootHash, "published root equals the streamed root");

        StreamConfig trusted = configFor(input, dir / "trusted.out", 1024);
        trusted.expectedRoot = "sha256:" + toHex(root);
        run.check(streamFile(cache, trusted).blocks == 10, "matching trusted root streams");

        StreamConfig distrusted = configFor(input, dir / "distrusted.out", 1024);
        Digest wrong = root;
        wrong[31] ^= 0x01;
        distrusted.expectedRoot = toHex(wrong);
        run.expectChainError(ChainErrorKind::VerificationFailed, [&] { streamFile(cache, distrusted); },
                             "mismatching trusted root is refused");
        run.check(!fs::exists(dir / "distrusted.out"), "nothing is written before the root is trusted");

        // Tampered cache: a wrong chain hash stops the stream midway
        const std::string key = cacheKeyFor(input);
        Digest poisoned = cache.get(key, 5);
        poisoned[0] ^= 0xff;
        cache.put(key, 5, poisoned);
        run.expectChainError(ChainErrorKind::VerificationFailed,
                             [&] { streamFile(cache, configFor(input, dir / "poisoned.out", 1024)); },
                             "poisoned chain hash is detected");
        run.check(fs::file_size(dir / "poisoned.out") == 4 * 1024,
                  "only blocks verified before the poisoned hash were written");

        // Changing the block size on a cached file is a config error, not tampering
        fs::path reblocked = dir / "reblocked.in";
        writeFile(reblocked, patternBytes(4096, 40));
        run.check(streamFile(cache, configFor(reblocked, dir / "reblocked.out", 1024)).blocks == 4,
                  "first stream at block size 1024");
        run.expectChainError(ChainErrorKind::CacheCorrupt,
                             [&] { streamFile(cache, configFor(reblocked, dir / "reblocked-512.out", 512)); },
                             "same file at block size 512 reports the cached block size");

        run.expectChainError(ChainErrorKind::NotARegularFile,
                             [&] { streamFile(cache, configFor(dir / "absent.in", dir / "absent.out", 1024)); },
                             "missing input");

        fs::remove_all(dir);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }

    return run.finish();
}
