#include "block_server.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <stdexcept>

namespace fs = std::filesystem;

namespace
{
    bool endsWithZeroTrailer(const Bytes &payload)
    {
        if (payload.size() < 32)
        {
            return false;
        }
        for (size_t i = payload.size() - 32; i < payload.size(); ++i)
        {
            if (payload[i] != 0)
            {
                return false;
            }
        }
        return true;
    }

    Bytes concat(const Bytes &block, const Digest &digest)
    {
        Bytes joined = block;
        joined.insert(joined.end(), digest.begin(), digest.end());
        return joined;
    }
}

int main()
{
    TestRun run("block_server");

    try
    {
        fs::path dir = makeScratchDir("server");
        MemoryHashCache cache;
        ChainBuilder builder(cache);

        // 10240 bytes in 1024-byte blocks
        Bytes content = patternBytes(10240, 11);
        writeFile(dir / "aligned.bin", content);
        ChainInfo info = builder.build(dir / "aligned.bin", 1024);

        BlockServer server(cache, info);
        run.check(!server.isOpen(), "file is not opened by the constructor");

        std::optional<Bytes> root = server.request(0);
        run.check(root && root->size() == 32, "request 0 is the 32-byte root hash");
        run.check(root && std::equal(root->begin(), root->end(), cache.get(info.cacheKey, 0).begin()),
                  "root hash comes from cache index 0");
        run.check(!server.isOpen(), "root request does not open the file");

        bool payloadsCorrect = true;
        for (std::int64_t n = 1; n <= 9; ++n)
        {
            std::optional<Bytes> payload = server.request(n);
            Bytes block(content.begin() + (n - 1) * 1024, content.begin() + n * 1024);
            payloadsCorrect = payloadsCorrect && payload &&
                              *payload == concat(block, cache.get(info.cacheKey, n));
        }
        run.check(payloadsCorrect, "requests 1..9 are block n-1 followed by hash n");
        run.check(server.isOpen(), "file stays open between requests");

        std::optional<Bytes> last = server.request(10);
        run.check(last && last->size() == 1024 + 32, "request 10 is the full last block plus trailer");
        run.check(last && endsWithZeroTrailer(*last), "last block carries the zero trailer");
        run.check(!server.isOpen(), "file is released after the last block");
        run.check(server.exhausted(), "server is exhausted after the last block");

        bool staysEnded = true;
        for (std::int64_t n = 11; n <= 16; ++n)
        {
            staysEnded = staysEnded && !server.request(n).has_value();
        }
        run.check(staysEnded, "requests past the last block are end-of-stream, repeatably");
        run.check(!server.request(3).has_value(), "an exhausted server does not rewind");
        run.check(server.request(0).has_value(), "root hash stays available");

        // Requests may skip ahead; an overshoot ends the stream
        BlockServer jumper(cache, info);
        run.check(!jumper.request(40).has_value(), "overshooting request is end-of-stream");
        run.check(!jumper.request(1).has_value(), "end-of-stream is sticky after an overshoot");

        // 11-byte file: one block, no intermediate chain hash
        Bytes tiny = patternBytes(11, 12);
        writeFile(dir / "tiny.bin", tiny);
        BlockServer tinyServer(cache, builder.build(dir / "tiny.bin", 1024));
        std::optional<Bytes> only = tinyServer.request(1);
        run.check(only && only->size() == 43, "11-byte file serves 11 bytes plus trailer");
        run.check(only && Bytes(only->begin(), only->begin() + 11) == tiny, "content bytes are the file");
        run.check(only && endsWithZeroTrailer(*only), "single block ends the chain");
        run.check(!tinyServer.request(2).has_value(), "request 2 is end-of-stream");

        // Early termination
        BlockServer early(cache, info);
        early.request(1);
        run.check(early.isOpen(), "first block request opens the file");
        early.close();
        early.close();
        run.check(!early.isOpen(), "close releases the handle, twice is harmless");
        std::optional<Bytes> reopened = early.request(2);
        run.check(reopened && reopened->size() == 1024 + 32, "a closed session reopens lazily");

        // Failures
        run.expectThrow<std::invalid_argument>([&] { early.request(-1); }, "negative request number");

        MemoryHashCache empty;
        BlockServer unbuilt(empty, info);
        run.expectChainError(ChainErrorKind::CacheMiss, [&] { unbuilt.request(0); },
                             "root request without pre-processing is a CacheMiss");
        run.expectChainError(ChainErrorKind::CacheMiss, [&] { unbuilt.request(1); },
                             "block request without the next hash is a CacheMiss");
        run.check(!unbuilt.isOpen(), "handle is released on the error path");

        // File shrank after pre-processing: the read comes up short
        writeFile(dir / "shrinking.bin", patternBytes(3000, 13));
        ChainInfo shrinkInfo = builder.build(dir / "shrinking.bin", 1024);
        writeFile(dir / "shrinking.bin", patternBytes(2500, 13));
        BlockServer shrinking(cache, shrinkInfo);
        shrinking.request(1);
        try
        {
            shrinking.request(3);
            run.check(false, "short read is reported");
        }
        catch (const ChainError &e)
        {
            run.check(e.kind() == ChainErrorKind::IOFailure, "short read is an IOFailure");
            run.check(e.partialData().size() == 452, "IOFailure carries the partial block");
        }
        run.check(!shrinking.isOpen(), "handle is released after a failed read");

        fs::remove_all(dir);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }

    return run.finish();
}
