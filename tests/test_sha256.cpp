#include "sha256.hpp"
#include "test_support.hpp"

#include <stdexcept>

int main()
{
    TestRun run("sha256");

    try
    {
        const std::string abcHex = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
        const std::string emptyHex = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

        // Test 1: Known answers
        run.check(toHex(Sha256::digest(std::string("abc"))) == abcHex, "digest of \"abc\"");
        run.check(toHex(Sha256::digest(Bytes{})) == emptyHex, "digest of empty input");

        // Test 2: Incremental updates match the one-shot digest
        Bytes data = patternBytes(5000, 3);
        Sha256 hasher;
        hasher.update(data.data(), 1234);
        hasher.update(data.data() + 1234, data.size() - 1234);
        run.check(hasher.finalize() == Sha256::digest(data), "split update equals one-shot digest");
        run.expectThrow<std::logic_error>([&] { hasher.finalize(); }, "finalize twice is rejected");

        // Test 3: Whole-file digest
        std::filesystem::path dir = makeScratchDir("sha256");
        Bytes big = patternBytes(3 * 1024 * 1024 + 17, 9);
        writeFile(dir / "big.bin", big);
        run.check(Sha256::digestFile(dir / "big.bin") == Sha256::digest(big),
                  "file digest spans several read chunks");
        run.expectChainError(ChainErrorKind::IOFailure,
                             [&] { Sha256::digestFile(dir / "missing.bin"); },
                             "missing file is an IOFailure");

        // Test 4: Parsing root hashes given on the command line
        Digest abc = Sha256::digest(std::string("abc"));
        run.check(parseDigest("sha256:" + abcHex) == abc, "parse sha256: prefix");
        run.check(parseDigest(abcHex) == abc, "parse bare hex");
        run.check(parseDigest("SHA256:BA7816BF-8F01CFEA 414140DE5DAE2223B00361A396177A9CB410FF61F20015AD") == abc,
                  "parse ignores case and separators");
        run.expectThrow<std::runtime_error>([&] { parseDigest("md5:" + abcHex); }, "reject other algorithms");
        run.expectThrow<std::runtime_error>([&] { parseDigest(abcHex.substr(2)); }, "reject short digest");
        run.expectThrow<std::runtime_error>([&] { parseDigest("\xc3\xa9sha256:" + abcHex); },
                                            "reject a non-ASCII algorithm prefix");
        run.expectThrow<std::runtime_error>([&] { parseDigest("zz" + abcHex.substr(2)); }, "reject non-hex");

        // Test 5: Terminal sentinel
        run.check(isZeroDigest(zeroDigest()), "zero digest is all zeros");
        run.check(!isZeroDigest(abc), "real digest is not the sentinel");

        std::filesystem::remove_all(dir);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }

    return run.finish();
}
