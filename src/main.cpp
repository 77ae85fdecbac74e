#include <iostream>
#include <fmt/core.h>
#include <CLI/CLI.hpp> // CLI11 main header
#include "chain_error.hpp"
#include "config.hpp"
#include "hash_cache.hpp"
#include "sha256.hpp"
#include "stream_pipeline.hpp"

int main(int argc, char *argv[])
{
    // Quick check for --version flag before full parsing
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--version" || arg == "-v") {
            fmt::print("chainstream v1.0\n");
            fmt::print("Built with:\n");
            fmt::print("  - OpenSSL: SHA-256 chain hashes\n");
            fmt::print("  - CLI11: Command-line parsing\n");
            fmt::print("  - fmt: Modern string formatting\n");
            return 0;
        }
    }

    CLI::App app{"chainstream v1.0 - Incrementally verified block transfer"};

    StreamConfig config;

    // ====================================================================
    // DEFINE ARGUMENTS
    // ====================================================================

    app.add_option("INPUT", config.inputPath, "File to split into hash-chained blocks")
        ->required()
        ->check(CLI::ExistingFile);

    app.add_option("OUTPUT", config.outputPath, "File to reassemble the verified blocks into");

    app.add_option("-b,--block-size", config.blockSize,
                   "Block size in bytes (non-positive values fall back to 1024)")
        ->default_val(1024);

    app.add_option("--cache-dir", config.cacheDir, "Directory holding per-file chain hashes")
        ->default_val("cache");

    app.add_option("--root", config.expectedRoot,
                   "Trusted root hash in format 'sha256:hexhash'")
        ->check([](const std::string &root) -> std::string {
            if (root.empty()) return "";
            try {
                parseDigest(root);
                return ""; // Valid
            } catch (const std::exception &e) {
                return std::string("Invalid root hash: ") + e.what();
            }
        });

    app.add_flag("--root-only", config.rootOnly,
                 "Build the chain and print its root hash without streaming");

    // Actual handling is done above
    app.add_flag("-v,--version", config.showVersion, "Display version information");

    // ====================================================================
    // PARSE ARGUMENTS
    // ====================================================================

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        return app.exit(e);
    }

    if (!config.rootOnly && config.outputPath.empty())
    {
        fmt::print(stderr, "Error: OUTPUT is required unless --root-only is given\n");
        return 1;
    }

    // ====================================================================
    // BUILD AND STREAM
    // ====================================================================

    try
    {
        DirectoryHashCache cache(config.cacheDir);

        if (config.rootOnly)
        {
            publishRoot(cache, config);
            return 0;
        }

        fmt::print("Streaming {} -> {} (block size {})\n\n",
                   config.inputPath, config.outputPath, config.blockSize);

        StreamReport report = streamFile(cache, config);

        fmt::print("\n✓ Transfer verified{}\n", report.cacheHit ? " (cached chain)" : "");
        fmt::print("  Root:   sha256:{}\n", toHex(report.rootHash));
        fmt::print("  Blocks: {}\n", report.blocks);
        fmt::print("  Bytes:  {}\n", report.bytes);
        return 0;
    }
    catch (const ChainError &e)
    {
        fmt::print(stderr, "✗ {}: {}\n", kindName(e.kind()), e.what());
        return 1;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "✗ Fatal error: {}\n", e.what());
        return 1;
    }
}
