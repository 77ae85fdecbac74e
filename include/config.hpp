#pragma once

#include <cstdint>
#include <optional>
#include <string>

/**
 * Configuration for one chained transfer.
 * Populated by the CLI11 argument parser from command-line arguments.
 */
struct StreamConfig
{
    // Required parameters
    std::string inputPath;
    std::string outputPath;

    // Optional parameters with sensible defaults
    std::int64_t blockSize = 1024;
    std::string cacheDir = "cache";

    // Root hash obtained out of band, format "sha256:abc123..."
    std::optional<std::string> expectedRoot;

    // Flags
    bool rootOnly = false;    // Build the chain, print the root hash, stop
    bool showVersion = false; // Display version and exit
};
