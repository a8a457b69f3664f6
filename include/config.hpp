#pragma once

#include <string>
#include <optional>

/**
 * Configuration for the parafetch CLI.
 * Populated by CLI11 argument parser from command-line arguments.
 */
struct DownloadConfig
{
    // Required parameters
    std::string url;

    // Optional parameters with sensible defaults
    std::string outputDirectory = ".";
    int connections = 4;         // Parallel range requests per job
    long probeTimeoutSeconds = 3; // Preliminary GET only
    int pollIntervalMs = 500;     // Pause detection latency

    // Checksum verification (optional)
    std::optional<std::string> expectedChecksum; // Format: "sha256:abc123..."

    // Flags
    bool quiet = false;       // No progress bar
    bool verbose = false;     // Engine informational output
    bool showVersion = false; // Display version and exit
};
