#pragma once

#include <filesystem>
#include <string>
#include <utility>

/**
 * Integrity verification of downloaded payloads using SHA-256.
 */
class ChecksumVerifier
{
public:
    enum class Algorithm
    {
        SHA256
    };

    /**
     * Compute SHA-256 hash of a file, reading it in chunks.
     *
     * @param filePath Path to file to hash
     * @return Hex-encoded hash string (64 characters)
     * @throws std::runtime_error if file cannot be read
     */
    static std::string computeSHA256(const std::filesystem::path &filePath);

    /**
     * Verify a file matches an expected checksum.
     *
     * @param filePath Path to file to verify
     * @param expectedChecksum Expected hash in format "sha256:hexhash"
     * @return true if checksums match, false otherwise
     * @throws std::runtime_error if format is invalid
     */
    static bool verify(const std::filesystem::path &filePath,
                       const std::string &expectedChecksum);

    /**
     * Parse checksum string into algorithm and normalized hash.
     * Format: "algorithm:hexhash" (algorithm name is case-insensitive)
     *
     * @throws std::runtime_error if format is invalid or algorithm unsupported
     */
    static std::pair<Algorithm, std::string> parseChecksum(const std::string &checksumStr);

private:
    /**
     * Convert binary data to lowercase hex.
     * Example: {0x01, 0xFF} → "01ff"
     */
    static std::string toHex(const unsigned char *data, size_t length);

    /**
     * Lowercase a hex string and drop whitespace so comparison is case-insensitive.
     */
    static std::string normalizeHex(const std::string &hex);

    // Chunk size for file reading (1 MB)
    static constexpr size_t CHUNK_SIZE = 1024 * 1024;
};
