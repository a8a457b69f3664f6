#include "checksum.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <memory>
#include <vector>
#include <stdexcept>

#include <fmt/core.h>

// OpenSSL EVP ("Envelope") digest API
#include <openssl/evp.h>

namespace
{
    /**
     * RAII wrapper around an EVP SHA-256 digest context.
     */
    class Sha256Digest
    {
    public:
        Sha256Digest() : context_(EVP_MD_CTX_new(), EVP_MD_CTX_free)
        {
            if (!context_)
            {
                throw std::runtime_error("Failed to create OpenSSL context");
            }
            if (EVP_DigestInit_ex(context_.get(), EVP_sha256(), nullptr) != 1)
            {
                throw std::runtime_error("Failed to initialize SHA-256 digest");
            }
        }

        void update(const char *data, size_t length)
        {
            if (EVP_DigestUpdate(context_.get(), data, length) != 1)
            {
                throw std::runtime_error("Failed to update SHA-256 digest");
            }
        }

        // Returns the raw digest bytes; the context cannot be reused afterwards
        std::vector<unsigned char> finish()
        {
            std::vector<unsigned char> digest(EVP_MAX_MD_SIZE);
            unsigned int length = 0;
            if (EVP_DigestFinal_ex(context_.get(), digest.data(), &length) != 1)
            {
                throw std::runtime_error("Failed to finalize SHA-256 digest");
            }
            digest.resize(length);
            return digest;
        }

    private:
        std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context_;
    };
}

std::string ChecksumVerifier::computeSHA256(const std::filesystem::path &filePath)
{
    std::ifstream file(filePath, std::ios::binary);
    if (!file)
    {
        throw std::runtime_error(
            fmt::format("Cannot open file for checksum: {}", filePath.string()));
    }

    Sha256Digest digest;
    std::vector<char> buffer(CHUNK_SIZE);

    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0)
    {
        digest.update(buffer.data(), static_cast<size_t>(file.gcount()));
    }
    if (file.bad())
    {
        throw std::runtime_error(
            fmt::format("Read error while hashing: {}", filePath.string()));
    }

    auto hash = digest.finish();
    return toHex(hash.data(), hash.size());
}

bool ChecksumVerifier::verify(const std::filesystem::path &filePath,
                              const std::string &expectedChecksum)
{
    std::string expectedHash = parseChecksum(expectedChecksum).second;
    return computeSHA256(filePath) == expectedHash;
}

std::pair<ChecksumVerifier::Algorithm, std::string>
ChecksumVerifier::parseChecksum(const std::string &checksumString)
{
    size_t colonPos = checksumString.find(':');
    if (colonPos == std::string::npos)
    {
        throw std::runtime_error(
            "Invalid checksum format. Expected 'algorithm:hexhash'");
    }

    std::string algorithmStr = checksumString.substr(0, colonPos);
    std::transform(algorithmStr.begin(), algorithmStr.end(), algorithmStr.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });

    if (algorithmStr != "sha256")
    {
        throw std::runtime_error(
            fmt::format("Unsupported algorithm: '{}' (only sha256 is supported)", algorithmStr));
    }

    std::string normalizedHex = normalizeHex(checksumString.substr(colonPos + 1));

    // 256 bits / 4 bits per hex digit
    if (normalizedHex.length() != 64)
    {
        throw std::runtime_error(
            fmt::format("Invalid sha256 hash length. Expected 64 hex characters, got {}",
                        normalizedHex.length()));
    }

    return {Algorithm::SHA256, normalizedHex};
}

std::string ChecksumVerifier::toHex(const unsigned char *data, size_t length)
{
    static const char digits[] = "0123456789abcdef";

    std::string result;
    result.reserve(length * 2);
    for (size_t i = 0; i < length; ++i)
    {
        result += digits[data[i] >> 4];
        result += digits[data[i] & 0x0F];
    }
    return result;
}

std::string ChecksumVerifier::normalizeHex(const std::string &hex)
{
    std::string result;
    result.reserve(hex.length());

    for (char ch : hex)
    {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isspace(c))
        {
            continue;
        }

        if (!std::isxdigit(c))
        {
            throw std::runtime_error(
                fmt::format("Invalid character in checksum: '{}'", ch));
        }
        result += static_cast<char>(std::tolower(c));
    }

    return result;
}
