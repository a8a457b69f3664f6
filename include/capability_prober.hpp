#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "http_client.hpp"
#include "target.hpp"

/**
 * Whether the origin honors "Range: bytes=..." requests.
 */
enum class RangeSupport
{
    Yes,
    No,
    Unknown // Accept-Ranges header was absent
};

/**
 * What the preliminary request told us about the resource.
 * Produced once per job and read-only afterwards.
 */
struct CapabilityInfo
{
    RangeSupport supportsRanges = RangeSupport::Unknown;
    std::optional<std::uint64_t> totalLength;
    std::optional<std::string> contentType;
    std::optional<std::string> suggestedFileName;
};

/**
 * Issues a preliminary GET and derives range support, length,
 * MIME type and a file name from the response headers.
 */
class CapabilityProber
{
public:
    static constexpr long DEFAULT_TIMEOUT_SECONDS = 3;
    static constexpr const char *FALLBACK_FILE_NAME = "download_file";

    explicit CapabilityProber(long timeoutSeconds = DEFAULT_TIMEOUT_SECONDS);

    /**
     * Probe the target. Only the response headers are read; the body
     * transfer is stopped as soon as the first chunk arrives.
     *
     * @throws ProbeError on transport failure, timeout, HTTP error status
     *         or malformed Content-Length / Content-Disposition
     */
    CapabilityInfo probe(const Target &target);

    /**
     * Derive CapabilityInfo from already received headers.
     *
     * @param headers Lower-cased response headers
     * @param effectiveUrl URL the response came from (after redirects)
     * @throws ProbeError(MalformedHeader)
     */
    static CapabilityInfo interpret(const HeaderMap &headers, const std::string &effectiveUrl);

    /**
     * Extract the filename= parameter of a Content-Disposition value,
     * stripped of surrounding quotes. Empty optional if there is none.
     */
    static std::optional<std::string> fileNameFromDisposition(const std::string &disposition);

    /**
     * Reduce a server-provided name to a bare file name so it cannot
     * point outside the output directory.
     */
    static std::string sanitizeFileName(const std::string &name);

private:
    long timeoutSeconds_;
};

const char *toString(RangeSupport support);
