#include "capability_prober.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <filesystem>

#include <fmt/core.h>

namespace
{
    std::string trimWhitespace(const std::string &value)
    {
        auto begin = value.find_first_not_of(" \t");
        if (begin == std::string::npos)
        {
            return "";
        }
        auto end = value.find_last_not_of(" \t");
        return value.substr(begin, end - begin + 1);
    }

    std::string trimQuotes(const std::string &value)
    {
        auto begin = value.find_first_not_of("\"'");
        if (begin == std::string::npos)
        {
            return "";
        }
        auto end = value.find_last_not_of("\"'");
        return value.substr(begin, end - begin + 1);
    }

    bool startsWithNoCase(const std::string &value, const std::string &prefix)
    {
        if (value.size() < prefix.size())
        {
            return false;
        }
        return std::equal(prefix.begin(), prefix.end(), value.begin(),
                          [](char a, char b)
                          { return std::tolower(static_cast<unsigned char>(a)) ==
                                   std::tolower(static_cast<unsigned char>(b)); });
    }

    // Header values must not carry control characters (obs-text above 0x7F is allowed)
    void requireReadable(const std::string &name, const std::string &value)
    {
        for (unsigned char c : value)
        {
            if ((c < 0x20 && c != '\t') || c == 0x7F)
            {
                throw ProbeError(ProbeError::Kind::MalformedHeader,
                                 fmt::format("{} header contains unreadable characters", name));
            }
        }
    }

    const std::string *findHeader(const HeaderMap &headers, const std::string &name)
    {
        auto it = headers.find(name);
        return it == headers.end() ? nullptr : &it->second;
    }
}

CapabilityProber::CapabilityProber(long timeoutSeconds) : timeoutSeconds_(timeoutSeconds)
{
}

CapabilityInfo CapabilityProber::probe(const Target &target)
{
    HttpClient client;

    HttpRequest request;
    request.url = target.url();
    request.timeoutSeconds = timeoutSeconds_;
    request.connectTimeoutSeconds = timeoutSeconds_;

    // GET rather than HEAD: some origins omit Accept-Ranges on HEAD.
    // The headers are all we need, so stop at the first body chunk.
    HttpResponse response = client.get(request, [](const char *, std::size_t)
                                       { return false; });

    if (!response.transportOk())
    {
        auto kind = response.result == CURLE_OPERATION_TIMEDOUT ? ProbeError::Kind::Timeout
                                                                : ProbeError::Kind::Network;
        throw ProbeError(kind, fmt::format("Probe request to {} failed: {}",
                                           target.url(), response.errorMessage));
    }

    if (response.status >= 400)
    {
        throw ProbeError(ProbeError::Kind::UnexpectedStatus,
                         fmt::format("Probe request to {} returned HTTP {}: {}",
                                     target.url(), response.status,
                                     HttpClient::statusText(response.status)));
    }

    return interpret(response.headers, response.effectiveUrl);
}

CapabilityInfo CapabilityProber::interpret(const HeaderMap &headers, const std::string &effectiveUrl)
{
    CapabilityInfo info;

    // Content-Length
    if (const std::string *value = findHeader(headers, "content-length"))
    {
        std::uint64_t length = 0;
        const char *first = value->data();
        const char *last = first + value->size();
        auto [ptr, ec] = std::from_chars(first, last, length);
        if (value->empty() || ec != std::errc() || ptr != last)
        {
            throw ProbeError(ProbeError::Kind::MalformedHeader,
                             fmt::format("Content-Length isn't a valid number: '{}'", *value));
        }
        info.totalLength = length;
    }

    // Accept-Ranges
    if (const std::string *value = findHeader(headers, "accept-ranges"))
    {
        requireReadable("Accept-Ranges", *value);
        info.supportsRanges = value->find("bytes") != std::string::npos ? RangeSupport::Yes
                                                                        : RangeSupport::No;
    }

    // Content-Type
    if (const std::string *value = findHeader(headers, "content-type"))
    {
        requireReadable("Content-Type", *value);
        info.contentType = *value;
    }

    // File name: Content-Disposition, then URL path, then fallback
    std::string fileName;
    if (const std::string *value = findHeader(headers, "content-disposition"))
    {
        requireReadable("Content-Disposition", *value);
        auto fromHeader = fileNameFromDisposition(*value);
        if (!fromHeader)
        {
            throw ProbeError(ProbeError::Kind::MalformedHeader,
                             fmt::format("Filename not found in Content-Disposition header: '{}'", *value));
        }
        fileName = *fromHeader;
    }
    else
    {
        fileName = lastPathSegment(effectiveUrl);
    }
    info.suggestedFileName = sanitizeFileName(fileName);

    return info;
}

std::optional<std::string> CapabilityProber::fileNameFromDisposition(const std::string &disposition)
{
    size_t start = 0;
    while (start <= disposition.size())
    {
        size_t end = disposition.find(';', start);
        if (end == std::string::npos)
        {
            end = disposition.size();
        }

        std::string part = trimWhitespace(disposition.substr(start, end - start));
        if (startsWithNoCase(part, "filename="))
        {
            std::string name = trimQuotes(trimWhitespace(part.substr(9)));
            if (name.empty())
            {
                return std::nullopt;
            }
            return name;
        }
        start = end + 1;
    }
    return std::nullopt;
}

std::string CapabilityProber::sanitizeFileName(const std::string &name)
{
    // Treat backslashes as separators too, a Windows-style name must not survive
    std::string normalized = name;
    std::replace(normalized.begin(), normalized.end(), '\\', '/');

    std::string base = std::filesystem::path(normalized).filename().string();
    if (base.empty() || base == "." || base == "..")
    {
        return FALLBACK_FILE_NAME;
    }
    return base;
}

const char *toString(RangeSupport support)
{
    switch (support)
    {
    case RangeSupport::Yes:
        return "yes";
    case RangeSupport::No:
        return "no";
    case RangeSupport::Unknown:
        break;
    }
    return "unknown";
}
