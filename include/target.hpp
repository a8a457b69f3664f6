#pragma once

#include <string>

/**
 * An immutable, validated absolute HTTP/HTTPS URL.
 * The only way to obtain one is Target::parse, so holding a Target
 * means the URL has already been checked.
 */
class Target
{
public:
    /**
     * Parse and normalize a raw URL using libcurl's URL API.
     *
     * @param raw User-supplied URL (must include scheme and host)
     * @return Validated target
     * @throws InvalidUrlError carrying the parser's diagnostic
     */
    static Target parse(const std::string &raw);

    /**
     * Normalized URL, as re-serialized by libcurl.
     */
    const std::string &url() const { return url_; }

    /**
     * URL-decoded path component (e.g. "/files/data.bin").
     */
    const std::string &path() const { return path_; }

    const std::string &host() const { return host_; }

    bool operator==(const Target &other) const { return url_ == other.url_; }
    bool operator!=(const Target &other) const { return !(*this == other); }

private:
    Target(std::string url, std::string host, std::string path);

    std::string url_;
    std::string host_;
    std::string path_;
};

/**
 * Last segment of a URL path, URL-decoded.
 * Example: "https://example.com/files/data.bin?x=1" → "data.bin"
 * Returns "" for a path ending in '/' or a URL that cannot be parsed.
 */
std::string lastPathSegment(const std::string &url);
