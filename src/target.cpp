#include "target.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <memory>

#include <curl/curl.h>
#include <fmt/core.h>

namespace
{
    using UrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

    UrlHandle makeUrlHandle()
    {
        UrlHandle handle(curl_url(), curl_url_cleanup);
        if (!handle)
        {
            throw std::runtime_error("Failed to allocate CURLU handle");
        }
        return handle;
    }

    // Extract one URL part as an owned string (curl allocates, we free)
    bool getPart(CURLU *handle, CURLUPart part, unsigned int flags, std::string &out)
    {
        char *value = nullptr;
        CURLUcode rc = curl_url_get(handle, part, &value, flags);
        if (rc != CURLUE_OK)
        {
            return false;
        }
        out = value;
        curl_free(value);
        return true;
    }
}

Target::Target(std::string url, std::string host, std::string path)
    : url_(std::move(url)), host_(std::move(host)), path_(std::move(path))
{
}

Target Target::parse(const std::string &raw)
{
    if (raw.empty())
    {
        throw InvalidUrlError("Invalid URL: input is empty");
    }

    UrlHandle handle = makeUrlHandle();

    // No CURLU_DEFAULT_SCHEME: a URL without a scheme is relative and rejected
    CURLUcode rc = curl_url_set(handle.get(), CURLUPART_URL, raw.c_str(), 0);
    if (rc != CURLUE_OK)
    {
        throw InvalidUrlError(fmt::format("Invalid URL '{}': {}", raw, curl_url_strerror(rc)));
    }

    std::string scheme;
    if (!getPart(handle.get(), CURLUPART_SCHEME, 0, scheme))
    {
        throw InvalidUrlError(fmt::format("Invalid URL '{}': missing scheme", raw));
    }
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    if (scheme != "http" && scheme != "https")
    {
        throw InvalidUrlError(fmt::format("Invalid URL '{}': unsupported scheme '{}' (expected http or https)",
                                          raw, scheme));
    }

    std::string host;
    if (!getPart(handle.get(), CURLUPART_HOST, 0, host) || host.empty())
    {
        throw InvalidUrlError(fmt::format("Invalid URL '{}': missing host", raw));
    }

    std::string normalized;
    if (!getPart(handle.get(), CURLUPART_URL, 0, normalized))
    {
        throw InvalidUrlError(fmt::format("Invalid URL '{}': cannot be normalized", raw));
    }

    std::string path;
    if (!getPart(handle.get(), CURLUPART_PATH, CURLU_URLDECODE, path))
    {
        path = "/";
    }

    return Target(std::move(normalized), std::move(host), std::move(path));
}

std::string lastPathSegment(const std::string &url)
{
    UrlHandle handle = makeUrlHandle();
    if (curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK)
    {
        return "";
    }

    std::string path;
    if (!getPart(handle.get(), CURLUPART_PATH, CURLU_URLDECODE, path))
    {
        return "";
    }

    auto slash = path.rfind('/');
    if (slash == std::string::npos)
    {
        return path;
    }
    return path.substr(slash + 1);
}
