#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include <curl/curl.h>

/**
 * Response headers keyed by lower-cased header name.
 * Repeated headers are joined with ", " as HTTP allows.
 */
using HeaderMap = std::map<std::string, std::string>;

/**
 * Parameters of a single GET request.
 */
struct HttpRequest
{
    std::string url;

    // Inclusive byte range sent as "Range: bytes=first-last"; none = whole resource
    std::optional<std::pair<std::uint64_t, std::uint64_t>> range;

    long timeoutSeconds = 0; // 0 = no limit on the whole transfer
    long connectTimeoutSeconds = 30;
};

/**
 * Outcome of HttpClient::get. A transport failure is reported through
 * `result`, never thrown, so callers can map it to their own error kind.
 */
struct HttpResponse
{
    CURLcode result = CURLE_OK;
    std::string errorMessage; // libcurl's detailed message when result != CURLE_OK
    long status = 0;          // 0 if no response line was received
    HeaderMap headers;        // Headers of the final response (after redirects)
    std::string effectiveUrl;

    // True when the chunk handler asked to stop; result is then CURLE_WRITE_ERROR
    bool stoppedByHandler = false;

    bool transportOk() const { return result == CURLE_OK || stoppedByHandler; }
};

/**
 * HTTP client for ranged and plain GET requests using libcurl.
 * Uses RAII to manage CURL handle lifecycle. One client per thread:
 * a CURL easy handle must never be used from two threads at once.
 */
class HttpClient
{
public:
    /**
     * Receives body bytes as they arrive.
     * Return false to stop the transfer early.
     */
    using ChunkHandler = std::function<bool(const char *data, std::size_t size)>;

    HttpClient();
    ~HttpClient();

    // Delete copy operations (CURL handles aren't copyable)
    HttpClient(const HttpClient &) = delete;
    HttpClient &operator=(const HttpClient &) = delete;

    HttpClient(HttpClient &&) noexcept = default;
    HttpClient &operator=(HttpClient &&) noexcept = default;

    /**
     * Perform a GET request, streaming the body into `onChunk`.
     *
     * @param request URL, optional range and timeouts
     * @param onChunk Body consumer (may be empty to discard the body)
     * @return Status, headers and transport result
     */
    HttpResponse get(const HttpRequest &request, const ChunkHandler &onChunk);

    /**
     * Status code of the response currently being received.
     * Only meaningful from inside a chunk handler.
     */
    long currentStatus() const;

    /**
     * Get human-readable HTTP status text for a status code.
     */
    static std::string statusText(long code);

    /**
     * Initialize libcurl's global state once per process.
     * Called by the constructor; must happen before threads create handles.
     */
    static void globalInit();

private:
    // CURL handle with custom deleter (RAII pattern)
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_;

    struct TransferContext
    {
        HttpResponse *response = nullptr;
        const ChunkHandler *onChunk = nullptr;
    };

    /**
     * Static callback for libcurl to deliver body data.
     * libcurl is C library, so callbacks must be static or free functions.
     *
     * @return Number of bytes consumed (size * nmemb to continue, 0 to abort)
     */
    static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata);

    /**
     * Static callback for libcurl to deliver one header line at a time.
     * A status line ("HTTP/...") resets the map so only the final
     * response of a redirect chain is kept.
     */
    static size_t headerCallback(char *buffer, size_t size, size_t nitems, void *userdata);
};
