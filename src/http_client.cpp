#include "http_client.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <stdexcept>

#include <fmt/core.h>

namespace
{
    std::string trim(const std::string &value)
    {
        auto begin = value.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos)
        {
            return "";
        }
        auto end = value.find_last_not_of(" \t\r\n");
        return value.substr(begin, end - begin + 1);
    }

    std::string toLower(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return value;
    }
}

void HttpClient::globalInit()
{
    static std::once_flag initFlag;
    std::call_once(initFlag, []()
                   {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
        {
            throw std::runtime_error("curl_global_init failed");
        } });
}

HttpClient::HttpClient() : curl_(nullptr, curl_easy_cleanup)
{
    globalInit();

    curl_.reset(curl_easy_init());
    if (!curl_)
    {
        throw std::runtime_error("Failed to initialized CURL (out of memory or library error)");
    }
}

// Destructor: unique_ptr handles cleanup automatically
HttpClient::~HttpClient() = default;

size_t HttpClient::writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    size_t totalSize = size * nmemb;
    auto *context = static_cast<TransferContext *>(userdata);

    if (context->onChunk == nullptr || !*context->onChunk)
    {
        return totalSize; // Nobody wants the body, drop it
    }

    if (!(*context->onChunk)(ptr, totalSize))
    {
        context->response->stoppedByHandler = true;
        return 0; // libcurl aborts with CURLE_WRITE_ERROR
    }
    return totalSize;
}

size_t HttpClient::headerCallback(char *buffer, size_t size, size_t nitems, void *userdata)
{
    size_t totalSize = size * nitems;
    auto *context = static_cast<TransferContext *>(userdata);
    std::string line(buffer, totalSize);

    // New response in a redirect chain (or after "100 Continue")
    if (line.rfind("HTTP/", 0) == 0)
    {
        context->response->headers.clear();
        return totalSize;
    }

    auto colon = line.find(':');
    if (colon == std::string::npos)
    {
        return totalSize; // Blank line terminating the header block
    }

    std::string name = toLower(trim(line.substr(0, colon)));
    std::string value = trim(line.substr(colon + 1));

    auto &headers = context->response->headers;
    auto it = headers.find(name);
    if (it == headers.end())
    {
        headers.emplace(std::move(name), std::move(value));
    }
    else
    {
        it->second += ", " + value;
    }
    return totalSize;
}

HttpResponse HttpClient::get(const HttpRequest &request, const ChunkHandler &onChunk)
{
    HttpResponse response;
    TransferContext context{&response, &onChunk};
    char errorBuffer[CURL_ERROR_SIZE] = {0};

    CURL *curl = curl_.get();
    curl_easy_reset(curl);

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "parafetch/1.0");
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errorBuffer);

    // Worker threads must not receive SIGALRM from the resolver timeout
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &context);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &context);

    // HTTPS settings (CRITICAL for security)
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    curl_easy_setopt(curl, CURLOPT_TIMEOUT, request.timeoutSeconds);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, request.connectTimeoutSeconds);

    std::string rangeValue;
    if (request.range)
    {
        // Format: "first-last", libcurl adds the "bytes=" prefix
        rangeValue = fmt::format("{}-{}", request.range->first, request.range->second);
        curl_easy_setopt(curl, CURLOPT_RANGE, rangeValue.c_str());
    }

    response.result = curl_easy_perform(curl);

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);

    char *effectiveUrl = nullptr;
    if (curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effectiveUrl) == CURLE_OK && effectiveUrl)
    {
        response.effectiveUrl = effectiveUrl;
    }
    else
    {
        response.effectiveUrl = request.url;
    }

    if (response.result != CURLE_OK)
    {
        response.errorMessage = errorBuffer[0] != '\0' ? std::string(errorBuffer)
                                                       : std::string(curl_easy_strerror(response.result));
    }

    // The error buffer lives on this stack frame
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, nullptr);
    return response;
}

long HttpClient::currentStatus() const
{
    long code = 0;
    curl_easy_getinfo(curl_.get(), CURLINFO_RESPONSE_CODE, &code);
    return code;
}

// Helper: Get human-readable HTTP status text
std::string HttpClient::statusText(long code)
{
    switch (code)
    {
    case 200:
        return "OK";
    case 206:
        return "Partial Content";
    case 301:
        return "Moved Permanently";
    case 302:
        return "Found";
    case 400:
        return "Bad Request";
    case 401:
        return "Unauthorized";
    case 403:
        return "Forbidden";
    case 404:
        return "Not Found";
    case 416:
        return "Range Not Satisfiable";
    case 500:
        return "Internal Server Error";
    case 502:
        return "Bad Gateway";
    case 503:
        return "Service Unavailable";
    default:
        return "Unknown Status";
    }
}
