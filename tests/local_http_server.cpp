#include "local_http_server.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <fmt/core.h>

namespace
{
    std::string toLower(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    std::string headerValue(const std::string &request, const std::string &name)
    {
        std::string lowered = toLower(request);
        std::string key = "\r\n" + toLower(name) + ":";
        auto pos = lowered.find(key);
        if (pos == std::string::npos)
        {
            return "";
        }
        auto start = pos + key.size();
        auto end = request.find("\r\n", start);
        std::string value = request.substr(start, end - start);
        auto first = value.find_first_not_of(' ');
        return first == std::string::npos ? "" : value.substr(first);
    }

    // "bytes=first-last" or "bytes=first-"
    bool parseRange(const std::string &value, size_t total, size_t &first, size_t &last)
    {
        const std::string prefix = "bytes=";
        if (value.rfind(prefix, 0) != 0)
        {
            return false;
        }
        auto dash = value.find('-', prefix.size());
        if (dash == std::string::npos)
        {
            return false;
        }
        try
        {
            first = std::stoull(value.substr(prefix.size(), dash - prefix.size()));
            std::string lastText = value.substr(dash + 1);
            last = lastText.empty() ? total - 1 : std::stoull(lastText);
        }
        catch (const std::exception &)
        {
            return false;
        }
        last = std::min(last, total - 1);
        return total > 0 && first <= last;
    }
}

LocalHttpServer::LocalHttpServer(ServerOptions options) : options_(std::move(options))
{
    listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listenFd_ < 0)
    {
        throw std::runtime_error(fmt::format("socket() failed: {}", std::strerror(errno)));
    }

    int reuse = 1;
    ::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    address.sin_port = 0; // Let the kernel pick a free port

    if (::bind(listenFd_, reinterpret_cast<sockaddr *>(&address), sizeof(address)) < 0 ||
        ::listen(listenFd_, 64) < 0)
    {
        int error = errno;
        ::close(listenFd_);
        throw std::runtime_error(fmt::format("bind/listen failed: {}", std::strerror(error)));
    }

    socklen_t length = sizeof(address);
    ::getsockname(listenFd_, reinterpret_cast<sockaddr *>(&address), &length);
    port_ = ntohs(address.sin_port);

    acceptThread_ = std::thread(&LocalHttpServer::acceptLoop, this);
}

LocalHttpServer::~LocalHttpServer()
{
    stopping_.store(true);
    ::shutdown(listenFd_, SHUT_RDWR);
    ::close(listenFd_);

    if (acceptThread_.joinable())
    {
        acceptThread_.join();
    }

    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        threads.swap(connectionThreads_);
    }
    for (auto &thread : threads)
    {
        if (thread.joinable())
        {
            thread.join();
        }
    }
}

std::string LocalHttpServer::url(const std::string &path) const
{
    return fmt::format("http://127.0.0.1:{}{}", port_, path);
}

std::vector<std::string> LocalHttpServer::rangeHeaders() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return rangeHeaders_;
}

void LocalHttpServer::acceptLoop()
{
    while (!stopping_.load())
    {
        int clientFd = ::accept(listenFd_, nullptr, nullptr);
        if (clientFd < 0)
        {
            if (stopping_.load())
            {
                return;
            }
            continue;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        connectionThreads_.emplace_back(&LocalHttpServer::handleConnection, this, clientFd);
    }
}

void LocalHttpServer::sleepUnlessStopping(std::chrono::milliseconds duration)
{
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (!stopping_.load() && std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

bool LocalHttpServer::sendAll(int fd, const char *data, size_t length)
{
    while (length > 0)
    {
        if (stopping_.load())
        {
            return false;
        }
        ssize_t sent = ::send(fd, data, length, MSG_NOSIGNAL);
        if (sent < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return false; // Client went away (e.g. probe stopped after headers)
        }
        data += sent;
        length -= static_cast<size_t>(sent);
    }
    return true;
}

void LocalHttpServer::handleConnection(int clientFd)
{
    timeval timeout{10, 0};
    ::setsockopt(clientFd, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));
    ::setsockopt(clientFd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

    std::string request;
    char buffer[4096];
    while (request.find("\r\n\r\n") == std::string::npos)
    {
        ssize_t received = ::recv(clientFd, buffer, sizeof(buffer), 0);
        if (received <= 0)
        {
            ::close(clientFd);
            return;
        }
        request.append(buffer, static_cast<size_t>(received));
    }

    requestCount_.fetch_add(1);
    std::string range = headerValue(request, "Range");
    {
        std::lock_guard<std::mutex> lock(mutex_);
        rangeHeaders_.push_back(range);
    }

    sleepUnlessStopping(options_.headerDelay);

    const std::vector<char> &body = options_.body;
    size_t first = 0;
    size_t last = body.empty() ? 0 : body.size() - 1;
    int status = 200;

    if (options_.statusOverride != 0)
    {
        status = options_.statusOverride;
    }
    else if (!range.empty() && options_.honorRanges)
    {
        status = parseRange(range, body.size(), first, last) ? 206 : 416;
    }

    if (status == 206)
    {
        auto delay = options_.delayByRangeStart.find(first);
        if (delay != options_.delayByRangeStart.end())
        {
            sleepUnlessStopping(delay->second);
        }
    }

    std::string headers = fmt::format("HTTP/1.1 {} Test\r\nConnection: close\r\n", status);
    if (options_.advertiseRanges)
    {
        headers += fmt::format("Accept-Ranges: {}\r\n", options_.acceptRangesValue.value_or("bytes"));
    }
    if (options_.contentType)
    {
        headers += fmt::format("Content-Type: {}\r\n", *options_.contentType);
    }
    if (options_.contentDisposition)
    {
        headers += fmt::format("Content-Disposition: {}\r\n", *options_.contentDisposition);
    }

    size_t bodyStart = 0;
    size_t bodyLength = 0;
    if (status == 206)
    {
        bodyStart = first;
        bodyLength = last - first + 1;
        headers += fmt::format("Content-Range: bytes {}-{}/{}\r\n", first, last, body.size());
        headers += fmt::format("Content-Length: {}\r\n", bodyLength);
    }
    else if (status == 200 || options_.statusOverride != 0)
    {
        bodyLength = body.size();
        if (options_.contentLengthValue)
        {
            headers += fmt::format("Content-Length: {}\r\n", *options_.contentLengthValue);
        }
        else if (options_.sendContentLength)
        {
            headers += fmt::format("Content-Length: {}\r\n", bodyLength);
        }
    }
    else
    {
        headers += fmt::format("Content-Range: bytes */{}\r\nContent-Length: 0\r\n", body.size());
    }
    headers += "\r\n";

    if (sendAll(clientFd, headers.data(), headers.size()))
    {
        size_t offset = 0;
        while (offset < bodyLength)
        {
            size_t chunk = std::min(options_.chunkSize, bodyLength - offset);
            if (!sendAll(clientFd, body.data() + bodyStart + offset, chunk))
            {
                break;
            }
            offset += chunk;
            if (options_.delayPerChunk.count() > 0)
            {
                sleepUnlessStopping(options_.delayPerChunk);
            }
        }
    }

    ::shutdown(clientFd, SHUT_WR);
    ::close(clientFd);
}
