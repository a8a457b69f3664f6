#include "part_fetcher.hpp"
#include "errors.hpp"

#include <algorithm>
#include <charconv>
#include <exception>
#include <thread>

#include <fmt/core.h>

namespace
{
    bool parseNumber(const std::string &text, std::uint64_t &out)
    {
        const char *first = text.data();
        const char *last = first + text.size();
        auto [ptr, ec] = std::from_chars(first, last, out);
        return !text.empty() && ec == std::errc() && ptr == last;
    }
}

PartFetcher::PartFetcher(std::shared_ptr<JobState> state,
                         std::chrono::milliseconds pollInterval,
                         ProgressSink sink)
    : state_(std::move(state)), pollInterval_(pollInterval), sink_(std::move(sink))
{
}

void PartFetcher::waitWhilePaused(ActiveTimer &timer) const
{
    if (state_->status() != JobStatus::Paused)
    {
        return;
    }

    auto pauseStart = std::chrono::steady_clock::now();
    while (state_->status() == JobStatus::Paused)
    {
        std::this_thread::sleep_for(pollInterval_);
    }
    timer.addPause(std::chrono::steady_clock::now() - pauseStart);
}

// Content-Range: bytes <first>-<last>/<total or *>
void PartFetcher::checkContentRange(const HeaderMap &headers, const ByteRange &range) const
{
    auto it = headers.find("content-range");
    if (it == headers.end())
    {
        return;
    }

    const std::string &value = it->second;
    const std::string prefix = "bytes ";
    auto dash = value.find('-');
    auto slash = value.find('/');
    if (value.rfind(prefix, 0) != 0 || dash == std::string::npos || slash == std::string::npos || dash > slash)
    {
        throw FetchError(FetchError::Kind::MalformedHeader,
                         fmt::format("Cannot read Content-Range header: '{}'", value), 206);
    }

    std::uint64_t first = 0;
    std::uint64_t last = 0;
    if (!parseNumber(value.substr(prefix.size(), dash - prefix.size()), first) ||
        !parseNumber(value.substr(dash + 1, slash - dash - 1), last))
    {
        throw FetchError(FetchError::Kind::MalformedHeader,
                         fmt::format("Cannot read Content-Range header: '{}'", value), 206);
    }

    if (first != range.start || last != range.end)
    {
        throw FetchError(FetchError::Kind::UnexpectedStatus,
                         fmt::format("Server answered range {}-{} instead of {}-{}",
                                     first, last, range.start, range.end),
                         206);
    }
}

std::vector<char> PartFetcher::fetch(const Target &target, const ByteRange &range, size_t partIndex) const
{
    HttpClient client;

    HttpRequest request;
    request.url = target.url();
    request.connectTimeoutSeconds = CONNECT_TIMEOUT_SECONDS;
    // No total timeout: a paused part keeps its connection open
    request.timeoutSeconds = 0;
    if (range.bounded)
    {
        request.range = std::make_pair(range.start, range.end);
    }

    auto statusAccepted = [&range](long status)
    {
        return status == 206 || (!range.bounded && status == 200);
    };

    std::vector<char> buffer;
    if (range.bounded)
    {
        buffer.reserve(static_cast<size_t>(range.size()));
    }

    std::string diagnosticBody;
    bool statusChecked = false;
    bool rejected = false;
    std::exception_ptr handlerError;
    ActiveTimer timer;

    HttpResponse response = client.get(request, [&](const char *data, std::size_t size)
                                       {
        // Exceptions must not unwind through libcurl
        try
        {
            if (!statusChecked)
            {
                statusChecked = true;
                rejected = !statusAccepted(client.currentStatus());
            }

            if (rejected)
            {
                size_t room = MAX_DIAGNOSTIC_BODY - diagnosticBody.size();
                diagnosticBody.append(data, std::min(size, room));
                return diagnosticBody.size() < MAX_DIAGNOSTIC_BODY;
            }

            waitWhilePaused(timer);

            buffer.insert(buffer.end(), data, data + size);

            double totalSpeed = state_->recordChunk(partIndex, size, timer.activeSeconds());
            if (sink_)
            {
                sink_(totalSpeed, size);
            }
            return true;
        }
        catch (...)
        {
            handlerError = std::current_exception();
            return false;
        } });

    if (handlerError)
    {
        std::rethrow_exception(handlerError);
    }

    if (rejected || (response.transportOk() && !statusAccepted(response.status)))
    {
        throw FetchError(FetchError::Kind::UnexpectedStatus,
                         fmt::format("Part {}: didn't receive partial content, got status code {} ({}) | content of response: {}",
                                     partIndex, response.status, HttpClient::statusText(response.status),
                                     diagnosticBody),
                         response.status);
    }

    if (!response.transportOk())
    {
        throw FetchError(FetchError::Kind::Network,
                         fmt::format("Part {}: transfer failed: {}", partIndex, response.errorMessage),
                         response.status);
    }

    if (range.bounded)
    {
        checkContentRange(response.headers, range);

        if (buffer.size() != range.size())
        {
            throw FetchError(FetchError::Kind::ShortBody,
                             fmt::format("Part {}: expected {} bytes for range {}-{} but received {}",
                                         partIndex, range.size(), range.start, range.end, buffer.size()),
                             response.status);
        }
    }

    return buffer;
}
