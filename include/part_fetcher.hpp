#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "http_client.hpp"
#include "job_state.hpp"
#include "range_planner.hpp"
#include "target.hpp"

/**
 * Called after every received chunk with the sum of all parts' current
 * speeds (bytes/s) and the size of the chunk. Invoked from worker
 * threads, outside of the job lock.
 */
using ProgressSink = std::function<void(double totalSpeed, std::uint64_t chunkBytes)>;

/**
 * Downloads one planned range into memory while updating the shared
 * job state. A fetcher holds no connection between calls; each fetch
 * creates its own HttpClient so fetchers can run on separate threads.
 */
class PartFetcher
{
public:
    static constexpr std::chrono::milliseconds DEFAULT_POLL_INTERVAL{500};
    static constexpr long CONNECT_TIMEOUT_SECONDS = 30;

    // Bytes of an error response body kept for the error message
    static constexpr size_t MAX_DIAGNOSTIC_BODY = 4096;

    PartFetcher(std::shared_ptr<JobState> state,
                std::chrono::milliseconds pollInterval = DEFAULT_POLL_INTERVAL,
                ProgressSink sink = {});

    /**
     * Fetch one range.
     *
     * A bounded range requires a 206 Partial Content answer; an unbounded
     * range (single-part fallback) accepts 200 or 206. While the job is
     * Paused the fetcher polls the status every poll interval before
     * consuming the next chunk; paused time does not count towards speed.
     *
     * @param target URL to fetch
     * @param range Planned range
     * @param partIndex Position of the range in the plan (progress slot)
     * @return Bytes of the range in the order they were received
     * @throws FetchError on transport failure, unexpected status,
     *         bad Content-Range or a body of the wrong length
     */
    std::vector<char> fetch(const Target &target, const ByteRange &range, size_t partIndex) const;

private:
    /**
     * Wall-clock timer that keeps paused time apart from active time.
     */
    class ActiveTimer
    {
    public:
        ActiveTimer() : started_(std::chrono::steady_clock::now()) {}

        void addPause(std::chrono::steady_clock::duration paused) { paused_ += paused; }

        double activeSeconds() const
        {
            auto active = std::chrono::steady_clock::now() - started_ - paused_;
            return std::chrono::duration<double>(active).count();
        }

    private:
        std::chrono::steady_clock::time_point started_;
        std::chrono::steady_clock::duration paused_{0};
    };

    // Blocks while the job is Paused
    void waitWhilePaused(ActiveTimer &timer) const;

    void checkContentRange(const HeaderMap &headers, const ByteRange &range) const;

    std::shared_ptr<JobState> state_;
    std::chrono::milliseconds pollInterval_;
    ProgressSink sink_;
};
