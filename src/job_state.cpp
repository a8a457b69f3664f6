#include "job_state.hpp"

#include <numeric>
#include <stdexcept>

#include <fmt/core.h>

const char *toString(JobStatus status)
{
    switch (status)
    {
    case JobStatus::Idle:
        return "idle";
    case JobStatus::Downloading:
        return "downloading";
    case JobStatus::Paused:
        return "paused";
    case JobStatus::Done:
        return "done";
    case JobStatus::Error:
        return "error";
    }
    return "unknown";
}

std::uint64_t JobSnapshot::totalBytes() const
{
    return std::accumulate(parts.begin(), parts.end(), std::uint64_t{0},
                           [](std::uint64_t sum, const PartProgress &part)
                           { return sum + part.bytesDownloaded; });
}

double JobSnapshot::totalSpeed() const
{
    return std::accumulate(parts.begin(), parts.end(), 0.0,
                           [](double sum, const PartProgress &part)
                           { return sum + part.speed; });
}

JobStatus JobState::status() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

bool JobState::beginTransfer(size_t partCount)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != JobStatus::Idle)
    {
        return false;
    }
    parts_.assign(partCount, PartProgress{});
    status_ = JobStatus::Downloading;
    return true;
}

bool JobState::pause()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != JobStatus::Downloading)
    {
        return false;
    }
    status_ = JobStatus::Paused;
    return true;
}

bool JobState::resume()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != JobStatus::Paused)
    {
        return false;
    }
    status_ = JobStatus::Downloading;
    return true;
}

bool JobState::complete()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != JobStatus::Downloading && status_ != JobStatus::Paused)
    {
        return false;
    }
    status_ = JobStatus::Done;
    return true;
}

void JobState::fail(const std::string &message, std::exception_ptr cause)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ == JobStatus::Done)
    {
        return;
    }
    status_ = JobStatus::Error;
    if (!firstFailure_)
    {
        firstFailure_ = message;
        firstFailureCause_ = std::move(cause);
    }
}

double JobState::recordChunk(size_t partIndex, std::uint64_t chunkBytes, double activeSeconds)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (partIndex >= parts_.size())
    {
        throw std::out_of_range(fmt::format("Part index {} out of range ({} parts)",
                                            partIndex, parts_.size()));
    }

    PartProgress &part = parts_[partIndex];
    part.bytesDownloaded += chunkBytes;
    part.speed = activeSeconds > 0.0 ? static_cast<double>(part.bytesDownloaded) / activeSeconds : 0.0;

    double total = 0.0;
    for (const auto &p : parts_)
    {
        total += p.speed;
    }
    return total;
}

std::vector<PartProgress> JobState::progress() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return parts_;
}

JobSnapshot JobState::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return JobSnapshot{status_, parts_};
}

std::optional<std::string> JobState::firstFailure() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return firstFailure_;
}

std::exception_ptr JobState::firstFailureCause() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return firstFailureCause_;
}
