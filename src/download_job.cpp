#include "download_job.hpp"
#include "errors.hpp"
#include "file_sink.hpp"
#include "worker_pool.hpp"

#include <future>
#include <stdexcept>

#include <fmt/core.h>

DownloadJob::DownloadJob(int maxParallelConnections)
    : maxParallelConnections_(maxParallelConnections), state_(std::make_shared<JobState>())
{
    if (maxParallelConnections <= 0)
    {
        throw std::invalid_argument(
            fmt::format("maxParallelConnections must be positive, got {}", maxParallelConnections));
    }
}

void DownloadJob::setTarget(const std::string &url)
{
    target_ = Target::parse(url);
}

void DownloadJob::setOutputDirectory(const std::string &path)
{
    if (path.empty())
    {
        throw InvalidPathError("Output directory must not be empty");
    }

    std::filesystem::path dir(path);
    std::error_code ec;
    if (std::filesystem::exists(dir, ec) && !std::filesystem::is_directory(dir, ec))
    {
        throw InvalidPathError(fmt::format("Output path exists and is not a directory: {}", path));
    }

    outputDir_ = std::move(dir);
}

void DownloadJob::probe()
{
    if (!target_)
    {
        throw OrchestratorError(OrchestratorError::Kind::PreconditionNotMet,
                                "Cannot probe: no target URL was set");
    }
    if (state_->status() != JobStatus::Idle)
    {
        throw OrchestratorError(OrchestratorError::Kind::PreconditionNotMet,
                                fmt::format("Cannot probe: job is {}", toString(state_->status())));
    }

    try
    {
        CapabilityProber prober(probeTimeoutSeconds_);
        capability_ = prober.probe(*target_);
    }
    catch (const ProbeError &e)
    {
        state_->fail(e.what(), std::current_exception());
        throw;
    }

    if (verbose_)
    {
        fmt::print("Probed {}: ranges={}, length={}, type={}, file={}\n",
                   target_->url(),
                   toString(capability_->supportsRanges),
                   capability_->totalLength ? fmt::format("{}", *capability_->totalLength) : "unknown",
                   capability_->contentType.value_or("unknown"),
                   capability_->suggestedFileName.value_or(CapabilityProber::FALLBACK_FILE_NAME));
    }
}

void DownloadJob::start()
{
    if (!target_)
    {
        throw OrchestratorError(OrchestratorError::Kind::PreconditionNotMet,
                                "Cannot start: no target URL was set");
    }
    if (!outputDir_)
    {
        throw OrchestratorError(OrchestratorError::Kind::PreconditionNotMet,
                                "Cannot start: no output directory was set");
    }
    if (!capability_)
    {
        throw OrchestratorError(OrchestratorError::Kind::PreconditionNotMet,
                                "Cannot start: the target has not been probed");
    }

    std::vector<ByteRange> ranges = RangePlanner::plan(capability_->totalLength,
                                                       maxParallelConnections_,
                                                       capability_->supportsRanges);

    if (!state_->beginTransfer(ranges.size()))
    {
        throw OrchestratorError(OrchestratorError::Kind::PreconditionNotMet,
                                fmt::format("Cannot start: job is {}", toString(state_->status())));
    }
    ranges_ = ranges;

    if (verbose_)
    {
        fmt::print("Downloading {} in {} part(s)\n", target_->url(), ranges.size());
    }

    std::vector<char> content;
    try
    {
        content = fetchAll(ranges);
    }
    catch (const std::exception &e)
    {
        state_->fail(e.what(), std::current_exception());
        throw;
    }

    std::string fileName = capability_->suggestedFileName.value_or(CapabilityProber::FALLBACK_FILE_NAME);
    try
    {
        outputPath_ = FileSink::write(content, fileName, *outputDir_);
    }
    catch (const IoError &e)
    {
        state_->fail(e.what(), std::current_exception());
        throw;
    }

    state_->complete();

    if (verbose_)
    {
        fmt::print("Wrote {} bytes to {}\n", content.size(), outputPath_->string());
    }
}

std::vector<char> DownloadJob::fetchAll(const std::vector<ByteRange> &ranges)
{
    // Declared before the pool so it outlives every task
    PartFetcher fetcher(state_, pollInterval_, progressSink_);
    const Target target = *target_;
    std::shared_ptr<JobState> state = state_;

    std::vector<std::future<std::vector<char>>> futures;
    futures.reserve(ranges.size());

    std::vector<std::vector<char>> buffers(ranges.size());
    bool failed = false;
    {
        WorkerPool pool(ranges.size());

        for (size_t i = 0; i < ranges.size(); ++i)
        {
            const ByteRange range = ranges[i];
            futures.push_back(pool.submit([&fetcher, &target, state, range, i]()
                                          {
                try
                {
                    return fetcher.fetch(target, range, i);
                }
                catch (const std::exception &e)
                {
                    // Flip the job to Error right away so paused siblings stop waiting
                    state->fail(e.what(), std::current_exception());
                    throw;
                } }));
        }

        // Wait for every part, even after a failure; nothing is cancelled
        for (size_t i = 0; i < futures.size(); ++i)
        {
            try
            {
                buffers[i] = futures[i].get();
            }
            catch (const std::exception &e)
            {
                failed = true;
                state_->fail(e.what(), std::current_exception());
            }
        }
    }

    if (failed)
    {
        buffers.clear();
        throw OrchestratorError(OrchestratorError::Kind::PartFailed,
                                fmt::format("Download failed: {}", state_->firstFailure().value_or("unknown part failure")),
                                state_->firstFailureCause());
    }

    // Assemble in range order, not completion order
    size_t totalSize = 0;
    for (const auto &buffer : buffers)
    {
        totalSize += buffer.size();
    }

    std::vector<char> content;
    content.reserve(totalSize);
    for (auto &buffer : buffers)
    {
        content.insert(content.end(), buffer.begin(), buffer.end());
        std::vector<char>().swap(buffer); // Release part memory as we go
    }
    return content;
}

void DownloadJob::pause()
{
    if (state_->pause() && verbose_)
    {
        fmt::print("Download paused\n");
    }
}

void DownloadJob::resume()
{
    if (state_->resume() && verbose_)
    {
        fmt::print("Download resumed\n");
    }
}
