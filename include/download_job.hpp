#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "capability_prober.hpp"
#include "job_state.hpp"
#include "part_fetcher.hpp"
#include "range_planner.hpp"
#include "target.hpp"

/**
 * One multi-connection download: target, output directory, probed
 * capabilities and the shared transfer state.
 *
 * Typical use:
 *   DownloadJob job(4);
 *   job.setTarget(url);
 *   job.setOutputDirectory(dir);
 *   job.probe();
 *   job.start(); // blocks until every part finished
 *
 * pause(), resume(), status(), progress() and snapshot() may be called
 * from any thread while start() runs. The setters and probe() are meant
 * to be called from the owning thread before start().
 */
class DownloadJob
{
public:
    /**
     * @param maxParallelConnections Upper bound on concurrent part fetches
     * @throws std::invalid_argument if not positive
     */
    explicit DownloadJob(int maxParallelConnections);

    DownloadJob(const DownloadJob &) = delete;
    DownloadJob &operator=(const DownloadJob &) = delete;

    /**
     * @throws InvalidUrlError if the URL is not an absolute http(s) URL
     */
    void setTarget(const std::string &url);

    /**
     * @throws InvalidPathError if the path is empty or names an existing non-directory
     */
    void setOutputDirectory(const std::string &path);

    void setProbeTimeout(long seconds) { probeTimeoutSeconds_ = seconds; }
    void setPollInterval(std::chrono::milliseconds interval) { pollInterval_ = interval; }
    void setProgressSink(ProgressSink sink) { progressSink_ = std::move(sink); }
    void setVerbose(bool verbose) { verbose_ = verbose; }

    /**
     * Run the capability probe. Must succeed before start().
     *
     * @throws OrchestratorError(PreconditionNotMet) without a target or if already started
     * @throws ProbeError; the job then enters Error
     */
    void probe();

    /**
     * Plan ranges, fetch them concurrently, assemble them in range order
     * and write the file. Blocks until all part tasks have finished.
     *
     * @throws OrchestratorError(PreconditionNotMet) if not probed, no output
     *         directory, or not Idle (no network activity happens then)
     * @throws OrchestratorError(PartFailed) carrying the first part failure
     *         as message and as cause()
     * @throws IoError if the file cannot be written
     */
    void start();

    // Downloading -> Paused, no-op otherwise
    void pause();

    // Paused -> Downloading, no-op otherwise
    void resume();

    JobStatus status() const { return state_->status(); }
    std::vector<PartProgress> progress() const { return state_->progress(); }
    JobSnapshot snapshot() const { return state_->snapshot(); }

    const std::optional<CapabilityInfo> &capabilityInfo() const { return capability_; }
    const std::optional<Target> &target() const { return target_; }
    const std::optional<std::filesystem::path> &outputDirectory() const { return outputDir_; }

    // Ranges of the current transfer (empty before start)
    const std::vector<ByteRange> &plannedRanges() const { return ranges_; }

    // Written file, set once the job is Done
    const std::optional<std::filesystem::path> &outputPath() const { return outputPath_; }

    // First failure recorded for this job
    std::optional<std::string> lastError() const { return state_->firstFailure(); }

    // Exception behind lastError() (FetchError, ProbeError or IoError)
    std::exception_ptr lastErrorCause() const { return state_->firstFailureCause(); }

    int maxParallelConnections() const { return maxParallelConnections_; }

private:
    std::vector<char> fetchAll(const std::vector<ByteRange> &ranges);

    int maxParallelConnections_;
    long probeTimeoutSeconds_ = CapabilityProber::DEFAULT_TIMEOUT_SECONDS;
    std::chrono::milliseconds pollInterval_ = PartFetcher::DEFAULT_POLL_INTERVAL;
    ProgressSink progressSink_;
    bool verbose_ = false;

    std::optional<Target> target_;
    std::optional<std::filesystem::path> outputDir_;
    std::optional<CapabilityInfo> capability_;
    std::vector<ByteRange> ranges_;
    std::optional<std::filesystem::path> outputPath_;

    // Shared with every part task of the transfer
    std::shared_ptr<JobState> state_;
};
