#pragma once

#include <cstdint>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * Lifecycle of a download job as seen by collaborators.
 */
enum class JobStatus
{
    Idle,
    Downloading,
    Paused,
    Done,
    Error
};

const char *toString(JobStatus status);

/**
 * Counters of one planned range.
 */
struct PartProgress
{
    std::uint64_t bytesDownloaded = 0;
    double speed = 0.0; // bytes per second of active (unpaused) time
};

/**
 * Point-in-time copy of a job's shared state, handed to reporting code.
 */
struct JobSnapshot
{
    JobStatus status = JobStatus::Idle;
    std::vector<PartProgress> parts;

    std::uint64_t totalBytes() const;
    double totalSpeed() const;
};

/**
 * The mutable state of one job that part fetchers share with the
 * orchestrator: status, per-part progress and the first failure.
 *
 * Every method locks the same mutex for a single read-modify-write,
 * so no lock is ever held across network I/O or a pause sleep.
 * Transitions that do not apply to the current status are ignored.
 */
class JobState
{
public:
    JobStatus status() const;

    /**
     * Reset progress to `partCount` zeroed slots and enter Downloading.
     * Only valid from Idle.
     *
     * @return false if the job was not Idle
     */
    bool beginTransfer(size_t partCount);

    // Downloading -> Paused; returns whether the status changed
    bool pause();

    // Paused -> Downloading; returns whether the status changed
    bool resume();

    // Downloading/Paused -> Done
    bool complete();

    /**
     * Enter Error from any non-terminal status. The first message
     * (and its exception, if given) wins; later failures are ignored.
     */
    void fail(const std::string &message, std::exception_ptr cause = nullptr);

    /**
     * Account one received chunk for a part.
     *
     * @param partIndex Position of the range in the plan
     * @param chunkBytes Size of the chunk just appended
     * @param activeSeconds Time the part spent transferring (pauses excluded)
     * @return Sum of all parts' speeds after the update
     */
    double recordChunk(size_t partIndex, std::uint64_t chunkBytes, double activeSeconds);

    std::vector<PartProgress> progress() const;

    JobSnapshot snapshot() const;

    std::optional<std::string> firstFailure() const;

    // Exception recorded with the first failure, null if none was given
    std::exception_ptr firstFailureCause() const;

private:
    mutable std::mutex mutex_;
    JobStatus status_ = JobStatus::Idle;
    std::vector<PartProgress> parts_;
    std::optional<std::string> firstFailure_;
    std::exception_ptr firstFailureCause_;
};
