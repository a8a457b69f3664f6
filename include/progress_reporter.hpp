#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "job_state.hpp"

/**
 * Renders job snapshots as a console progress bar.
 * Not thread-safe: drive it from a single reporting thread.
 */
class ProgressReporter
{
public:
    /**
     * @param totalBytes Resource length if known (switches bar vs. counter)
     * @param terminalOutput Redraw one line in place instead of printing lines
     */
    ProgressReporter(std::optional<std::uint64_t> totalBytes, bool terminalOutput);

    /**
     * Print the snapshot unless throttled: at most 5 updates per second
     * on a terminal, one per second otherwise.
     */
    void update(const JobSnapshot &snapshot);

    /**
     * Print the final state unconditionally and end the line.
     */
    void finish(const JobSnapshot &snapshot);

    /**
     * Build the progress line for a snapshot (no control characters).
     */
    std::string renderLine(const JobSnapshot &snapshot) const;

    /**
     * Format bytes into human-readable string (e.g., "52.30 MB")
     */
    static std::string formatBytes(std::uint64_t bytes);

    /**
     * Format duration into human-readable string (e.g., "2m 30s")
     */
    static std::string formatDuration(long seconds);

    /**
     * Format a rate in bytes per second (e.g., "1.50 MB/s")
     */
    static std::string formatSpeed(double bytesPerSecond);

private:
    static constexpr int BAR_WIDTH = 40;

    void print(const JobSnapshot &snapshot);

    std::optional<std::uint64_t> totalBytes_;
    bool isTerminalOutput_;
    std::chrono::steady_clock::time_point lastPrintedTime_;
    bool printedOnce_ = false;
};
