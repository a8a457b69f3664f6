#include "progress_reporter.hpp"

#include <cstdio>

#include <fmt/core.h>

ProgressReporter::ProgressReporter(std::optional<std::uint64_t> totalBytes, bool terminalOutput)
    : totalBytes_(totalBytes), isTerminalOutput_(terminalOutput)
{
}

void ProgressReporter::update(const JobSnapshot &snapshot)
{
    auto now = std::chrono::steady_clock::now();
    auto sinceLastPrint = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastPrintedTime_).count();

    // Update at most 5 times per second on a terminal, once per second when piped
    long interval = isTerminalOutput_ ? 200 : 1000;
    if (printedOnce_ && sinceLastPrint < interval)
    {
        return;
    }

    print(snapshot);
}

void ProgressReporter::finish(const JobSnapshot &snapshot)
{
    print(snapshot);
    if (isTerminalOutput_)
    {
        fmt::print("\n");
    }
}

void ProgressReporter::print(const JobSnapshot &snapshot)
{
    std::string line = renderLine(snapshot);
    if (isTerminalOutput_)
    {
        fmt::print("\r{}\033[K", line);
        std::fflush(stdout);
    }
    else
    {
        fmt::print("{}\n", line);
    }

    lastPrintedTime_ = std::chrono::steady_clock::now();
    printedOnce_ = true;
}

std::string ProgressReporter::renderLine(const JobSnapshot &snapshot) const
{
    std::uint64_t downloaded = snapshot.totalBytes();
    double speed = snapshot.totalSpeed();
    std::string state = snapshot.status == JobStatus::Downloading ? "" : fmt::format(" [{}]", toString(snapshot.status));

    // Unknown size: no bar, no ETA
    if (!totalBytes_ || *totalBytes_ == 0)
    {
        return fmt::format("Downloaded: {} | {} | {} part(s){}",
                           formatBytes(downloaded), formatSpeed(speed), snapshot.parts.size(), state);
    }

    std::uint64_t total = *totalBytes_;
    double percentage = (static_cast<double>(downloaded) / static_cast<double>(total)) * 100.0;
    if (percentage > 100.0)
    {
        percentage = 100.0;
    }

    long eta = (speed > 0 && downloaded < total) ? static_cast<long>((total - downloaded) / speed) : 0;

    int filled = static_cast<int>((percentage / 100.0) * BAR_WIDTH);
    std::string bar = "[";
    for (int i = 0; i < BAR_WIDTH; ++i)
    {
        if (i < filled)
        {
            bar += "=";
        }
        else if (i == filled)
        {
            bar += ">";
        }
        else
        {
            bar += " ";
        }
    }
    bar += "]";

    return fmt::format("{} {:.1f}% | {} / {} | {} | ETA: {}{}",
                       bar,
                       percentage,
                       formatBytes(downloaded),
                       formatBytes(total),
                       formatSpeed(speed),
                       formatDuration(eta),
                       state);
}

std::string ProgressReporter::formatBytes(std::uint64_t bytes)
{
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;
    constexpr double TB = GB * 1024.0;

    double value = static_cast<double>(bytes);
    if (value >= TB)
    {
        return fmt::format("{:.2f} TB", value / TB);
    }
    else if (value >= GB)
    {
        return fmt::format("{:.2f} GB", value / GB);
    }
    else if (value >= MB)
    {
        return fmt::format("{:.2f} MB", value / MB);
    }
    else if (value >= KB)
    {
        return fmt::format("{:.2f} KB", value / KB);
    }
    else
    {
        return fmt::format("{} B", bytes);
    }
}

std::string ProgressReporter::formatDuration(long seconds)
{
    if (seconds < 0)
    {
        return "unknown";
    }
    else if (seconds < 60)
    {
        return fmt::format("{}s", seconds);
    }
    else if (seconds < 3600)
    {
        return fmt::format("{}m {}s", seconds / 60, seconds % 60);
    }
    else
    {
        return fmt::format("{}h {}m", seconds / 3600, (seconds % 3600) / 60);
    }
}

std::string ProgressReporter::formatSpeed(double bytesPerSecond)
{
    if (bytesPerSecond >= 1024 * 1024)
    {
        return fmt::format("{:.2f} MB/s", bytesPerSecond / (1024.0 * 1024.0));
    }
    else if (bytesPerSecond >= 1024)
    {
        return fmt::format("{:.2f} KB/s", bytesPerSecond / 1024.0);
    }
    return fmt::format("{:.0f} B/s", bytesPerSecond);
}
