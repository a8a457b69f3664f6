#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <thread>
#include <unistd.h>

#include <fmt/core.h>
#include <CLI/CLI.hpp> // CLI11 main header

#include "checksum.hpp"
#include "config.hpp"
#include "download_job.hpp"
#include "errors.hpp"
#include "progress_reporter.hpp"

namespace
{
    // Set from the SIGUSR1 handler, consumed by the reporter thread
    volatile std::sig_atomic_t pauseToggleRequested = 0;

    void onPauseToggleSignal(int)
    {
        pauseToggleRequested = 1;
    }

    /**
     * Runs the transfer on the calling thread while a second thread
     * renders progress and applies SIGUSR1 pause/resume requests.
     */
    void runWithProgress(DownloadJob &job, bool showProgress)
    {
        const auto &info = job.capabilityInfo();
        ProgressReporter reporter(info ? info->totalLength : std::optional<std::uint64_t>{}, ::isatty(fileno(stdout)) != 0);

        std::atomic<bool> finished{false};
        std::thread reporterThread([&]()
                                   {
            while (!finished.load())
            {
                if (pauseToggleRequested)
                {
                    pauseToggleRequested = 0;
                    if (job.status() == JobStatus::Paused)
                    {
                        job.resume();
                    }
                    else
                    {
                        job.pause();
                    }
                }

                if (showProgress)
                {
                    reporter.update(job.snapshot());
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            } });

        try
        {
            job.start();
        }
        catch (...)
        {
            finished.store(true);
            reporterThread.join();
            if (showProgress)
            {
                reporter.finish(job.snapshot());
            }
            throw;
        }

        finished.store(true);
        reporterThread.join();
        if (showProgress)
        {
            reporter.finish(job.snapshot());
        }
    }
}

int main(int argc, char *argv[])
{
    // Quick check for --version flag before full parsing
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--version" || arg == "-v")
        {
            fmt::print("parafetch v1.0\n");
            fmt::print("Built with:\n");
            fmt::print("  - libcurl: HTTP/HTTPS range requests\n");
            fmt::print("  - CLI11: Command-line parsing\n");
            fmt::print("  - fmt: Modern string formatting\n");
            fmt::print("  - OpenSSL: SHA-256 verification\n");
            return 0;
        }
    }

    CLI::App app{"parafetch v1.0 - Multi-connection HTTP downloader"};

    DownloadConfig config;

    // ====================================================================
    // DEFINE ARGUMENTS
    // ====================================================================

    app.add_option("URL", config.url, "HTTP/HTTPS URL to download")
        ->required()
        ->check([](const std::string &url) -> std::string
                {
            try
            {
                Target::parse(url);
                return ""; // Empty string = valid
            }
            catch (const InvalidUrlError &e)
            {
                return e.what();
            } });

    app.add_option("-o,--output-dir", config.outputDirectory,
                   "Directory to save the file in (created if missing)")
        ->default_val(".");

    app.add_option("-n,--connections", config.connections,
                   "Number of parallel range requests")
        ->check(CLI::Range(1, 32))
        ->default_val(4);

    app.add_option("--probe-timeout", config.probeTimeoutSeconds,
                   "Timeout in seconds for the preliminary request")
        ->check(CLI::PositiveNumber)
        ->default_val(3);

    app.add_option("--poll-interval", config.pollIntervalMs,
                   "Milliseconds between status checks while paused")
        ->check(CLI::Range(10, 10000))
        ->default_val(500);

    app.add_option("-c,--checksum", config.expectedChecksum,
                   "Expected checksum in format 'sha256:hexhash'")
        ->check([](const std::string &cs) -> std::string
                {
            if (cs.empty()) return "";
            try {
                ChecksumVerifier::parseChecksum(cs);
                return ""; // Valid
            } catch (const std::exception &e) {
                return std::string("Invalid checksum format: ") + e.what();
            } });

    app.add_flag("-q,--quiet", config.quiet, "Do not display the progress bar");

    app.add_flag("--verbose", config.verbose, "Print probe and transfer details");

    // Actual handling is done above, before parsing
    app.add_flag("-v,--version", config.showVersion, "Display version information");

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        return app.exit(e);
    }

    // ====================================================================
    // DISPLAY CONFIGURATION
    // ====================================================================

    fmt::print("parafetch v1.0\n");
    fmt::print("====================================\n\n");

    fmt::print("Configuration:\n");
    fmt::print("  URL:         {}\n", config.url);
    fmt::print("  Output dir:  {}\n", config.outputDirectory);
    fmt::print("  Connections: {}\n", config.connections);
    fmt::print("  Probe:       {}s timeout\n", config.probeTimeoutSeconds);
    if (config.expectedChecksum)
    {
        fmt::print("  Checksum:    {}\n", config.expectedChecksum.value());
    }
    fmt::print("\n");

    // ====================================================================
    // PERFORM DOWNLOAD
    // ====================================================================

    try
    {
        DownloadJob job(config.connections);
        job.setTarget(config.url);
        job.setOutputDirectory(config.outputDirectory);
        job.setProbeTimeout(config.probeTimeoutSeconds);
        job.setPollInterval(std::chrono::milliseconds(config.pollIntervalMs));
        job.setVerbose(config.verbose);

        fmt::print("Probing server...\n");
        job.probe();

        const CapabilityInfo &info = job.capabilityInfo().value();
        fmt::print("  Range requests: {}\n", toString(info.supportsRanges));
        fmt::print("  Size:           {}\n",
                   info.totalLength ? ProgressReporter::formatBytes(*info.totalLength) : "unknown");
        fmt::print("  Type:           {}\n", info.contentType.value_or("unknown"));
        fmt::print("  File name:      {}\n\n", info.suggestedFileName.value_or(CapabilityProber::FALLBACK_FILE_NAME));

        std::signal(SIGUSR1, onPauseToggleSignal);
        fmt::print("Starting download (send SIGUSR1 to pid {} to pause/resume)...\n\n", ::getpid());

        runWithProgress(job, !config.quiet);

        fmt::print("✓ Download completed successfully: {}\n", job.outputPath()->string());

        if (config.expectedChecksum)
        {
            fmt::print("\nVerifying checksum...\n");
            if (ChecksumVerifier::verify(*job.outputPath(), config.expectedChecksum.value()))
            {
                fmt::print("✓ Checksum verification passed!\n");
            }
            else
            {
                fmt::print(stderr, "✗ Checksum verification FAILED!\n");
                fmt::print(stderr, "  Expected: {}\n", config.expectedChecksum.value());
                fmt::print(stderr, "  File may be corrupted or incomplete.\n");
                return 1;
            }
        }

        return 0;
    }
    catch (const DownloadError &e)
    {
        fmt::print(stderr, "✗ Download failed: {}\n", e.what());
        return 1;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "✗ Fatal error: {}\n", e.what());
        return 1;
    }
}
