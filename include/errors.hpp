#pragma once

#include <exception>
#include <stdexcept>
#include <string>

/**
 * Base class for every error raised by the download engine.
 * Each concrete error carries a kind so callers can react without parsing messages.
 */
class DownloadError : public std::runtime_error
{
public:
    explicit DownloadError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * Raised when a user-supplied URL cannot be turned into a Target.
 */
class InvalidUrlError : public DownloadError
{
public:
    explicit InvalidUrlError(const std::string &message) : DownloadError(message) {}
};

/**
 * Raised when an output directory is unusable.
 */
class InvalidPathError : public DownloadError
{
public:
    explicit InvalidPathError(const std::string &message) : DownloadError(message) {}
};

class ProbeError : public DownloadError
{
public:
    enum class Kind
    {
        Network,
        Timeout,
        MalformedHeader,
        UnexpectedStatus
    };

    ProbeError(Kind kind, const std::string &message) : DownloadError(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

class FetchError : public DownloadError
{
public:
    enum class Kind
    {
        Network,
        UnexpectedStatus,
        MalformedHeader,
        ShortBody // Body length differs from the requested range
    };

    FetchError(Kind kind, const std::string &message, long httpStatus = 0)
        : DownloadError(message), kind_(kind), httpStatus_(httpStatus) {}

    Kind kind() const { return kind_; }

    // 0 when no response was received
    long httpStatus() const { return httpStatus_; }

private:
    Kind kind_;
    long httpStatus_;
};

class OrchestratorError : public DownloadError
{
public:
    enum class Kind
    {
        PreconditionNotMet,
        PartFailed
    };

    OrchestratorError(Kind kind, const std::string &message, std::exception_ptr cause = nullptr)
        : DownloadError(message), kind_(kind), cause_(std::move(cause)) {}

    Kind kind() const { return kind_; }

    /**
     * Error of the first failed part (usually a FetchError), null for
     * PreconditionNotMet. Inspect it with std::rethrow_exception.
     */
    std::exception_ptr cause() const { return cause_; }

private:
    Kind kind_;
    std::exception_ptr cause_;
};

class IoError : public DownloadError
{
public:
    enum class Kind
    {
        DirectoryCreate,
        FileWrite
    };

    IoError(Kind kind, const std::string &message) : DownloadError(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};
