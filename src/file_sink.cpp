#include "file_sink.hpp"
#include "errors.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>

#include <fmt/core.h>

std::filesystem::path FileSink::write(const std::vector<char> &bytes,
                                      const std::string &fileName,
                                      const std::filesystem::path &outDir)
{
    // Create all parent directories (like mkdir -p)
    try
    {
        if (!outDir.empty())
        {
            std::filesystem::create_directories(outDir);
        }
    }
    catch (const std::filesystem::filesystem_error &e)
    {
        throw IoError(IoError::Kind::DirectoryCreate,
                      fmt::format("Failed to create directory {}: {}", outDir.string(), e.what()));
    }

    std::filesystem::path filePath = outDir / fileName;

    std::ofstream outFile(filePath, std::ios::binary | std::ios::trunc);
    if (!outFile)
    {
        throw IoError(IoError::Kind::FileWrite,
                      fmt::format("Cannot open file for writing: {} ({})", filePath.string(), std::strerror(errno)));
    }

    outFile.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    outFile.flush();
    if (!outFile.good())
    {
        throw IoError(IoError::Kind::FileWrite,
                      fmt::format("Failed to write {} bytes to {}", bytes.size(), filePath.string()));
    }

    return filePath;
}
