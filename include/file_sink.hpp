#pragma once

#include <filesystem>
#include <string>
#include <vector>

/**
 * Writes an assembled payload to disk.
 */
class FileSink
{
public:
    /**
     * Write bytes to `outDir/fileName`, creating outDir (like mkdir -p)
     * and overwriting any existing file. No partial-write recovery: on
     * failure the destination contents are unspecified.
     *
     * @param bytes Complete payload
     * @param fileName Bare file name (no directory part)
     * @param outDir Target directory
     * @return Path of the written file
     * @throws IoError(DirectoryCreate) or IoError(FileWrite)
     */
    static std::filesystem::path write(const std::vector<char> &bytes,
                                       const std::string &fileName,
                                       const std::filesystem::path &outDir);
};
