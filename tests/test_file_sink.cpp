#include "errors.hpp"
#include "file_sink.hpp"
#include "test_helpers.hpp"

#include <fstream>
#include <iterator>
#include <unistd.h>

namespace
{
    std::vector<char> readFile(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::vector<char>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
}

int main()
{
    auto root = std::filesystem::temp_directory_path() / fmt::format("parafetch_sink_{}", ::getpid());
    std::filesystem::remove_all(root);

    // Nested directories are created
    {
        auto payload = makePayload(100000);
        auto dir = root / "a" / "b";
        auto written = FileSink::write(payload, "out.bin", dir);
        check(written == dir / "out.bin", "returns the written path");
        check(std::filesystem::is_directory(dir), "missing directories are created");
        check(readFile(written) == payload, "file holds exactly the payload");
    }

    // Existing files are overwritten, not appended
    {
        std::vector<char> small = {'o', 'k'};
        auto written = FileSink::write(small, "out.bin", root / "a" / "b");
        check(std::filesystem::file_size(written) == 2, "existing file is truncated");
    }

    // Empty payload
    {
        auto written = FileSink::write({}, "empty.bin", root);
        check(std::filesystem::exists(written) && std::filesystem::file_size(written) == 0,
              "empty payload creates an empty file");
    }

    // Output directory blocked by a regular file
    {
        std::ofstream(root / "blocker") << "x";
        IoError::Kind kind = IoError::Kind::FileWrite;
        bool threw = throwsAs<IoError>([&root]()
                                       { FileSink::write({'x'}, "f.bin", root / "blocker" / "sub"); },
                                       [&kind](const IoError &e)
                                       { kind = e.kind(); });
        check(threw && kind == IoError::Kind::DirectoryCreate, "directory creation failure is DirectoryCreate");
    }

    // Target name is a directory
    {
        std::filesystem::create_directories(root / "taken.bin");
        IoError::Kind kind = IoError::Kind::DirectoryCreate;
        bool threw = throwsAs<IoError>([&root]()
                                       { FileSink::write({'x'}, "taken.bin", root); },
                                       [&kind](const IoError &e)
                                       { kind = e.kind(); });
        check(threw && kind == IoError::Kind::FileWrite, "unwritable destination is FileWrite");
    }

    std::filesystem::remove_all(root);
    return finishTests("file sink");
}
