#include "errors.hpp"
#include "target.hpp"
#include "test_helpers.hpp"

int main()
{
    // Valid URLs
    {
        Target target = Target::parse("https://example.com/files/data.bin");
        check(target.host() == "example.com", "host is extracted");
        check(target.path() == "/files/data.bin", "path is extracted");
        check(target.url() == "https://example.com/files/data.bin", "url is kept normalized");

        Target withPort = Target::parse("http://127.0.0.1:5555/download");
        check(withPort.host() == "127.0.0.1", "IPv4 host with port parses");
        bool upperAccepted = !throwsAs<InvalidUrlError>([]()
                                                        { Target::parse("HTTP://Example.com/a"); });
        check(upperAccepted, "scheme is matched case-insensitively");
    }

    // Rejected input
    {
        std::string message;
        bool rejected = throwsAs<InvalidUrlError>([]()
                                                  { Target::parse("not a url"); },
                                                  [&message](const InvalidUrlError &e)
                                                  { message = e.what(); });
        check(rejected, "free text is rejected");
        check(!message.empty(), "rejection carries a diagnostic");

        check(throwsAs<InvalidUrlError>([]()
                                        { Target::parse(""); }),
              "empty string is rejected");
        check(throwsAs<InvalidUrlError>([]()
                                        { Target::parse("/relative/path.bin"); }),
              "relative path is rejected");
        check(throwsAs<InvalidUrlError>([]()
                                        { Target::parse("example.com/file.bin"); }),
              "URL without scheme is rejected");
        check(throwsAs<InvalidUrlError>([]()
                                        { Target::parse("ftp://example.com/file.bin"); }),
              "non-HTTP scheme is rejected");
        check(throwsAs<InvalidUrlError>([]()
                                        { Target::parse("http://"); }),
              "URL without host is rejected");
    }

    // Last path segment used as a file name
    {
        check(lastPathSegment("https://example.com/files/data.bin") == "data.bin", "last segment of a file URL");
        check(lastPathSegment("https://example.com/files/data.bin?token=1#x") == "data.bin",
              "query and fragment are ignored");
        check(lastPathSegment("https://example.com/files/my%20report.pdf") == "my report.pdf",
              "segment is URL-decoded");
        check(lastPathSegment("https://example.com/").empty(), "root path has no segment");
        check(lastPathSegment("::::").empty(), "unparsable URL has no segment");
    }

    return finishTests("target");
}
