#include <catch2/catch.hpp>

#include <fstream>

#include "support/TempDir.hpp"
#include "util/args.hpp"
#include "util/file.hpp"
#include "util/format.hpp"
#include "util/http.hpp"

TEST_CASE("Arguments split on whitespace outside quotes", "[util]")
{
    using Args = std::vector<std::string>;

    CHECK(splitArguments("a b\tc") == Args{"a", "b", "c"});
    CHECK(splitArguments("  a   b  ") == Args{"a", "b"});
    CHECK(splitArguments("\"a b\" c") == Args{"a b", "c"});
    CHECK(splitArguments("\"\" x") == Args{"", "x"});
    CHECK(splitArguments("\"say \\\"hi\\\"\"") == Args{"say \"hi\""});
    CHECK(splitArguments("").empty());
}

TEST_CASE("Sizes, speeds and durations are human readable", "[util]")
{
    CHECK(formatBytes(512) == "512 B");
    CHECK(formatBytes(1536) == "1.5 KB");
    CHECK(formatBytes(5.0 * 1024 * 1024) == "5.0 MB");
    CHECK(formatBytes(3.0 * 1024 * 1024 * 1024) == "3.00 GB");
    CHECK(formatSpeed(2048) == "2.0 KB/s");
    CHECK(formatDuration(3725) == "01:02:05");
    CHECK(formatDuration(-1) == "00:00:00");
}

TEST_CASE("Content-Range is parsed case-insensitively", "[util]")
{
    http::ContentRange range;

    REQUIRE(http::parseContentRange("Content-Range: bytes 100-199/2000\r\n", range));
    CHECK(range.present);
    CHECK(range.first == 100);
    CHECK(range.last == 199);
    CHECK(range.total == 2000);

    REQUIRE(http::parseContentRange("content-range: bytes 0-0/1", range));
    CHECK(range.first == 0);
    CHECK(range.total == 1);

    REQUIRE(http::parseContentRange("Content-Range: bytes 40-99/*", range));
    CHECK(range.first == 40);
    CHECK(range.total == 0);
}

TEST_CASE("Malformed or unsatisfied Content-Range values are rejected", "[util]")
{
    http::ContentRange range;
    range.first = 7;

    CHECK_FALSE(http::parseContentRange("Content-Length: 100", range));
    CHECK_FALSE(http::parseContentRange("Content-Range: bytes */100", range));
    CHECK_FALSE(http::parseContentRange("Content-Range: bytes 9-3/100", range));
    CHECK_FALSE(http::parseContentRange("Content-Range: bytes 0-100/100", range));
    CHECK_FALSE(http::parseContentRange("Content-Range: items 0-9/10", range));
    CHECK_FALSE(http::parseContentRange("Content-Range: bytes 0-1/99999999999999999999999", range));

    CHECK_FALSE(range.present);
    CHECK(range.first == 7);
}

TEST_CASE("A new status line forgets the previous Content-Range", "[util]")
{
    http::ContentRange range;
    std::string partial = "Content-Range: bytes 5-9/10\r\n";
    std::string status = "HTTP/1.1 200 OK\r\n";

    http::contentRangeHeaderCallback(&partial[0], 1, partial.size(), &range);
    CHECK(range.present);
    CHECK(range.first == 5);
    CHECK(range.total == 10);

    http::contentRangeHeaderCallback(&status[0], 1, status.size(), &range);
    CHECK_FALSE(range.present);
    CHECK(range.total == 0);
}

TEST_CASE("Range header names the resume offset", "[util]")
{
    CHECK(http::rangeHeader(0) == "Range: bytes=0-");
    CHECK(http::rangeHeader(123456789012ULL) == "Range: bytes=123456789012-");
}

TEST_CASE("Parent directories are created on demand", "[util]")
{
    TempDir dir;
    const std::string path = dir.file("a/b/c/file.bin");

    CHECK_FALSE(fileExists(dir.file("a")));
    REQUIRE(ensureParentDirectory(path));
    CHECK(fileExists(dir.file("a/b/c")));
    CHECK(ensureParentDirectory(path));
    CHECK(ensureParentDirectory("relative-file"));
}

TEST_CASE("File size is zero for missing files and directories", "[util]")
{
    TempDir dir;
    std::ofstream(dir.file("five")) << "12345";

    CHECK(fileSize(dir.file("five")) == 5);
    CHECK(fileSize(dir.file("missing")) == 0);
    CHECK(fileSize(dir.path()) == 0);
}

TEST_CASE("File contents are replaced in one step", "[util]")
{
    TempDir dir;
    const std::string path = dir.file("state");
    std::string error;

    REQUIRE(replaceFileContents(path, "first", error));
    REQUIRE(replaceFileContents(path, "second", error));
    CHECK(fileSize(path) == 6);
    CHECK_FALSE(fileExists(path + ".tmp"));

    CHECK_FALSE(replaceFileContents(dir.file("missing/state"), "x", error));
    CHECK_FALSE(error.empty());
}
