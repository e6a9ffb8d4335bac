#include <catch2/catch.hpp>

#include <fstream>

#include "app/BatchFile.hpp"
#include "support/TempDir.hpp"

TEST_CASE("Batch lines carry url, destination and optional fields", "[batch]")
{
    SECTION("minimal")
    {
        auto spec = parseBatchLine("https://cdn.example.com/1.mp3 /music/show/01.mp3");
        REQUIRE(spec);
        CHECK(spec->url == "https://cdn.example.com/1.mp3");
        CHECK(spec->destination == "/music/show/01.mp3");
        CHECK(spec->ordinal == 0);
        CHECK(spec->title.empty());
        CHECK(spec->headers.empty());
    }

    SECTION("everything")
    {
        auto spec = parseBatchLine(
            "https://cdn.example.com/12.mp3 \"/music/my show/12.mp3\" 12 \"The \\\"Finale\\\"\" "
            "\"Referer: https://example.com/show\" \"Cookie: a=b; c=d\"");
        REQUIRE(spec);
        CHECK(spec->destination == "/music/my show/12.mp3");
        CHECK(spec->ordinal == 12);
        CHECK(spec->title == "The \"Finale\"");
        REQUIRE(spec->headers.size() == 2);
        CHECK(spec->headers["Referer"] == "https://example.com/show");
        CHECK(spec->headers["Cookie"] == "a=b; c=d");
    }

    SECTION("headers without a title")
    {
        auto spec = parseBatchLine("http://a/b.mp3 b.mp3 3 Authorization:Bearer");
        REQUIRE(spec);
        CHECK(spec->title.empty());
        CHECK(spec->headers["Authorization"] == "Bearer");
    }
}

TEST_CASE("Blank and comment lines are skipped", "[batch]")
{
    CHECK_FALSE(parseBatchLine(""));
    CHECK_FALSE(parseBatchLine("   \t"));
    CHECK_FALSE(parseBatchLine("# https://example.com/skip.mp3 skip.mp3"));
    CHECK_FALSE(parseBatchLine("\r"));
}

TEST_CASE("Malformed batch lines are rejected", "[batch]")
{
    CHECK_THROWS_AS(parseBatchLine("https://example.com/only-url.mp3"), ConfigError);
    CHECK_THROWS_AS(parseBatchLine("http://a/b.mp3 b.mp3 1 \"Title\" \"not a header\""), ConfigError);
}

TEST_CASE("Batch files number episodes by position and report the bad line", "[batch]")
{
    TempDir dir;
    const std::string path = dir.file("batch.txt");

    SECTION("numbering")
    {
        std::ofstream(path) << "# season one\n"
                            << "http://a/1.mp3 1.mp3\r\n"
                            << "\n"
                            << "http://a/9.mp3 9.mp3 9 \"Nine\"\n"
                            << "http://a/3.mp3 3.mp3\n";

        auto specs = loadBatchFile(path);
        REQUIRE(specs.size() == 3);
        CHECK(specs[0].ordinal == 1);
        CHECK(specs[0].destination == "1.mp3");
        CHECK(specs[1].ordinal == 9);
        CHECK(specs[2].ordinal == 3);
    }

    SECTION("error location")
    {
        std::ofstream(path) << "http://a/1.mp3 1.mp3\n"
                            << "http://a/2.mp3\n";

        CHECK_THROWS_WITH(loadBatchFile(path), Catch::Contains("batch.txt:2:"));
    }

    SECTION("missing file")
    {
        CHECK_THROWS_AS(loadBatchFile(dir.file("absent.txt")), ConfigError);
    }
}
