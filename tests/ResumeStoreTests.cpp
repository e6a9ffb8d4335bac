#include <catch2/catch.hpp>

#include <sys/stat.h>

#include <cstdio>
#include <fstream>

#include "core/ResumeStore.hpp"
#include "support/FakeTransport.hpp"
#include "support/TempDir.hpp"
#include "util/file.hpp"

namespace
{
    std::shared_ptr<DownloadTask> makeTask(const TempDir &dir, const std::string &name, DownloadStatus status,
                                           uint64_t bytes, uint64_t expected)
    {
        TaskSpec spec;
        spec.url = "https://cdn.example.com/" + name + "?token=a b";
        spec.destination = dir.file(name);
        spec.headers = {{"Referer", "https://example.com/show"}, {"Cookie", "session=\"x\""}};
        spec.ordinal = 7;
        spec.title = "The \"Pilot\"";

        auto task = std::make_shared<DownloadTask>(spec, 3);
        task->setStatus(status);
        task->setBytesTransferred(bytes);
        task->setExpectedTotalSize(expected);

        std::ofstream out(spec.destination, std::ios::binary);
        out << expectedContents(bytes);
        return task;
    }

    void writeText(const std::string &path, const std::string &text)
    {
        std::ofstream out(path, std::ios::binary);
        out << text;
    }
}

TEST_CASE("Missing manifest restores nothing", "[resume]")
{
    TempDir dir;
    ResumeStore store(dir.file("absent"));

    CHECK(store.restore().empty());
    REQUIRE_NOTHROW(store.clear());
}

TEST_CASE("Snapshot keeps in-flight tasks and restores them paused", "[resume]")
{
    TempDir dir;
    ResumeStore store(dir.file("state/download_resume"));

    auto paused = makeTask(dir, "ep1.mp3", DownloadStatus::PAUSED, 1500, 4000);
    auto downloading = makeTask(dir, "ep2.mp3", DownloadStatus::DOWNLOADING, 10, 0);
    auto completed = makeTask(dir, "ep3.mp3", DownloadStatus::COMPLETED, 4000, 4000);
    auto pending = makeTask(dir, "ep4.mp3", DownloadStatus::PENDING, 0, 0);
    paused->setRetryCount(2);

    store.snapshot({paused, downloading, completed, pending});
    REQUIRE(fileExists(store.getPath()));

    auto restored = store.restore(3);
    REQUIRE(restored.size() == 2);

    const DownloadTask &first = *restored[0];
    CHECK(first.getUrl() == paused->getUrl());
    CHECK(first.getDestination() == paused->getDestination());
    CHECK(first.getHeaders() == paused->getHeaders());
    CHECK(first.getOrdinal() == 7);
    CHECK(first.getTitle() == "The \"Pilot\"");
    CHECK(first.getExpectedTotalSize() == 4000);
    CHECK(first.getBytesTransferred() == 1500);
    CHECK(first.getRetryCount() == 2);
    CHECK(first.getStatus() == DownloadStatus::PAUSED);

    CHECK(restored[1]->getDestination() == downloading->getDestination());
    CHECK(restored[1]->getStatus() == DownloadStatus::PAUSED);
    CHECK(restored[1]->getExpectedTotalSize() == 0);
}

TEST_CASE("Restore never claims more than is on disk", "[resume]")
{
    TempDir dir;
    ResumeStore store(dir.file("download_resume"));

    auto task = makeTask(dir, "ep1.mp3", DownloadStatus::PAUSED, 3000, 4000);
    store.snapshot({task});

    SECTION("truncated file")
    {
        writeText(task->getDestination(), expectedContents(1200));
        auto restored = store.restore();
        REQUIRE(restored.size() == 1);
        CHECK(restored[0]->getBytesTransferred() == 1200);
    }

    SECTION("deleted file")
    {
        std::remove(task->getDestination().c_str());
        auto restored = store.restore();
        REQUIRE(restored.size() == 1);
        CHECK(restored[0]->getBytesTransferred() == 0);
    }
}

TEST_CASE("Corrupted manifest is treated as absent", "[resume]")
{
    TempDir dir;
    const std::string path = dir.file("download_resume");
    ResumeStore store(path);

    SECTION("wrong header")
    {
        writeText(path, "{\"tasks\": []}\n");
    }

    SECTION("unknown version")
    {
        writeText(path, std::string(BDM_MANIFEST_MAGIC) + " 99\n");
    }

    SECTION("garbage task line")
    {
        auto task = makeTask(dir, "ep1.mp3", DownloadStatus::PAUSED, 10, 100);
        store.snapshot({task});
        std::ofstream out(path, std::ios::app);
        out << "\"http://x\" \"/tmp/y\" not-a-number\n";
    }

    SECTION("truncated task line")
    {
        writeText(path, std::string(BDM_MANIFEST_MAGIC) + " 1\n\"http://x\" \"" + dir.file("y") + "\" 1 \"t\" 100\n");
    }

    CHECK(store.restore().empty());
}

TEST_CASE("Snapshot replaces the previous manifest and leaves no temporary file", "[resume]")
{
    TempDir dir;
    ResumeStore store(dir.file("download_resume"));

    auto first = makeTask(dir, "ep1.mp3", DownloadStatus::PAUSED, 10, 100);
    auto second = makeTask(dir, "ep2.mp3", DownloadStatus::PAUSED, 20, 200);

    store.snapshot({first, second});
    REQUIRE(store.restore().size() == 2);

    second->setStatus(DownloadStatus::COMPLETED);
    store.snapshot({first, second});

    auto restored = store.restore();
    REQUIRE(restored.size() == 1);
    CHECK(restored[0]->getDestination() == first->getDestination());
    CHECK_FALSE(fileExists(store.getPath() + ".tmp"));
}

TEST_CASE("A failed snapshot leaves the previous manifest intact", "[resume]")
{
    TempDir dir;
    ResumeStore store(dir.file("download_resume"));

    auto first = makeTask(dir, "ep1.mp3", DownloadStatus::PAUSED, 10, 100);
    auto second = makeTask(dir, "ep2.mp3", DownloadStatus::PAUSED, 20, 200);
    store.snapshot({first, second});

    // The staging file cannot be created while a directory holds its name
    REQUIRE(::mkdir((store.getPath() + ".tmp").c_str(), 0755) == 0);

    second->setStatus(DownloadStatus::COMPLETED);
    first->setBytesTransferred(5);
    CHECK_THROWS_AS(store.snapshot({first, second}), ResumeStoreError);

    auto restored = store.restore();
    REQUIRE(restored.size() == 2);
    CHECK(restored[0]->getDestination() == first->getDestination());
    CHECK(restored[0]->getBytesTransferred() == 10);
    CHECK(restored[1]->getDestination() == second->getDestination());
    CHECK(restored[1]->getBytesTransferred() == 20);
}

TEST_CASE("Clear removes the manifest", "[resume]")
{
    TempDir dir;
    ResumeStore store(dir.file("download_resume"));

    store.snapshot({makeTask(dir, "ep1.mp3", DownloadStatus::PAUSED, 10, 100)});
    REQUIRE(fileExists(store.getPath()));

    store.clear();
    CHECK_FALSE(fileExists(store.getPath()));
    CHECK(store.restore().empty());
}

TEST_CASE("Unwritable manifest location raises ResumeStoreError", "[resume]")
{
    TempDir dir;
    writeText(dir.file("blocker"), "not a directory");
    ResumeStore store(dir.file("blocker/download_resume"));

    CHECK_THROWS_AS(store.snapshot({}), ResumeStoreError);
}
