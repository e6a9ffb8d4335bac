#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <spdlog/spdlog.h>

#include "core/ResumeStore.hpp"
#include "core/TransferError.hpp"
#include "util/file.hpp"

namespace
{
    bool shouldPersist(const DownloadTask &task)
    {
        DownloadStatus status = task.getStatus();
        return status == DownloadStatus::DOWNLOADING || status == DownloadStatus::PAUSED;
    }

    // Reads one task line; false on malformed data
    bool parseTaskLine(const std::string &line, TaskSpec &spec, uint64_t &expected,
                       uint64_t &transferred, uint32_t &retryCount)
    {
        std::istringstream iss(line);
        size_t headerCount = 0;

        if (!(iss >> std::quoted(spec.url)
                  >> std::quoted(spec.destination)
                  >> spec.ordinal
                  >> std::quoted(spec.title)
                  >> expected
                  >> transferred
                  >> retryCount
                  >> headerCount))
        {
            return false;
        }

        for (size_t i = 0; i < headerCount; ++i)
        {
            std::string key, value;
            if (!(iss >> std::quoted(key) >> std::quoted(value)))
            {
                return false;
            }
            spec.headers[key] = value;
        }

        std::string trailing;
        if (iss >> trailing)
        {
            return false;
        }

        return !spec.url.empty() && !spec.destination.empty();
    }
}

ResumeStore::ResumeStore(std::string manifestPath)
    : _manifestPath(std::move(manifestPath))
{
}

// Serialises the in-flight tasks and swaps the result in over the previous manifest
void ResumeStore::snapshot(const std::vector<std::shared_ptr<DownloadTask>> &tasks) const
{
    std::ostringstream out;
    out << BDM_MANIFEST_MAGIC << " " << BDM_MANIFEST_VERSION << "\n";

    size_t written = 0;
    for (const auto &task : tasks)
    {
        if (!shouldPersist(*task))
            continue;

        out << std::quoted(task->getUrl()) << " "
            << std::quoted(task->getDestination()) << " "
            << task->getOrdinal() << " "
            << std::quoted(task->getTitle()) << " "
            << task->getExpectedTotalSize() << " "
            << task->getBytesTransferred() << " "
            << task->getRetryCount() << " "
            << task->getHeaders().size();

        for (const auto &header : task->getHeaders())
        {
            out << " " << std::quoted(header.first) << " " << std::quoted(header.second);
        }
        out << "\n";
        ++written;
    }

    if (!ensureParentDirectory(_manifestPath))
    {
        throw ResumeStoreError("cannot create directory for resume manifest " + _manifestPath);
    }

    std::string error;
    if (!replaceFileContents(_manifestPath, out.str(), error))
    {
        throw ResumeStoreError("cannot write resume manifest: " + error);
    }

    spdlog::info("Saved {} unfinished download(s) to {}", written, _manifestPath);
}

std::vector<std::shared_ptr<DownloadTask>> ResumeStore::restore(uint32_t retryBudget) const
{
    std::vector<std::shared_ptr<DownloadTask>> restored;

    std::ifstream inFile(_manifestPath);
    if (!inFile.is_open())
    {
        return restored; // No file => nothing to resume
    }

    std::string line;
    std::string magic;
    int version = 0;
    if (std::getline(inFile, line))
    {
        std::istringstream header(line);
        header >> magic >> version;
    }

    if (magic != BDM_MANIFEST_MAGIC || version != BDM_MANIFEST_VERSION)
    {
        spdlog::warn("Ignoring unreadable resume manifest {}", _manifestPath);
        return restored;
    }

    while (std::getline(inFile, line))
    {
        if (line.empty())
            continue;

        TaskSpec spec;
        uint64_t expected = 0;
        uint64_t transferred = 0;
        uint32_t retryCount = 0;

        if (!parseTaskLine(line, spec, expected, transferred, retryCount))
        {
            // A half-understood manifest is worse than none
            spdlog::warn("Ignoring corrupted resume manifest {}", _manifestPath);
            restored.clear();
            return restored;
        }

        auto task = std::make_shared<DownloadTask>(spec, retryBudget);

        // The file may have been truncated or removed since the snapshot
        uint64_t onDisk = fileSize(spec.destination);
        uint64_t resumeFrom = std::min(transferred, onDisk);
        if (expected > 0)
        {
            resumeFrom = std::min(resumeFrom, expected);
        }

        task->setExpectedTotalSize(expected);
        task->setBytesTransferred(resumeFrom);
        task->setRetryCount(retryCount);
        task->setStatus(DownloadStatus::PAUSED);

        restored.push_back(task);
    }

    if (!restored.empty())
    {
        spdlog::info("Restored {} partial download(s) from {}", restored.size(), _manifestPath);
    }

    return restored;
}

void ResumeStore::clear() const
{
    if (std::remove(_manifestPath.c_str()) != 0 && errno != ENOENT)
    {
        spdlog::warn("Could not remove resume manifest {}: {}", _manifestPath, std::strerror(errno));
    }
}
