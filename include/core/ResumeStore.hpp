#ifndef RESUMESTORE_HPP
#define RESUMESTORE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "core/DownloadTask.hpp"

static constexpr const char BDM_MANIFEST_MAGIC[] = "bdm-manifest";
static constexpr int BDM_MANIFEST_VERSION = 1;
static constexpr uint32_t DEFAULT_RETRY_BUDGET = 3;

// Durable checkpoint of the tasks that were in flight when a run stopped
class ResumeStore
{
public:
    explicit ResumeStore(std::string manifestPath);

    // Replaces the manifest with the DOWNLOADING and PAUSED tasks; throws ResumeStoreError
    void snapshot(const std::vector<std::shared_ptr<DownloadTask>> &tasks) const;

    // Missing or unreadable manifest yields no tasks
    std::vector<std::shared_ptr<DownloadTask>> restore(uint32_t retryBudget = DEFAULT_RETRY_BUDGET) const;

    void clear() const;

    const std::string &getPath() const { return _manifestPath; }

private:
    std::string _manifestPath;
};

#endif
