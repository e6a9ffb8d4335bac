#ifndef DOWNLOADAPPLICATION_HPP
#define DOWNLOADAPPLICATION_HPP

#include <ostream>

#include "app/EngineConfig.hpp"
#include "core/Scheduler.hpp"

static constexpr int EXIT_ALL_FAILED = 1;
static constexpr int EXIT_MANIFEST_FAILED = 2;

class DownloadApplication
{
public:
    explicit DownloadApplication(EngineConfig config);
    ~DownloadApplication();

    // Runs the batch to completion or until paused; returns the process exit code
    int run();

private:
    EngineConfig _config;

    RunSummary execute(Scheduler &scheduler, ProgressAggregator &progress, CancellationToken &token,
                       std::vector<std::shared_ptr<DownloadTask>> tasks);
    void printSummary(std::ostream &out, const RunSummary &summary) const;
};

#endif
