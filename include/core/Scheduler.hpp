#ifndef SCHEDULER_HPP
#define SCHEDULER_HPP

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/CancellationToken.hpp"
#include "core/DownloadTask.hpp"
#include "core/ProgressAggregator.hpp"
#include "core/ResumeStore.hpp"
#include "core/RetryPolicy.hpp"
#include "core/Transport.hpp"

struct SchedulerOptions
{
    // Budget given to restored tasks that were not submitted again
    uint32_t retryBudget{DEFAULT_RETRY_BUDGET};

    // Upper bound on rounds per run; 0 leaves it to the per-task retry budgets
    uint32_t maxRounds{0};
};

struct TaskOutcome
{
    std::string destination;
    int ordinal{0};
    std::string title;
    DownloadStatus status{DownloadStatus::PENDING};
    uint32_t retryCount{0};
    uint64_t bytesTransferred{0};
    uint64_t expectedTotalSize{0};
    std::optional<FailureRecord> lastFailure;
};

struct RunSummary
{
    size_t completed{0};
    size_t failed{0};
    size_t paused{0};
    size_t pending{0};
    size_t total{0};
    bool cancelled{false};
    std::vector<TaskOutcome> outcomes;

    bool allFailed() const { return total > 0 && failed == total; }
};

// Drives a batch of downloads to completion with at most a fixed number in flight
class Scheduler
{
public:
    Scheduler(Transport &transport,
              ResumeStore &store,
              ProgressAggregator &progress,
              RetryPolicy policy = RetryPolicy(),
              SchedulerOptions options = SchedulerOptions());

    // Throws CancelledError if cancelled before any byte was written,
    // ResumeStoreError if the manifest cannot be saved on cancellation
    RunSummary run(std::vector<std::shared_ptr<DownloadTask>> tasks,
                   size_t concurrencyLimit,
                   const CancellationToken &token);

    static std::vector<std::shared_ptr<DownloadTask>> makeTasks(const std::vector<TaskSpec> &specs,
                                                                uint32_t retryBudget);

private:
    Transport &_transport;
    ResumeStore &_store;
    ProgressAggregator &_progress;
    RetryPolicy _policy;
    SchedulerOptions _options;
    std::atomic<bool> _progressMade{false};

    std::vector<std::shared_ptr<DownloadTask>> mergeWithRestored(std::vector<std::shared_ptr<DownloadTask>> tasks) const;

    void runTask(const std::shared_ptr<DownloadTask> &task, const CancellationToken &token);
    void handleFailure(DownloadTask &task, const TransferError &error, bool startedFromZero);
    void markExhausted(const std::vector<std::shared_ptr<DownloadTask>> &tasks);

    RunSummary summarise(const std::vector<std::shared_ptr<DownloadTask>> &tasks, bool cancelled) const;
};

#endif
