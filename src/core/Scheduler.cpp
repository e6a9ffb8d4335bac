#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "core/Scheduler.hpp"
#include "aux/ThreadPool.hpp"
#include "util/file.hpp"

namespace
{
    bool isEligible(const DownloadTask &task)
    {
        DownloadStatus status = task.getStatus();
        return status == DownloadStatus::PENDING || status == DownloadStatus::PAUSED;
    }

    std::string describe(const DownloadTask &task)
    {
        if (task.getTitle().empty())
        {
            return "Episode " + std::to_string(task.getOrdinal());
        }
        return "Episode " + std::to_string(task.getOrdinal()) + " (" + task.getTitle() + ")";
    }
}

Scheduler::Scheduler(Transport &transport,
                     ResumeStore &store,
                     ProgressAggregator &progress,
                     RetryPolicy policy,
                     SchedulerOptions options)
    : _transport(transport),
      _store(store),
      _progress(progress),
      _policy(policy),
      _options(options)
{
}

std::vector<std::shared_ptr<DownloadTask>> Scheduler::makeTasks(const std::vector<TaskSpec> &specs, uint32_t retryBudget)
{
    std::vector<std::shared_ptr<DownloadTask>> tasks;
    tasks.reserve(specs.size());
    for (const auto &spec : specs)
    {
        tasks.push_back(std::make_shared<DownloadTask>(spec, retryBudget));
    }
    return tasks;
}

// Folds the previous run's unfinished tasks into the submitted set, keyed by destination
std::vector<std::shared_ptr<DownloadTask>> Scheduler::mergeWithRestored(std::vector<std::shared_ptr<DownloadTask>> tasks) const
{
    std::vector<std::shared_ptr<DownloadTask>> merged;
    std::unordered_map<std::string, std::shared_ptr<DownloadTask>> byDestination;

    for (auto &task : tasks)
    {
        if (!byDestination.emplace(task->getDestination(), task).second)
        {
            spdlog::warn("Skipping duplicate download to {}", task->getDestination());
            continue;
        }
        merged.push_back(task);
    }

    for (auto &restored : _store.restore(_options.retryBudget))
    {
        auto it = byDestination.find(restored->getDestination());
        if (it == byDestination.end())
        {
            byDestination.emplace(restored->getDestination(), restored);
            merged.push_back(restored);
            continue;
        }

        // Submitted metadata wins, recorded progress wins
        DownloadTask &submitted = *it->second;
        if (restored->getUrl() != submitted.getUrl())
        {
            spdlog::warn("Discarding saved progress for {}; it was recorded for {}", submitted.getDestination(),
                         restored->getUrl());
            continue;
        }

        submitted.setExpectedTotalSize(restored->getExpectedTotalSize());
        submitted.setBytesTransferred(restored->getBytesTransferred());
        submitted.setRetryCount(restored->getRetryCount());
        submitted.setStatus(DownloadStatus::PAUSED);
    }

    return merged;
}

RunSummary Scheduler::run(std::vector<std::shared_ptr<DownloadTask>> submitted,
                          size_t concurrencyLimit,
                          const CancellationToken &token)
{
    if (concurrencyLimit == 0)
    {
        throw std::invalid_argument("concurrency limit must be at least 1");
    }

    std::vector<std::shared_ptr<DownloadTask>> tasks = mergeWithRestored(std::move(submitted));
    if (tasks.empty())
    {
        spdlog::info("No downloads to process");
        return RunSummary();
    }

    for (const auto &task : tasks)
    {
        _progress.track(*task);
    }

    _progressMade.store(false);
    spdlog::info("Starting {} download(s), {} at a time", tasks.size(), concurrencyLimit);

    bool cancelled = false;
    {
        ThreadPool pool(concurrencyLimit);
        uint32_t round = 0;

        while (true)
        {
            if (token.isCancelled())
            {
                cancelled = true;
                break;
            }

            std::vector<std::shared_ptr<DownloadTask>> eligible;
            std::copy_if(tasks.begin(), tasks.end(), std::back_inserter(eligible),
                         [](const std::shared_ptr<DownloadTask> &task)
                         { return isEligible(*task); });

            if (eligible.empty())
                break;

            if (_options.maxRounds > 0 && round >= _options.maxRounds)
            {
                markExhausted(eligible);
                break;
            }

            ++round;
            spdlog::debug("Round {}: {} eligible download(s)", round, eligible.size());

            for (const auto &task : eligible)
            {
                pool.enqueue([this, task, &token]()
                             { runTask(task, token); });
            }
            pool.waitIdle();

            if (token.isCancelled())
            {
                cancelled = true;
                break;
            }

            // Tasks left pending failed transiently and go again next round
            uint32_t highestRetry = 0;
            size_t retrying = 0;
            for (const auto &task : tasks)
            {
                if (task->getStatus() == DownloadStatus::PENDING)
                {
                    highestRetry = std::max(highestRetry, task->getRetryCount());
                    ++retrying;
                }
            }

            if (retrying == 0)
                break;

            auto delay = _policy.delayFor(highestRetry);
            spdlog::info("Retrying {} failed download(s) in {} ms", retrying, delay.count());
            if (token.waitFor(delay))
            {
                cancelled = true;
                break;
            }
        }
    }

    if (cancelled)
    {
        spdlog::info("Pausing downloads...");

        // Every worker has returned by now; keep partial files resumable
        for (const auto &task : tasks)
        {
            DownloadStatus status = task->getStatus();
            if (status == DownloadStatus::DOWNLOADING ||
                (status == DownloadStatus::PENDING && task->getBytesTransferred() > 0))
            {
                task->setStatus(DownloadStatus::PAUSED);
                _progress.onProgress(*task);
            }
        }

        _store.snapshot(tasks);
        _progress.flush();

        RunSummary summary = summarise(tasks, true);
        if (!_progressMade.load())
        {
            throw CancelledError("cancelled before any data was transferred");
        }
        return summary;
    }

    _progress.flush();
    RunSummary summary = summarise(tasks, false);

    if (summary.paused == 0 && summary.pending == 0)
    {
        _store.clear();
    }

    spdlog::info("Finished: {} completed, {} failed, {} total", summary.completed, summary.failed, summary.total);
    return summary;
}

// Executed on a pool thread; owns the task until it returns
void Scheduler::runTask(const std::shared_ptr<DownloadTask> &task, const CancellationToken &token)
{
    // Jobs still queued when cancellation arrives never start
    if (token.isCancelled())
    {
        return;
    }

    const uint64_t onDisk = std::min(task->getBytesTransferred(), fileSize(task->getDestination()));
    const bool startedFromZero = onDisk == 0;

    task->setStatus(DownloadStatus::DOWNLOADING);
    _progress.onProgress(*task);

    try
    {
        FetchResult result = _transport.fetch(*task, token, [this](const DownloadTask &current)
                                              {
                                                  _progressMade.store(true);
                                                  _progress.onProgress(current);
                                              });

        if (result == FetchResult::COMPLETED)
        {
            task->setStatus(DownloadStatus::COMPLETED);
            _progressMade.store(true);
            spdlog::info("Completed: {}", describe(*task));
        }
        else
        {
            task->setStatus(DownloadStatus::PAUSED);
            spdlog::debug("Paused: {} at {} bytes", describe(*task), task->getBytesTransferred());
        }
    }
    catch (const TransferError &e)
    {
        handleFailure(*task, e, startedFromZero);
    }
    catch (const std::exception &e)
    {
        // Not a transfer failure; retrying would hit the same bug
        handleFailure(*task, TransferError(ErrorKind::STORAGE, e.what()), startedFromZero);
    }

    _progress.onProgress(*task);
}

void Scheduler::handleFailure(DownloadTask &task, const TransferError &error, bool startedFromZero)
{
    std::optional<FailureRecord> previous = task.getLastFailure();
    Verdict verdict = _policy.classify(error, startedFromZero, previous ? &*previous : nullptr);

    FailureRecord record;
    record.kind = error.getKind();
    record.httpStatus = error.getHttpStatus();
    record.message = error.what();
    record.startedFromZero = startedFromZero;
    task.recordFailure(record);

    if (_policy.shouldRetry(task, verdict))
    {
        if (RetryPolicy::requiresRestart(error) && task.getBytesTransferred() > 0)
        {
            task.setBytesTransferred(0);
            task.setExpectedTotalSize(0);
        }

        task.setStatus(DownloadStatus::PENDING);
        spdlog::warn("Failed: {} - {} ({}); will retry ({}/{})", describe(task), error.what(),
                     errorKindName(error.getKind()), task.getRetryCount(), task.getRetryBudget());
    }
    else
    {
        task.setStatus(DownloadStatus::FAILED);
        spdlog::error("Failed: {} - {} ({}); giving up after {} attempt(s)", describe(task), error.what(),
                      errorKindName(error.getKind()), task.getRetryCount());
    }
}

void Scheduler::markExhausted(const std::vector<std::shared_ptr<DownloadTask>> &tasks)
{
    for (const auto &task : tasks)
    {
        FailureRecord record;
        record.kind = ErrorKind::EXHAUSTED;
        record.message = "round limit of " + std::to_string(_options.maxRounds) + " reached";
        task->recordFailure(record);
        task->setStatus(DownloadStatus::FAILED);
        _progress.onProgress(*task);

        spdlog::error("Failed: {} - {}", describe(*task), record.message);
    }
}

RunSummary Scheduler::summarise(const std::vector<std::shared_ptr<DownloadTask>> &tasks, bool cancelled) const
{
    RunSummary summary;
    summary.total = tasks.size();
    summary.cancelled = cancelled;

    for (const auto &task : tasks)
    {
        TaskOutcome outcome;
        outcome.destination = task->getDestination();
        outcome.ordinal = task->getOrdinal();
        outcome.title = task->getTitle();
        outcome.status = task->getStatus();
        outcome.retryCount = task->getRetryCount();
        outcome.bytesTransferred = task->getBytesTransferred();
        outcome.expectedTotalSize = task->getExpectedTotalSize();
        outcome.lastFailure = task->getLastFailure();

        switch (outcome.status)
        {
        case DownloadStatus::COMPLETED:
            summary.completed++;
            break;
        case DownloadStatus::FAILED:
            summary.failed++;
            break;
        case DownloadStatus::PAUSED:
        case DownloadStatus::DOWNLOADING:
            summary.paused++;
            break;
        case DownloadStatus::PENDING:
            summary.pending++;
            break;
        }

        summary.outcomes.push_back(outcome);
    }

    return summary;
}
