#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <thread>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "app/BatchFile.hpp"
#include "app/DownloadApplication.hpp"
#include "core/ResumeStore.hpp"
#include "core/TransferError.hpp"
#include "ui/ProgressView.hpp"
#include "util/format.hpp"
#include "util/http.hpp"
#include "util/log.hpp"

namespace
{
    volatile std::sig_atomic_t interruptRequested = 0;

    void onInterrupt(int)
    {
        interruptRequested = 1;
    }

    bool interrupted()
    {
        return interruptRequested != 0;
    }

    // Restores the previous handlers when the run ends
    class InterruptGuard
    {
    public:
        InterruptGuard()
        {
            interruptRequested = 0;
            _previousInt = std::signal(SIGINT, onInterrupt);
            _previousTerm = std::signal(SIGTERM, onInterrupt);
        }

        ~InterruptGuard()
        {
            std::signal(SIGINT, _previousInt);
            std::signal(SIGTERM, _previousTerm);
        }

        InterruptGuard(const InterruptGuard &) = delete;
        InterruptGuard &operator=(const InterruptGuard &) = delete;

    private:
        void (*_previousInt)(int);
        void (*_previousTerm)(int);
    };

    void logSnapshot(const ProgressSnapshot &snapshot)
    {
        size_t completed = 0;
        auto it = snapshot.statusCounts.find(DownloadStatus::COMPLETED);
        if (it != snapshot.statusCounts.end())
        {
            completed = it->second;
        }

        spdlog::info("Progress: {:.1f}% ({} / {}) @ {}, {}/{} completed",
                     snapshot.overallFraction * 100.0,
                     formatBytes(static_cast<double>(snapshot.bytesDone)),
                     formatBytes(static_cast<double>(snapshot.bytesTotal)),
                     formatSpeed(snapshot.throughputBps),
                     completed, snapshot.tasks.size());
    }
}

DownloadApplication::DownloadApplication(EngineConfig config)
    : _config(std::move(config))
{
}

DownloadApplication::~DownloadApplication() {}

int DownloadApplication::run()
{
    const bool useUi = _config.useUi && isatty(STDOUT_FILENO);
    logging::init(_config.logLevel, _config.logFile, useUi);

    std::vector<TaskSpec> specs = loadBatchFile(_config.batchFile);
    spdlog::info("Loaded {} download(s) from {}", specs.size(), _config.batchFile);

    http::CurlGlobal curl;
    CurlTransport transport(_config.transport);
    ResumeStore store(_config.manifestPath);
    ProgressAggregator progress(_config.progressInterval);
    Scheduler scheduler(transport, store, progress, RetryPolicy(_config.retry), _config.schedulerOptions());
    CancellationToken token;

    RunSummary summary;
    try
    {
        summary = execute(scheduler, progress, token, Scheduler::makeTasks(specs, _config.retryBudget));
    }
    catch (const CancelledError &e)
    {
        spdlog::info("Paused before any data was transferred: {}", e.what());
        std::cout << "Paused; run again with the same batch to resume." << std::endl;
        return 0;
    }
    catch (const ResumeStoreError &e)
    {
        spdlog::error("{}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_MANIFEST_FAILED;
    }

    printSummary(std::cout, summary);

    if (summary.cancelled)
    {
        std::cout << "Paused; run again with the same batch to resume." << std::endl;
        return 0;
    }

    return summary.allFailed() ? EXIT_ALL_FAILED : 0;
}

// ------------------------------------------------------------------------------
// Private methods
// ------------------------------------------------------------------------------

// Runs the scheduler on a background thread while this thread draws or logs progress
RunSummary DownloadApplication::execute(Scheduler &scheduler, ProgressAggregator &progress,
                                        CancellationToken &token,
                                        std::vector<std::shared_ptr<DownloadTask>> tasks)
{
    InterruptGuard guard;
    std::atomic<bool> finished{false};
    std::exception_ptr failure;
    RunSummary summary;

    auto requestStop = [&token]()
    {
        spdlog::info("Pause requested");
        token.cancel();
    };

    std::thread worker([&]()
                       {
                           try
                           {
                               summary = scheduler.run(std::move(tasks), _config.concurrencyLimit, token);
                           }
                           catch (...)
                           {
                               failure = std::current_exception(); // Rethrown on the calling thread
                           }
                           finished.store(true);
                       });

    if (_config.useUi && isatty(STDOUT_FILENO))
    {
        ProgressView view(progress);
        view.run(finished, interrupted, requestStop);
    }
    else
    {
        SubscriptionId id = progress.subscribe(logSnapshot);
        bool stopRequested = false;
        while (!finished.load())
        {
            if (!stopRequested && interrupted())
            {
                stopRequested = true;
                requestStop();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        progress.unsubscribe(id);
    }

    worker.join();

    if (failure)
    {
        std::rethrow_exception(failure);
    }
    return summary;
}

void DownloadApplication::printSummary(std::ostream &out, const RunSummary &summary) const
{
    out << "Downloads: " << summary.total
        << ", completed: " << summary.completed
        << ", failed: " << summary.failed
        << ", paused: " << summary.paused
        << ", pending: " << summary.pending << "\n";

    for (const auto &outcome : summary.outcomes)
    {
        if (outcome.status == DownloadStatus::COMPLETED)
            continue;

        out << "  " << outcome.ordinal << ") ";
        if (!outcome.title.empty())
        {
            out << outcome.title << " ";
        }
        out << "-> " << outcome.destination << ": " << statusName(outcome.status);

        if (outcome.status == DownloadStatus::PAUSED)
        {
            out << " at " << formatBytes(static_cast<double>(outcome.bytesTransferred));
        }

        if (outcome.status == DownloadStatus::FAILED && outcome.lastFailure)
        {
            out << " (" << errorKindName(outcome.lastFailure->kind) << ": " << outcome.lastFailure->message
                << ", " << outcome.retryCount << " retries)";
        }
        out << "\n";
    }
    out.flush();
}
