#ifndef PROGRESSAGGREGATOR_HPP
#define PROGRESSAGGREGATOR_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/DownloadTask.hpp"

static constexpr std::chrono::milliseconds DEFAULT_PROGRESS_INTERVAL{500};

struct TaskProgress
{
    std::string destination;
    int ordinal{0};
    std::string title;
    uint64_t bytesTransferred{0};
    uint64_t expectedTotalSize{0};
    DownloadStatus status{DownloadStatus::PENDING};
};

struct ProgressSnapshot
{
    double overallFraction{0.0};
    uint64_t bytesDone{0};
    uint64_t bytesTotal{0}; // Sum of the sizes known so far
    double throughputBps{0.0};
    std::map<DownloadStatus, size_t> statusCounts;
    std::chrono::milliseconds elapsed{0};
    std::vector<TaskProgress> tasks;
};

using ProgressCallback = std::function<void(const ProgressSnapshot &)>;
using SubscriptionId = uint64_t;

// Thread-safe accumulator of per-task progress with rate-limited reporting.
// Subscribers are called on the reporting thread while the aggregator is locked,
// so they must not call back into the aggregator.
class ProgressAggregator
{
public:
    explicit ProgressAggregator(std::chrono::milliseconds interval = DEFAULT_PROGRESS_INTERVAL);

    SubscriptionId subscribe(ProgressCallback callback);
    void unsubscribe(SubscriptionId id);

    // Registers a task so it counts towards totals before its first byte
    void track(const DownloadTask &task);

    // Safe to call from any worker; reports at most once per interval
    void onProgress(const DownloadTask &task);

    // Recomputes and reports immediately
    void flush();

    ProgressSnapshot snapshot() const;

private:
    struct Entry
    {
        TaskProgress progress;
        uint64_t baseline{0}; // Bytes already present when tracking began
    };

    Entry &entryFor(const DownloadTask &task);
    void publishLocked(std::chrono::steady_clock::time_point now);

    mutable std::mutex _mutex;
    std::chrono::milliseconds _interval;
    std::chrono::steady_clock::time_point _startTime;
    std::chrono::steady_clock::time_point _lastReport;
    bool _hasReported{false};
    double _lastFraction{0.0};

    std::vector<Entry> _entries;
    std::unordered_map<std::string, size_t> _index;

    std::map<SubscriptionId, ProgressCallback> _subscribers;
    SubscriptionId _nextId{1};

    ProgressSnapshot _latest;
};

#endif
