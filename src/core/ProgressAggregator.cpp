#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

#include "core/ProgressAggregator.hpp"

ProgressAggregator::ProgressAggregator(std::chrono::milliseconds interval)
    : _interval(interval),
      _startTime(std::chrono::steady_clock::now())
{
}

SubscriptionId ProgressAggregator::subscribe(ProgressCallback callback)
{
    std::lock_guard<std::mutex> lock(_mutex);
    SubscriptionId id = _nextId++;
    _subscribers.emplace(id, std::move(callback));
    return id;
}

void ProgressAggregator::unsubscribe(SubscriptionId id)
{
    std::lock_guard<std::mutex> lock(_mutex);
    _subscribers.erase(id);
}

ProgressAggregator::Entry &ProgressAggregator::entryFor(const DownloadTask &task)
{
    auto it = _index.find(task.getDestination());
    if (it != _index.end())
    {
        return _entries[it->second];
    }

    Entry entry;
    entry.progress.destination = task.getDestination();
    entry.progress.ordinal = task.getOrdinal();
    entry.progress.title = task.getTitle();
    entry.baseline = task.getBytesTransferred();

    _index.emplace(task.getDestination(), _entries.size());
    _entries.push_back(entry);
    return _entries.back();
}

void ProgressAggregator::track(const DownloadTask &task)
{
    std::lock_guard<std::mutex> lock(_mutex);
    Entry &entry = entryFor(task);
    entry.progress.bytesTransferred = task.getBytesTransferred();
    entry.progress.expectedTotalSize = task.getExpectedTotalSize();
    entry.progress.status = task.getStatus();
}

void ProgressAggregator::onProgress(const DownloadTask &task)
{
    std::lock_guard<std::mutex> lock(_mutex);

    Entry &entry = entryFor(task);
    entry.progress.bytesTransferred = task.getBytesTransferred();
    entry.progress.expectedTotalSize = task.getExpectedTotalSize();
    entry.progress.status = task.getStatus();

    // A restart from zero discards the earlier bytes
    if (entry.progress.bytesTransferred < entry.baseline)
    {
        entry.baseline = entry.progress.bytesTransferred;
    }

    auto now = std::chrono::steady_clock::now();
    if (_hasReported && now - _lastReport < _interval)
    {
        return;
    }

    publishLocked(now);
}

void ProgressAggregator::flush()
{
    std::lock_guard<std::mutex> lock(_mutex);
    publishLocked(std::chrono::steady_clock::now());
}

ProgressSnapshot ProgressAggregator::snapshot() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _latest;
}

// Recomputes the aggregate view and hands it to every subscriber
void ProgressAggregator::publishLocked(std::chrono::steady_clock::time_point now)
{
    ProgressSnapshot snapshot;
    snapshot.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - _startTime);

    uint64_t knownDone = 0;
    uint64_t sessionBytes = 0;
    bool allCompleted = !_entries.empty();

    for (const auto &entry : _entries)
    {
        const TaskProgress &progress = entry.progress;
        snapshot.tasks.push_back(progress);
        snapshot.statusCounts[progress.status]++;
        snapshot.bytesDone += progress.bytesTransferred;
        sessionBytes += progress.bytesTransferred - std::min(entry.baseline, progress.bytesTransferred);

        // Unknown sizes stay out of both sides of the fraction
        if (progress.expectedTotalSize > 0)
        {
            snapshot.bytesTotal += progress.expectedTotalSize;
            knownDone += std::min(progress.bytesTransferred, progress.expectedTotalSize);
        }

        if (progress.status != DownloadStatus::COMPLETED)
        {
            allCompleted = false;
        }
    }

    double fraction = 0.0;
    if (allCompleted)
    {
        fraction = 1.0;
    }
    else if (snapshot.bytesTotal > 0)
    {
        fraction = static_cast<double>(knownDone) / static_cast<double>(snapshot.bytesTotal);
        fraction = std::min(fraction, std::nextafter(1.0, 0.0));
    }

    // Newly discovered sizes can shrink the raw ratio; the reported one never goes back
    fraction = std::max(fraction, _lastFraction);
    _lastFraction = fraction;
    snapshot.overallFraction = fraction;

    double seconds = std::chrono::duration<double>(now - _startTime).count();
    if (seconds > 0.0)
    {
        snapshot.throughputBps = static_cast<double>(sessionBytes) / seconds;
    }

    _latest = snapshot;
    _lastReport = now;
    _hasReported = true;

    // A failing subscriber must not take the download worker down with it
    for (const auto &subscriber : _subscribers)
    {
        try
        {
            subscriber.second(_latest);
        }
        catch (const std::exception &e)
        {
            spdlog::error("Progress subscriber {} failed: {}", subscriber.first, e.what());
        }
    }
}
