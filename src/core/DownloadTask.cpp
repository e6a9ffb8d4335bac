#include <algorithm>

#include "core/DownloadTask.hpp"

const char *statusName(DownloadStatus status)
{
    switch (status)
    {
    case DownloadStatus::PENDING:
        return "pending";
    case DownloadStatus::DOWNLOADING:
        return "downloading";
    case DownloadStatus::PAUSED:
        return "paused";
    case DownloadStatus::FAILED:
        return "failed";
    case DownloadStatus::COMPLETED:
        return "completed";
    }
    return "unknown";
}

DownloadTask::DownloadTask(const TaskSpec &spec, uint32_t retryBudget)
    : _url(spec.url),
      _destination(spec.destination),
      _headers(spec.headers),
      _ordinal(spec.ordinal),
      _title(spec.title),
      _retryBudget(retryBudget)
{
}

// Returns the completed fraction in [0, 1], or 0 while the size is unknown
double DownloadTask::getProgress() const
{
    if (getStatus() == DownloadStatus::COMPLETED)
    {
        return 1.0;
    }

    uint64_t total = getExpectedTotalSize();
    if (total == 0)
    {
        return 0.0;
    }

    double fraction = static_cast<double>(getBytesTransferred()) / static_cast<double>(total);
    return std::min(fraction, 1.0);
}

void DownloadTask::recordFailure(const FailureRecord &failure)
{
    {
        std::lock_guard<std::mutex> lock(_failureMutex);
        _lastFailure = failure;
    }

    uint32_t count = _retryCount.load();
    if (count < _retryBudget)
    {
        _retryCount.store(count + 1);
    }
}

std::optional<FailureRecord> DownloadTask::getLastFailure() const
{
    std::lock_guard<std::mutex> lock(_failureMutex);
    return _lastFailure;
}

void DownloadTask::setRetryCount(uint32_t count)
{
    _retryCount.store(std::min(count, _retryBudget));
}
