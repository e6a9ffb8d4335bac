#ifndef DOWNLOADTASK_HPP
#define DOWNLOADTASK_HPP

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "core/TransferError.hpp"

enum class DownloadStatus
{
    PENDING,
    DOWNLOADING,
    PAUSED,
    FAILED,
    COMPLETED
};

const char *statusName(DownloadStatus status);

using HeaderMap = std::map<std::string, std::string>;

// What a collaborator submits for one episode
struct TaskSpec
{
    std::string url;
    std::string destination;
    HeaderMap headers;
    int ordinal{0};
    std::string title;
};

// The most recent failed attempt of a task
struct FailureRecord
{
    ErrorKind kind{ErrorKind::CONNECTION};
    long httpStatus{0};
    std::string message;
    bool startedFromZero{false};
};

class DownloadTask
{
public:
    DownloadTask(const TaskSpec &spec, uint32_t retryBudget);

    DownloadTask(const DownloadTask &) = delete;
    DownloadTask &operator=(const DownloadTask &) = delete;

    double getProgress() const;

    // Counts a failed attempt; the count saturates at the retry budget
    void recordFailure(const FailureRecord &failure);
    std::optional<FailureRecord> getLastFailure() const;

    const std::string &getUrl() const { return _url; }
    const std::string &getDestination() const { return _destination; }
    const HeaderMap &getHeaders() const { return _headers; }
    int getOrdinal() const { return _ordinal; }
    const std::string &getTitle() const { return _title; }
    uint64_t getExpectedTotalSize() const { return _expectedTotalSize.load(); }
    uint64_t getBytesTransferred() const { return _bytesTransferred.load(); }
    DownloadStatus getStatus() const { return _status.load(); }
    uint32_t getRetryCount() const { return _retryCount.load(); }
    uint32_t getRetryBudget() const { return _retryBudget; }

    void setExpectedTotalSize(uint64_t size) { _expectedTotalSize.store(size); }
    void setBytesTransferred(uint64_t bytes) { _bytesTransferred.store(bytes); }
    void addBytesTransferred(uint64_t bytes) { _bytesTransferred.fetch_add(bytes); }
    void setStatus(DownloadStatus status) { _status.store(status); }
    void setRetryCount(uint32_t count);
    void setHeaders(const HeaderMap &headers) { _headers = headers; }
    void setTitle(const std::string &title) { _title = title; }
    void setOrdinal(int ordinal) { _ordinal = ordinal; }

private:
    std::string _url;
    std::string _destination;
    HeaderMap _headers;
    int _ordinal;
    std::string _title;
    uint32_t _retryBudget;

    std::atomic<uint64_t> _expectedTotalSize{0};
    std::atomic<uint64_t> _bytesTransferred{0};
    std::atomic<DownloadStatus> _status{DownloadStatus::PENDING};
    std::atomic<uint32_t> _retryCount{0};

    mutable std::mutex _failureMutex;
    std::optional<FailureRecord> _lastFailure;
};

#endif
