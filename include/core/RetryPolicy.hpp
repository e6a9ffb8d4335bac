#ifndef RETRYPOLICY_HPP
#define RETRYPOLICY_HPP

#include <chrono>

#include "core/DownloadTask.hpp"
#include "core/TransferError.hpp"

enum class Verdict
{
    TRANSIENT,
    TERMINAL
};

struct RetryOptions
{
    std::chrono::milliseconds baseDelay{2000};
    double backoffFactor{1.0};
    std::chrono::milliseconds maxDelay{60000};
};

// Sole authority on whether a failed attempt is retried
class RetryPolicy
{
public:
    explicit RetryPolicy(RetryOptions options = RetryOptions());

    // previous is the failure recorded before this one, if any
    Verdict classify(const TransferError &error, bool startedFromZero, const FailureRecord *previous) const;

    // Evaluated after the failure has been counted against the task
    bool shouldRetry(const DownloadTask &task, Verdict verdict) const;

    std::chrono::milliseconds delayFor(uint32_t retryCount) const;

    // Protocol failures on a resumed attempt are retried from offset zero
    static bool requiresRestart(const TransferError &error);

    const RetryOptions &getOptions() const { return _options; }

private:
    RetryOptions _options;
};

#endif
