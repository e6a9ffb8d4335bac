#include <algorithm>
#include <cmath>

#include "core/RetryPolicy.hpp"

namespace
{
    // Statuses a server uses for temporary overload or unavailability
    bool isTemporaryStatus(long status)
    {
        return status >= 500 || status == 429 || status == 408;
    }
}

RetryPolicy::RetryPolicy(RetryOptions options)
    : _options(options)
{
    if (_options.backoffFactor < 1.0)
    {
        _options.backoffFactor = 1.0;
    }
}

Verdict RetryPolicy::classify(const TransferError &error, bool startedFromZero, const FailureRecord *previous) const
{
    switch (error.getKind())
    {
    case ErrorKind::CONNECTION:
    case ErrorKind::TIMEOUT:
    case ErrorKind::TLS:
    case ErrorKind::TRUNCATED:
        return Verdict::TRANSIENT;

    case ErrorKind::HTTP_STATUS:
        if (isTemporaryStatus(error.getHttpStatus()))
        {
            return Verdict::TRANSIENT;
        }

        // Any other status gets one clean attempt from offset zero before it is believed
        if (startedFromZero && previous &&
            previous->kind == ErrorKind::HTTP_STATUS &&
            previous->httpStatus == error.getHttpStatus())
        {
            return Verdict::TERMINAL;
        }
        return Verdict::TRANSIENT;

    case ErrorKind::MALFORMED_URL:
    case ErrorKind::UNSUPPORTED_PROTOCOL:
    case ErrorKind::STORAGE:
    case ErrorKind::EXHAUSTED:
        return Verdict::TERMINAL;
    }

    return Verdict::TERMINAL;
}

bool RetryPolicy::shouldRetry(const DownloadTask &task, Verdict verdict) const
{
    return verdict == Verdict::TRANSIENT && task.getRetryCount() < task.getRetryBudget();
}

std::chrono::milliseconds RetryPolicy::delayFor(uint32_t retryCount) const
{
    if (retryCount <= 1)
    {
        return std::min(_options.baseDelay, _options.maxDelay);
    }

    double scaled = static_cast<double>(_options.baseDelay.count()) *
                    std::pow(_options.backoffFactor, static_cast<double>(retryCount - 1));
    double capped = std::min(scaled, static_cast<double>(_options.maxDelay.count()));

    return std::chrono::milliseconds(static_cast<long long>(capped));
}

bool RetryPolicy::requiresRestart(const TransferError &error)
{
    return error.getKind() == ErrorKind::HTTP_STATUS && !isTemporaryStatus(error.getHttpStatus());
}
