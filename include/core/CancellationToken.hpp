#ifndef CANCELLATIONTOKEN_HPP
#define CANCELLATIONTOKEN_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// Single cancellation signal shared by the scheduler and every worker
class CancellationToken
{
public:
    void cancel();
    bool isCancelled() const { return _cancelled.load(); }

    // Sleeps for the given duration unless cancelled first; returns true if cancelled
    bool waitFor(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> _cancelled{false};
    mutable std::mutex _mutex;
    mutable std::condition_variable _condition;
};

#endif
