#include "core/CancellationToken.hpp"

void CancellationToken::cancel()
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _cancelled.store(true);
    }

    // Wake anything sleeping between rounds
    _condition.notify_all();
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const
{
    std::unique_lock<std::mutex> lock(_mutex);
    return _condition.wait_for(lock, duration, [this]
                               { return _cancelled.load(); });
}
