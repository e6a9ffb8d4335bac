#include "aux/ThreadPool.hpp"

ThreadPool::ThreadPool(size_t nThreads)
{
    _workers.reserve(nThreads);
    for (size_t i = 0; i < nThreads; ++i)
    {
        _workers.emplace_back(&ThreadPool::workerLoop, this);
    }
}

// Lets the queue drain, then joins every worker
ThreadPool::~ThreadPool()
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _shuttingDown = true;
    }
    _jobAvailable.notify_all();

    for (auto &worker : _workers)
    {
        if (worker.joinable())
            worker.join();
    }
}

size_t ThreadPool::activeCount() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _active;
}

void ThreadPool::enqueue(std::function<void()> job)
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _jobs.push_back(std::move(job));
    }
    _jobAvailable.notify_one();
}

void ThreadPool::waitIdle()
{
    std::unique_lock<std::mutex> lock(_mutex);
    _drained.wait(lock, [this]
                  { return _jobs.empty() && _active == 0; });

    if (_firstError)
    {
        std::exception_ptr error = _firstError;
        _firstError = nullptr;
        std::rethrow_exception(error);
    }
}

void ThreadPool::workerLoop()
{
    std::unique_lock<std::mutex> lock(_mutex);
    while (true)
    {
        _jobAvailable.wait(lock, [this]
                           { return _shuttingDown || !_jobs.empty(); });

        if (_jobs.empty())
            return; // Shutting down with nothing left to run

        std::function<void()> job = std::move(_jobs.front());
        _jobs.pop_front();
        ++_active;

        lock.unlock();
        try
        {
            job();
        }
        catch (...)
        {
            lock.lock();
            if (!_firstError)
                _firstError = std::current_exception(); // Handed to the next waitIdle()
            lock.unlock();
        }
        lock.lock();

        --_active;
        if (_jobs.empty() && _active == 0)
            _drained.notify_all();
    }
}
