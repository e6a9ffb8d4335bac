#ifndef THREADPOOL_HPP
#define THREADPOOL_HPP

#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// Fixed set of workers; at most size() jobs run at any moment
class ThreadPool
{
public:
    explicit ThreadPool(size_t nThreads);
    ~ThreadPool();

    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;

    size_t size() const { return _workers.size(); }
    size_t activeCount() const;

    void enqueue(std::function<void()> job);

    // Blocks until every queued job has finished; rethrows the first exception a job raised
    void waitIdle();

private:
    void workerLoop();

    std::vector<std::thread> _workers;
    std::deque<std::function<void()>> _jobs;

    mutable std::mutex _mutex;
    std::condition_variable _jobAvailable;
    std::condition_variable _drained;

    size_t _active{0};
    bool _shuttingDown{false};
    std::exception_ptr _firstError;
};

#endif
