#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace netsweep::scanner
{
    using Job = std::function<void()>;

    // Fixed number of threads pulling jobs from one queue. At most Size() jobs run at once.
    class WorkerPool
    {
    private:
        std::vector<std::thread> workers_;
        std::mutex queue_mutex_;
        std::condition_variable queue_cv_;
        std::queue<Job> job_queue_;
        std::atomic<bool> running_;
        std::size_t size_;

        void ProcessLoop();

    public:
        explicit WorkerPool(std::size_t size);
        ~WorkerPool();

        WorkerPool(const WorkerPool &) = delete;
        WorkerPool &operator=(const WorkerPool &) = delete;

        void Start();

        // Lets queued jobs finish, then joins every thread.
        void Stop();

        void AddJob(Job job);

        std::size_t Size() const { return size_; }
    };
}
