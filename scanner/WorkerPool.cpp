#include "WorkerPool.hpp"

#include <exception>
#include <iostream>

namespace netsweep::scanner
{
    WorkerPool::WorkerPool(std::size_t size) : running_(false), size_(size == 0 ? 1 : size) {}

    WorkerPool::~WorkerPool()
    {
        Stop();
    }

    void WorkerPool::Start()
    {
        if (running_)
            return;

        running_ = true;
        workers_.reserve(size_);
        for (std::size_t i = 0; i < size_; ++i)
        {
            workers_.emplace_back(&WorkerPool::ProcessLoop, this);
        }
    }

    void WorkerPool::Stop()
    {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (!running_)
                return;
            running_ = false;
        }
        queue_cv_.notify_all();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
                worker.join();
        }
        workers_.clear();
    }

    void WorkerPool::AddJob(Job job)
    {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            job_queue_.push(std::move(job));
        }
        queue_cv_.notify_one();
    }

    void WorkerPool::ProcessLoop()
    {
        while (true)
        {
            Job current_job;

            {
                std::unique_lock<std::mutex> lock(queue_mutex_);

                queue_cv_.wait(lock, [this]
                               { return !job_queue_.empty() || !running_; });

                if (!running_ && job_queue_.empty())
                    break;

                current_job = std::move(job_queue_.front());
                job_queue_.pop();
            }

            try
            {
                current_job();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[WorkerPool] Error processing job: " << e.what() << "\n";
            }
        }
    }
}
