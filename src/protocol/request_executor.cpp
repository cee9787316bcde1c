#include "protocol/request_executor.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace BuildCacheS3::Protocol
{

RequestExecutor::RequestExecutor(size_t num_threads)
{
    if (num_threads == 0) {
        num_threads = 1;
    }
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this] {
            this->WorkerThread();
        });
    }
    spdlog::debug("RequestExecutor started with {} threads", num_threads);
}

RequestExecutor::~RequestExecutor()
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();
    for (std::thread& worker : workers_) {
        worker.join();
    }
}

void RequestExecutor::WorkerThread()
{
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] {
                return this->stop_ || !this->tasks_.empty();
            });
            if (this->stop_ && this->tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
            ++active_;
        }

        task();

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            --active_;
            if (active_ == 0 && tasks_.empty()) {
                idle_condition_.notify_all();
            }
        }
    }
}

void RequestExecutor::SubmitTask(std::function<void()>&& task)
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("RequestExecutor is shutting down");
        }
        tasks_.emplace_back(std::move(task));
    }
    condition_.notify_one();
}

void RequestExecutor::WaitIdle()
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_condition_.wait(lock, [this] {
        return this->active_ == 0 && this->tasks_.empty();
    });
}

}  // namespace BuildCacheS3::Protocol
