#ifndef BUILDCACHES3_SRC_PROTOCOL_REQUEST_EXECUTOR_HPP_
#define BUILDCACHES3_SRC_PROTOCOL_REQUEST_EXECUTOR_HPP_

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace BuildCacheS3::Protocol
{

// Fixed pool of threads running protocol requests. Tasks run in no
// particular order.
class RequestExecutor
{
    public:
    explicit RequestExecutor(size_t num_threads = std::thread::hardware_concurrency());
    ~RequestExecutor();

    RequestExecutor(const RequestExecutor&)            = delete;
    RequestExecutor& operator=(const RequestExecutor&) = delete;

    void SubmitTask(std::function<void()>&& task);

    // Blocks until every submitted task has finished.
    void WaitIdle();

    private:
    void WorkerThread();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::condition_variable idle_condition_;
    size_t active_ = 0;
    bool stop_     = false;
};

}  // namespace BuildCacheS3::Protocol

#endif  // BUILDCACHES3_SRC_PROTOCOL_REQUEST_EXECUTOR_HPP_
