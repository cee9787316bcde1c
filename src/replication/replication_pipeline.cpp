#include "replication/replication_pipeline.hpp"

#include <spdlog/spdlog.h>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace BuildCacheS3::Replication
{

ReplicationPipeline::ReplicationPipeline(
    Remote::RemoteMirror& mirror, std::size_t queue_capacity, std::size_t num_workers
)
    : mirror_(mirror), num_workers_(num_workers), queue_(queue_capacity)
{
    if (num_workers_ < 1) {
        throw std::invalid_argument("ReplicationPipeline needs at least one worker.");
    }
}

ReplicationPipeline::~ReplicationPipeline() { Drain(); }

void ReplicationPipeline::Start(std::stop_token stop_token)
{
    std::lock_guard lock(lifecycle_mutex_);
    if (running_.load() || queue_.IsClosed()) {
        throw std::logic_error("ReplicationPipeline can only be started once.");
    }
    stop_token_ = std::move(stop_token);
    workers_.reserve(num_workers_);
    for (std::size_t i = 0; i < num_workers_; ++i) {
        workers_.emplace_back([this, i] {
            this->WorkerLoop(i);
        });
    }
    running_.store(true);
    spdlog::debug(
        "replication: started {} workers, queue capacity {}", num_workers_, queue_.Capacity()
    );
}

bool ReplicationPipeline::Enqueue(WorkItem item)
{
    const std::string action_id = item.action_id;
    if (!queue_.Push(std::move(item), stop_token_)) {
        spdlog::warn(
            "replication: queue rejected actionID={}, it will not be replicated", action_id
        );
        dropped_++;
        return false;
    }
    return true;
}

void ReplicationPipeline::Drain()
{
    std::lock_guard lock(lifecycle_mutex_);
    queue_.Close();
    if (workers_.empty()) {
        return;
    }

    spdlog::debug("replication: waiting for workers to finish");
    for (std::thread& worker : workers_) {
        worker.join();
    }
    workers_.clear();
    running_.store(false);

    // Only cancellation leaves items behind.
    if (const std::size_t abandoned = queue_.Size(); abandoned > 0) {
        spdlog::warn("replication: cancelled with {} queued items not replicated", abandoned);
        while (queue_.Pop()) {
            dropped_++;
        }
    }
}

void ReplicationPipeline::WorkerLoop(std::size_t worker_index)
{
    while (!stop_token_.stop_requested()) {
        auto item = queue_.Pop(stop_token_);
        if (!item) {
            break;
        }
        Replicate(*item);
    }
    if (stop_token_.stop_requested()) {
        spdlog::debug("replication: worker {} done by cancellation", worker_index);
    } else {
        spdlog::debug("replication: worker {} done by closed queue", worker_index);
    }
}

void ReplicationPipeline::Replicate(const WorkItem& item)
{
    spdlog::debug(
        "replication: put actionID={} outputID={} size={} diskPath={}", item.action_id,
        item.output_id, item.size, item.disk_path.string()
    );

    std::shared_ptr<std::iostream> body;
    if (item.size == 0) {
        body = std::make_shared<std::stringstream>();
    } else {
        auto file = std::make_shared<std::fstream>(item.disk_path, std::ios::in | std::ios::binary);
        if (!file->is_open()) {
            spdlog::error(
                "replication: cannot open {} for actionID={}, dropping", item.disk_path.string(),
                item.action_id
            );
            dropped_++;
            return;
        }
        body = std::move(file);
    }

    if (auto res = mirror_.Put(item.action_id, item.output_id, item.size, std::move(body)); !res) {
        spdlog::warn(
            "replication: upload of actionID={} failed: {}", item.action_id, res.error().message()
        );
        dropped_++;
        return;
    }
    replicated_++;
}

}  // namespace BuildCacheS3::Replication
