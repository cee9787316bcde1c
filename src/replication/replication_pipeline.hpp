#ifndef BUILDCACHES3_SRC_REPLICATION_REPLICATION_PIPELINE_HPP_
#define BUILDCACHES3_SRC_REPLICATION_REPLICATION_PIPELINE_HPP_

#include "remote/remote_mirror.hpp"
#include "replication/work_queue.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace BuildCacheS3::Replication
{

namespace fs = std::filesystem;

// One local write waiting to be copied to the remote tier.
struct WorkItem {
    std::string action_id;
    std::string output_id;
    std::uint64_t size = 0;
    fs::path disk_path;
};

/**
 * @brief Write-behind replication: a bounded queue drained by a fixed pool of
 * worker threads that upload local blobs through RemoteMirror.
 *
 * Every item is handled by exactly one worker and then discarded, whether
 * the upload succeeded or not. Upload order across items is unspecified.
 */
class ReplicationPipeline
{
    public:
    ReplicationPipeline(
        Remote::RemoteMirror& mirror, std::size_t queue_capacity, std::size_t num_workers
    );
    ~ReplicationPipeline();

    ReplicationPipeline(const ReplicationPipeline&)            = delete;
    ReplicationPipeline& operator=(const ReplicationPipeline&) = delete;
    ReplicationPipeline(ReplicationPipeline&&)                 = delete;
    ReplicationPipeline& operator=(ReplicationPipeline&&)      = delete;

    // Spawns the workers. When stop_token fires they stop after their current item.
    void Start(std::stop_token stop_token = {});

    // Blocks while the queue is full. False if the queue is closed or cancelled.
    bool Enqueue(WorkItem item);

    // Closes the queue and joins every worker. Without cancellation all queued
    // items are uploaded first. Safe to call more than once.
    void Drain();

    bool IsRunning() const { return running_.load(); }
    std::size_t Backlog() const { return queue_.Size(); }
    std::uint64_t Replicated() const { return replicated_.load(); }
    std::uint64_t Dropped() const { return dropped_.load(); }

    private:
    void WorkerLoop(std::size_t worker_index);
    void Replicate(const WorkItem& item);

    Remote::RemoteMirror& mirror_;
    const std::size_t num_workers_;
    WorkQueue<WorkItem> queue_;

    std::mutex lifecycle_mutex_;
    std::vector<std::thread> workers_;
    std::stop_token stop_token_;
    std::atomic<bool> running_{false};

    std::atomic<std::uint64_t> replicated_{0};
    std::atomic<std::uint64_t> dropped_{0};
};

}  // namespace BuildCacheS3::Replication

#endif  // BUILDCACHES3_SRC_REPLICATION_REPLICATION_PIPELINE_HPP_
