#ifndef BUILDCACHES3_SRC_CACHE_TIERED_CACHE_HPP_
#define BUILDCACHES3_SRC_CACHE_TIERED_CACHE_HPP_

#include "config/config_types.hpp"
#include "remote/i_object_store.hpp"
#include "remote/remote_mirror.hpp"
#include "replication/replication_pipeline.hpp"
#include "storage/content_store.hpp"
#include "storage/storage_error.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

namespace BuildCacheS3::Cache
{

using Storage::StorageResult;

/// What a hit hands back to the protocol layer
struct CacheEntry {
    std::string output_id;
    fs::path disk_path;
    std::uint64_t size      = 0;  ///< From the index entry, no stat needed
    std::int64_t time_nanos = 0;  ///< Unix nanoseconds of the local write
};

/**
 * @brief Two-tier build cache: a local content store in front of an object
 * store.
 *
 * Put is durable locally before it returns and is copied to the object store
 * in the background. Get reads through to the object store on a local miss
 * and backfills the local tier. Close waits for all queued uploads.
 *
 * Get, Put and Close before a successful Start, or after Close, abort the
 * process.
 */
class TieredCache
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    TieredCache(const Config::AppConfig& config, std::shared_ptr<Remote::IObjectStore> store);
    ~TieredCache() = default;

    TieredCache(const TieredCache&)            = delete;
    TieredCache& operator=(const TieredCache&) = delete;
    TieredCache(TieredCache&&)                 = delete;
    TieredCache& operator=(TieredCache&&)      = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    /// Prepares the local tier, probes the object store with a put and a get,
    /// then starts the replication workers. On failure the local tier is
    /// closed again and nothing is started.
    StorageResult<void> Start(std::stop_token stop_token = {});

    StorageResult<std::optional<CacheEntry>> Get(const std::string& action_id);

    /// Returns the local blob path without waiting for the upload
    StorageResult<fs::path> Put(
        const std::string& action_id, const std::string& output_id, std::uint64_t size,
        std::istream& body
    );

    StorageResult<void> Close();

    bool IsStarted() const { return started_.load(); }

    const Metrics::MetricsCounters& DiskCounters() const { return disk_.Counters(); }
    const Metrics::MetricsCounters& RemoteCounters() const { return remote_.Counters(); }
    const Replication::ReplicationPipeline& Pipeline() const { return pipeline_; }
    const fs::path& LocalDirectory() const { return disk_.GetPath(); }

    private:
    StorageResult<void> Probe();
    void RequireStarted(std::string_view operation) const;

    Storage::ContentStore disk_;
    Remote::RemoteMirror remote_;
    Replication::ReplicationPipeline pipeline_;
    std::atomic<bool> started_{false};
};

}  // namespace BuildCacheS3::Cache

#endif  // BUILDCACHES3_SRC_CACHE_TIERED_CACHE_HPP_
