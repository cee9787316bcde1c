#include "cache/tiered_cache.hpp"

#include "app_constants.hpp"

#include <spdlog/spdlog.h>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <utility>

namespace BuildCacheS3::Cache
{

TieredCache::TieredCache(
    const Config::AppConfig& config, std::shared_ptr<Remote::IObjectStore> store
)
    : disk_(config.local_cache_dir),
      remote_(std::move(store), config.remote.prefix),
      pipeline_(remote_, config.replication.queue_len, config.replication.workers)
{
    spdlog::debug(
        "TieredCache created: dir='{}', remote='{}', prefix='{}'", disk_.GetPath().string(),
        remote_.Describe(), remote_.GetPrefix()
    );
}

void TieredCache::RequireStarted(std::string_view operation) const
{
    if (!started_.load()) {
        spdlog::critical("cache: {} called before Start or after Close", operation);
        std::abort();
    }
}

StorageResult<void> TieredCache::Start(std::stop_token stop_token)
{
    spdlog::debug("cache: start");
    if (auto res = disk_.Start(); !res) {
        spdlog::error(
            "cache: local tier at {} failed to start: {}", disk_.GetPath().string(),
            res.error().message()
        );
        return std::unexpected(res.error());
    }

    if (auto res = Probe(); !res) {
        if (auto close_res = disk_.Close(); !close_res) {
            spdlog::warn(
                "cache: closing local tier after probe failure: {}", close_res.error().message()
            );
        }
        return std::unexpected(res.error());
    }
    spdlog::debug("cache: probe success");

    pipeline_.Start(std::move(stop_token));
    started_.store(true);
    return {};
}

StorageResult<void> TieredCache::Probe()
{
    const std::string probe_key = remote_.ObjectKey(std::string(Constants::PROBE_KEY));
    const std::string action_id(Constants::PROBE_KEY);

    auto body = std::make_shared<std::stringstream>(probe_key);
    if (auto res = remote_.Put(action_id, probe_key, probe_key.size(), body); !res) {
        spdlog::error(
            "cache: probe put to {} failed: {}", remote_.Describe(), res.error().message()
        );
        return std::unexpected(res.error());
    }

    auto got = remote_.Get(action_id);
    if (!got) {
        spdlog::error(
            "cache: probe get from {} failed: {}", remote_.Describe(), got.error().message()
        );
        return std::unexpected(got.error());
    }
    if (!got->has_value()) {
        spdlog::error("cache: probe object {} not found after put", probe_key);
        return std::unexpected(Storage::make_error_code(Storage::StorageErrc::ProbeFailed));
    }
    if ((*got)->size != probe_key.size()) {
        spdlog::error(
            "cache: probe size mismatch: expected {}, got {}", probe_key.size(), (*got)->size
        );
        return std::unexpected(Storage::make_error_code(Storage::StorageErrc::ProbeFailed));
    }
    return {};
}

StorageResult<std::optional<CacheEntry>> TieredCache::Get(const std::string& action_id)
{
    RequireStarted("Get");
    spdlog::debug("cache: get actionID={}", action_id);

    auto local = disk_.Get(action_id);
    if (local && local->has_value()) {
        Storage::DiskEntry& hit = **local;
        return CacheEntry{
            std::move(hit.output_id), std::move(hit.blob_path), hit.size, hit.time_nanos
        };
    }
    if (!local) {
        spdlog::warn(
            "cache: local get actionID={} failed, trying remote: {}", action_id,
            local.error().message()
        );
    }

    auto remote = remote_.Get(action_id);
    if (!remote) {
        return std::unexpected(remote.error());
    }
    if (!remote->has_value()) {
        return std::nullopt;
    }

    // Read-through: the remote body lands in the local tier before returning.
    Remote::RemoteEntry& found = **remote;
    auto backfilled            = disk_.Put(action_id, found.output_id, found.size, *found.body);
    if (!backfilled) {
        spdlog::error(
            "cache: backfill of actionID={} failed: {}", action_id, backfilled.error().message()
        );
        return std::unexpected(backfilled.error());
    }
    return CacheEntry{
        std::move(backfilled->output_id), std::move(backfilled->blob_path), backfilled->size,
        backfilled->time_nanos
    };
}

StorageResult<fs::path> TieredCache::Put(
    const std::string& action_id, const std::string& output_id, std::uint64_t size,
    std::istream& body
)
{
    RequireStarted("Put");
    spdlog::debug("cache: put actionID={} outputID={} size={}", action_id, output_id, size);

    auto stored = disk_.Put(action_id, output_id, size, body);
    if (!stored) {
        spdlog::error(
            "cache: local put actionID={} failed: {}", action_id, stored.error().message()
        );
        return std::unexpected(stored.error());
    }

    if (!pipeline_.Enqueue(Replication::WorkItem{action_id, output_id, size, stored->blob_path})) {
        spdlog::warn("cache: actionID={} stored locally only", action_id);
    }
    return std::move(stored->blob_path);
}

StorageResult<void> TieredCache::Close()
{
    RequireStarted("Close");
    spdlog::debug("cache: close");
    started_.store(false);

    StorageResult<void> result{};
    if (auto res = disk_.Close(); !res) {
        spdlog::error("cache: local tier stop failed: {}", res.error().message());
        result = std::unexpected(res.error());
    }
    pipeline_.Drain();
    spdlog::debug(
        "cache: replication finished, {} uploaded, {} dropped", pipeline_.Replicated(),
        pipeline_.Dropped()
    );
    return result;
}

}  // namespace BuildCacheS3::Cache
