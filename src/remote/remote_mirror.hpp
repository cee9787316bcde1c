#ifndef BUILDCACHES3_SRC_REMOTE_REMOTE_MIRROR_HPP_
#define BUILDCACHES3_SRC_REMOTE_REMOTE_MIRROR_HPP_

#include "metrics/metrics_counters.hpp"
#include "remote/i_object_store.hpp"

#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace BuildCacheS3::Remote
{

// Result of a remote hit.
struct RemoteEntry {
    std::string output_id;
    std::uint64_t size = 0;
    std::shared_ptr<std::istream> body;
};

/**
 * @brief Object-store tier of the cache.
 *
 * Objects live under `<prefix>/<actionID>` and carry their OutputID as the
 * `outputid` metadata field. Get has three outcomes: a hit, a miss (nullopt)
 * and an error. An object without OutputID metadata is an error, not a miss.
 * Nothing is retried here.
 */
class RemoteMirror
{
    public:
    RemoteMirror(std::shared_ptr<IObjectStore> store, std::string prefix);
    ~RemoteMirror() = default;

    RemoteMirror(const RemoteMirror&)            = delete;
    RemoteMirror& operator=(const RemoteMirror&) = delete;

    StorageResult<void> Put(
        const std::string& action_id, const std::string& output_id, std::uint64_t size,
        std::shared_ptr<std::iostream> body
    );

    StorageResult<std::optional<RemoteEntry>> Get(const std::string& action_id);

    std::string ObjectKey(const std::string& action_id) const;
    const std::string& GetPrefix() const { return prefix_; }
    std::string Describe() const { return store_->Describe(); }

    Metrics::MetricsCounters& Counters() { return counters_; }
    const Metrics::MetricsCounters& Counters() const { return counters_; }

    private:
    std::shared_ptr<IObjectStore> store_;
    std::string prefix_;
    Metrics::MetricsCounters counters_;
};

}  // namespace BuildCacheS3::Remote

#endif  // BUILDCACHES3_SRC_REMOTE_REMOTE_MIRROR_HPP_
