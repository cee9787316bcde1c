#ifndef BUILDCACHES3_SRC_STORAGE_CONTENT_STORE_HPP_
#define BUILDCACHES3_SRC_STORAGE_CONTENT_STORE_HPP_

#include "metrics/metrics_counters.hpp"
#include "storage/storage_error.hpp"

#include <nlohmann/json_fwd.hpp>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

namespace BuildCacheS3::Storage
{

namespace fs = std::filesystem;

// Record persisted in the index file of one action key.
struct IndexEntry {
    int version = 0;
    std::string output_id;
    std::uint64_t size     = 0;
    std::int64_t time_nanos = 0;
};

void to_json(nlohmann::json& j, const IndexEntry& entry);
void from_json(const nlohmann::json& j, IndexEntry& entry);

// Result of a successful disk lookup.
struct DiskEntry {
    std::string output_id;
    fs::path blob_path;
    std::uint64_t size     = 0;
    std::int64_t time_nanos = 0;
};

/**
 * @brief Local, authoritative tier of the cache.
 *
 * One flat directory holds an index file `a-<actionID>` per action key and
 * a blob file `o-<outputID>` per output. Each file is replaced atomically
 * (temp file in the same directory, then rename). Blobs are content
 * addressed, so concurrent puts of the same output write identical bytes
 * and need no lock.
 *
 * Every operation other than Start requires the store to be started;
 * violating this is a programmer error and aborts the process.
 */
class ContentStore
{
    public:
    explicit ContentStore(fs::path directory);
    ~ContentStore() = default;

    ContentStore(const ContentStore&)            = delete;
    ContentStore& operator=(const ContentStore&) = delete;
    ContentStore(ContentStore&&)                 = delete;
    ContentStore& operator=(ContentStore&&)      = delete;

    // Creates the directory if needed. Safe to call more than once.
    StorageResult<void> Start();

    // nullopt is a miss. Corrupted local state is also reported as a miss.
    StorageResult<std::optional<DiskEntry>> Get(const std::string& action_id);

    // Returns the entry as it would now be read back by Get.
    StorageResult<DiskEntry> Put(
        const std::string& action_id, const std::string& output_id, std::uint64_t size,
        std::istream& body
    );

    StorageResult<void> Close();

    bool IsStarted() const { return started_.load(); }
    const fs::path& GetPath() const { return directory_; }
    fs::path IndexPath(std::string_view action_id) const;
    fs::path BlobPath(std::string_view output_id) const;

    Metrics::MetricsCounters& Counters() { return counters_; }
    const Metrics::MetricsCounters& Counters() const { return counters_; }

    private:
    void RequireStarted(std::string_view operation) const;

    fs::path directory_;
    std::atomic<bool> started_{false};
    Metrics::MetricsCounters counters_;
};

// True when the key can be used verbatim as a single path component.
bool IsValidFileKey(std::string_view key);

// True for a non-empty string of an even number of hex digits.
bool IsHexString(std::string_view value);

}  // namespace BuildCacheS3::Storage

#endif  // BUILDCACHES3_SRC_STORAGE_CONTENT_STORE_HPP_
