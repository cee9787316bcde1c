#ifndef BUILDCACHES3_SRC_METRICS_METRICS_COUNTERS_HPP_
#define BUILDCACHES3_SRC_METRICS_METRICS_COUNTERS_HPP_

#include "storage/storage_error.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>

namespace BuildCacheS3::Metrics
{

using Duration = std::chrono::nanoseconds;

struct CountersSnapshot {
    std::uint64_t gets            = 0;
    std::uint64_t hits            = 0;
    std::uint64_t misses          = 0;
    std::uint64_t get_errors      = 0;
    std::uint64_t puts            = 0;
    std::uint64_t put_errors      = 0;
    std::uint64_t total_get_bytes = 0;
    Duration total_get_duration{0};
    std::uint64_t total_put_bytes = 0;
    Duration total_put_duration{0};
};

/**
 * @brief Aggregate get/put counters for one cache tier.
 *
 * Every member is an independent atomic, so the counters can be shared by
 * any number of threads without a lock. A snapshot taken while operations
 * are in flight is not guaranteed to be consistent across fields.
 */
class MetricsCounters
{
    public:
    MetricsCounters() = default;

    MetricsCounters(const MetricsCounters&)            = delete;
    MetricsCounters& operator=(const MetricsCounters&) = delete;

    void IncrementGets() { gets_++; }
    void IncrementHits() { hits_++; }
    void IncrementMisses() { misses_++; }
    void IncrementGetErrors() { get_errors_++; }
    void IncrementPuts() { puts_++; }
    void IncrementPutErrors() { put_errors_++; }

    void AddGetTransfer(std::uint64_t bytes, Duration elapsed);
    void AddPutTransfer(std::uint64_t bytes, Duration elapsed);

    uint64_t GetGets() const { return gets_.load(); }
    uint64_t GetHits() const { return hits_.load(); }
    uint64_t GetMisses() const { return misses_.load(); }
    uint64_t GetGetErrors() const { return get_errors_.load(); }
    uint64_t GetPuts() const { return puts_.load(); }
    uint64_t GetPutErrors() const { return put_errors_.load(); }

    CountersSnapshot Snapshot() const;

    // Two human readable lines, one for gets and one for puts.
    std::string Summary() const;

    // Writes an optional header and one fixed-column CSV row.
    Storage::StorageResult<void> WriteCsv(std::ostream& out, bool header) const;

    private:
    std::atomic<uint64_t> gets_{0};
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> get_errors_{0};
    std::atomic<uint64_t> puts_{0};
    std::atomic<uint64_t> put_errors_{0};
    std::atomic<uint64_t> total_get_bytes_{0};
    std::atomic<int64_t> total_get_nanos_{0};
    std::atomic<uint64_t> total_put_bytes_{0};
    std::atomic<int64_t> total_put_nanos_{0};
};

// Formats a duration as HH:MM:SS.mmm, the layout spreadsheets accept as a time.
std::string FormatCsvDuration(Duration d);

}  // namespace BuildCacheS3::Metrics

#endif  // BUILDCACHES3_SRC_METRICS_METRICS_COUNTERS_HPP_
