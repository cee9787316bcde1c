#include "metrics/metrics_counters.hpp"

#include <fmt/format.h>
#include <cmath>

namespace BuildCacheS3::Metrics
{

namespace
{

double RoundedSeconds(Duration d)
{
    // Round to 100ms, the resolution the summary is printed at.
    auto tenths = std::chrono::round<std::chrono::milliseconds>(d).count() / 100.0;
    return std::round(tenths) / 10.0;
}

std::string TransferSuffix(std::uint64_t bytes, Duration elapsed)
{
    if (bytes == 0) {
        return {};
    }
    const double megabytes = static_cast<double>(bytes) / 1'000'000.0;
    const double seconds   = std::chrono::duration<double>(elapsed).count();
    if (seconds <= 0.0) {
        return fmt::format("; total {:.2f} MB", megabytes);
    }
    return fmt::format("; total {:.2f} MB; avg {:.2f} MB/s", megabytes, megabytes / seconds);
}

}  // namespace

void MetricsCounters::AddGetTransfer(std::uint64_t bytes, Duration elapsed)
{
    total_get_bytes_ += bytes;
    total_get_nanos_ += elapsed.count();
}

void MetricsCounters::AddPutTransfer(std::uint64_t bytes, Duration elapsed)
{
    total_put_bytes_ += bytes;
    total_put_nanos_ += elapsed.count();
}

CountersSnapshot MetricsCounters::Snapshot() const
{
    CountersSnapshot snapshot;
    snapshot.gets               = gets_.load();
    snapshot.hits               = hits_.load();
    snapshot.misses             = misses_.load();
    snapshot.get_errors         = get_errors_.load();
    snapshot.puts               = puts_.load();
    snapshot.put_errors         = put_errors_.load();
    snapshot.total_get_bytes    = total_get_bytes_.load();
    snapshot.total_get_duration = Duration(total_get_nanos_.load());
    snapshot.total_put_bytes    = total_put_bytes_.load();
    snapshot.total_put_duration = Duration(total_put_nanos_.load());
    return snapshot;
}

std::string MetricsCounters::Summary() const
{
    const auto s = Snapshot();

    std::string gets_line = fmt::format(
        "{} gets: {} hits, {} misses, {} errors, {:.1f}s total dur", s.gets, s.hits, s.misses,
        s.get_errors, RoundedSeconds(s.total_get_duration)
    );
    gets_line += TransferSuffix(s.total_get_bytes, s.total_get_duration);

    std::string puts_line = fmt::format(
        "{} puts: {} errors, {:.1f}s total dur", s.puts, s.put_errors,
        RoundedSeconds(s.total_put_duration)
    );
    puts_line += TransferSuffix(s.total_put_bytes, s.total_put_duration);

    return gets_line + "\n" + puts_line;
}

Storage::StorageResult<void> MetricsCounters::WriteCsv(std::ostream& out, bool header) const
{
    const auto s = Snapshot();
    if (header) {
        out << "gets,hits,misses,puts,getErrors,putErrors,totalGetBytes,totalGetDur,"
               "totalPutBytes,totalPutDur\n";
    }
    out << fmt::format(
        "{},{},{},{},{},{},{},{},{},{}\n", s.gets, s.hits, s.misses, s.puts, s.get_errors,
        s.put_errors, s.total_get_bytes, FormatCsvDuration(s.total_get_duration),
        s.total_put_bytes, FormatCsvDuration(s.total_put_duration)
    );
    out.flush();
    if (!out) {
        return std::unexpected(Storage::make_error_code(Storage::StorageErrc::IOError));
    }
    return {};
}

std::string FormatCsvDuration(Duration d)
{
    const auto total_ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    const auto ms       = total_ms % 1000;
    const auto seconds  = (total_ms / 1000) % 60;
    const auto minutes  = (total_ms / 60'000) % 60;
    const auto hours    = total_ms / 3'600'000;
    return fmt::format("{:02}:{:02}:{:02}.{:03}", hours, minutes, seconds, ms);
}

}  // namespace BuildCacheS3::Metrics
