#include "storage/content_store.hpp"

#include "app_constants.hpp"

#include <boost/algorithm/hex.hpp>
#include <fcntl.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <unistd.h>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace BuildCacheS3::Storage
{

namespace
{

constexpr mode_t kFileMode         = S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH;
constexpr std::size_t kCopyBufSize = 64 * 1024;

class FileDescriptorGuard
{
    private:
    int fd_;

    public:
    explicit FileDescriptorGuard(int fd = -1) noexcept : fd_(fd) {}
    ~FileDescriptorGuard()
    {
        if (fd_ >= 0) {
            if (::close(fd_) == -1) {
                spdlog::error(
                    "~FileDescriptorGuard: Failed to close fd {}: {}", fd_, std::strerror(errno)
                );
            }
        }
    }
    FileDescriptorGuard(const FileDescriptorGuard&)            = delete;
    FileDescriptorGuard& operator=(const FileDescriptorGuard&) = delete;
    int get() const noexcept { return fd_; }
    int release() noexcept { return std::exchange(fd_, -1); }
    explicit operator bool() const noexcept { return fd_ >= 0; }
};

// Unlinks a temp file on scope exit unless the rename succeeded.
class TempFileGuard
{
    public:
    explicit TempFileGuard(std::string path) : path_(std::move(path)) {}
    ~TempFileGuard()
    {
        if (!path_.empty() && ::unlink(path_.c_str()) == -1 && errno != ENOENT) {
            spdlog::warn("Failed to remove temp file {}: {}", path_, std::strerror(errno));
        }
    }
    TempFileGuard(const TempFileGuard&)            = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;
    void Dismiss() noexcept { path_.clear(); }

    private:
    std::string path_;
};

StorageResult<void> WriteAll(int fd, const char* data, std::size_t size)
{
    while (size > 0) {
        const ssize_t written = ::write(fd, data, size);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::unexpected(ErrnoToErrorCode(errno));
        }
        data += written;
        size -= static_cast<std::size_t>(written);
    }
    return {};
}

// Streams body into a temp file beside dest and renames it into place.
// When expected_size is set the rename only happens if the byte count matches.
StorageResult<std::uint64_t> WriteAtomic(
    const fs::path& dest, std::istream& body, std::optional<std::uint64_t> expected_size
)
{
    std::string temp_path = dest.string() + ".XXXXXX";
    const int fd          = ::mkstemp(temp_path.data());
    if (fd < 0) {
        return std::unexpected(ErrnoToErrorCode(errno));
    }
    FileDescriptorGuard fd_guard(fd);
    TempFileGuard temp_guard(temp_path);

    if (::fchmod(fd, kFileMode) == -1) {
        return std::unexpected(ErrnoToErrorCode(errno));
    }

    std::array<char, kCopyBufSize> buffer{};
    std::uint64_t total = 0;
    while (body) {
        body.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize got = body.gcount();
        if (got <= 0) {
            break;
        }
        if (auto res = WriteAll(fd, buffer.data(), static_cast<std::size_t>(got)); !res) {
            return std::unexpected(res.error());
        }
        total += static_cast<std::uint64_t>(got);
    }
    if (body.bad()) {
        return std::unexpected(make_error_code(StorageErrc::IOError));
    }
    if (expected_size.has_value() && total != *expected_size) {
        spdlog::error(
            "Short write for {}: wrote {} bytes, expected {}", dest.string(), total, *expected_size
        );
        return std::unexpected(make_error_code(StorageErrc::SizeMismatch));
    }

    if (::close(fd_guard.release()) == -1) {
        return std::unexpected(ErrnoToErrorCode(errno));
    }
    if (::rename(temp_path.c_str(), dest.c_str()) == -1) {
        return std::unexpected(ErrnoToErrorCode(errno));
    }
    temp_guard.Dismiss();
    return total;
}

StorageResult<std::string> ReadWholeFile(const fs::path& path)
{
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return std::unexpected(ErrnoToErrorCode(errno));
    }
    FileDescriptorGuard fd_guard(fd);

    std::string contents;
    std::array<char, 4096> buffer{};
    while (true) {
        const ssize_t got = ::read(fd, buffer.data(), buffer.size());
        if (got < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::unexpected(ErrnoToErrorCode(errno));
        }
        if (got == 0) {
            break;
        }
        contents.append(buffer.data(), static_cast<std::size_t>(got));
    }
    return contents;
}

std::int64_t NowUnixNanos()
{
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               std::chrono::system_clock::now().time_since_epoch()
    )
        .count();
}

}  // namespace

//------------------------------------------------------------------------------//
// IndexEntry JSON
//------------------------------------------------------------------------------//

void to_json(nlohmann::json& j, const IndexEntry& entry)
{
    j = nlohmann::json{
        {"v",       entry.version},
        {"o",     entry.output_id},
        {"n",          entry.size},
        {"t",    entry.time_nanos}
    };
}

void from_json(const nlohmann::json& j, IndexEntry& entry)
{
    entry.version    = j.value("v", 0);
    entry.output_id  = j.at("o").get<std::string>();
    entry.size       = j.value("n", std::uint64_t{0});
    entry.time_nanos = j.value("t", std::int64_t{0});
}

//------------------------------------------------------------------------------//
// Key helpers
//------------------------------------------------------------------------------//

bool IsValidFileKey(std::string_view key)
{
    if (key.empty() || key == "." || key == "..") {
        return false;
    }
    return key.find('/') == std::string_view::npos && key.find('\0') == std::string_view::npos;
}

bool IsHexString(std::string_view value)
{
    if (value.empty()) {
        return false;
    }
    try {
        std::string decoded;
        boost::algorithm::unhex(value.begin(), value.end(), std::back_inserter(decoded));
    } catch (const boost::algorithm::hex_decode_error &) {
        return false;
    }
    return true;
}

//------------------------------------------------------------------------------//
// ContentStore
//------------------------------------------------------------------------------//

ContentStore::ContentStore(fs::path directory) : directory_(std::move(directory))
{
    if (directory_.empty()) {
        throw std::invalid_argument("ContentStore requires a non-empty directory.");
    }
}

fs::path ContentStore::IndexPath(std::string_view action_id) const
{
    return directory_ / (std::string(Constants::INDEX_FILE_PREFIX) + std::string(action_id));
}

fs::path ContentStore::BlobPath(std::string_view output_id) const
{
    return directory_ / (std::string(Constants::BLOB_FILE_PREFIX) + std::string(output_id));
}

void ContentStore::RequireStarted(std::string_view operation) const
{
    if (!started_.load()) {
        spdlog::critical("disk: {} called on a store that is not started", operation);
        std::abort();
    }
}

StorageResult<void> ContentStore::Start()
{
    spdlog::debug("disk: start dir={}", directory_.string());
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        return std::unexpected(MapSystemError(ec));
    }
    if (!fs::is_directory(directory_, ec)) {
        return std::unexpected(
            ec ? MapSystemError(ec) : make_error_code(StorageErrc::NotADirectory)
        );
    }
    started_.store(true);
    return {};
}

StorageResult<std::optional<DiskEntry>> ContentStore::Get(const std::string& action_id)
{
    RequireStarted("Get");
    counters_.IncrementGets();
    spdlog::debug("disk: get actionID={}", action_id);

    if (!IsValidFileKey(action_id)) {
        counters_.IncrementGetErrors();
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));
    }

    auto raw = ReadWholeFile(IndexPath(action_id));
    if (!raw) {
        if (raw.error() == StorageErrc::FileNotFound) {
            counters_.IncrementMisses();
            return std::nullopt;
        }
        counters_.IncrementGetErrors();
        return std::unexpected(raw.error());
    }

    IndexEntry entry;
    try {
        entry = nlohmann::json::parse(*raw).get<IndexEntry>();
    } catch (const nlohmann::json::exception &e) {
        spdlog::error("disk: malformed index entry actionID={}: {}", action_id, e.what());
        counters_.IncrementGetErrors();
        return std::nullopt;
    }

    // Never trust an OutputID read back from disk; it becomes a file name.
    if (!IsHexString(entry.output_id)) {
        spdlog::error("disk: non-hex outputID in index actionID={}", action_id);
        counters_.IncrementGetErrors();
        return std::nullopt;
    }

    auto blob_path = BlobPath(entry.output_id);
    struct stat st{};
    if (::stat(blob_path.c_str(), &st) == -1 || !S_ISREG(st.st_mode)) {
        spdlog::error(
            "disk: blob {} for actionID={} is missing or unreadable", blob_path.string(), action_id
        );
        counters_.IncrementGetErrors();
        return std::nullopt;
    }
    if (static_cast<std::uint64_t>(st.st_size) != entry.size) {
        spdlog::error(
            "disk: blob {} has {} bytes, index says {}", blob_path.string(), st.st_size, entry.size
        );
        counters_.IncrementGetErrors();
        return std::nullopt;
    }

    counters_.IncrementHits();
    return DiskEntry{entry.output_id, std::move(blob_path), entry.size, entry.time_nanos};
}

StorageResult<DiskEntry> ContentStore::Put(
    const std::string& action_id, const std::string& output_id, std::uint64_t size,
    std::istream& body
)
{
    RequireStarted("Put");
    counters_.IncrementPuts();
    spdlog::debug("disk: put actionID={} outputID={} size={}", action_id, output_id, size);

    if (!IsValidFileKey(action_id) || !IsValidFileKey(output_id)) {
        counters_.IncrementPutErrors();
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));
    }

    const auto start = std::chrono::steady_clock::now();
    auto blob_path   = BlobPath(output_id);

    // Empty outputs are common and can be created without the temp-file dance.
    if (size == 0) {
        const int fd =
            ::open(blob_path.c_str(), O_CREAT | O_TRUNC | O_WRONLY | O_CLOEXEC, kFileMode);
        if (fd < 0) {
            counters_.IncrementPutErrors();
            return std::unexpected(ErrnoToErrorCode(errno));
        }
        FileDescriptorGuard fd_guard(fd);
    } else {
        auto wrote = WriteAtomic(blob_path, body, size);
        if (!wrote) {
            counters_.IncrementPutErrors();
            return std::unexpected(wrote.error());
        }
    }

    const IndexEntry entry{Constants::INDEX_ENTRY_VERSION, output_id, size, NowUnixNanos()};
    std::string serialized;
    try {
        serialized = nlohmann::json(entry).dump();
    } catch (const nlohmann::json::exception &e) {
        spdlog::error("disk: cannot encode index entry actionID={}: {}", action_id, e.what());
        counters_.IncrementPutErrors();
        return std::unexpected(make_error_code(StorageErrc::MetadataError));
    }

    std::istringstream index_stream(serialized);
    if (auto res = WriteAtomic(IndexPath(action_id), index_stream, std::nullopt); !res) {
        counters_.IncrementPutErrors();
        return std::unexpected(res.error());
    }

    counters_.AddPutTransfer(
        size,
        std::chrono::duration_cast<Metrics::Duration>(std::chrono::steady_clock::now() - start)
    );
    return DiskEntry{output_id, std::move(blob_path), size, entry.time_nanos};
}

StorageResult<void> ContentStore::Close()
{
    RequireStarted("Close");
    started_.store(false);
    spdlog::debug("disk: close");
    return {};
}

}  // namespace BuildCacheS3::Storage
