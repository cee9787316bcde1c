#ifndef BUILDCACHES3_TESTS_FAKE_OBJECT_STORE_HPP_
#define BUILDCACHES3_TESTS_FAKE_OBJECT_STORE_HPP_

#include "remote/i_object_store.hpp"

#include <chrono>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>

namespace BuildCacheS3::Testing
{

using Storage::StorageResult;

// In-memory IObjectStore with switches for the failure modes of a real bucket.
class FakeObjectStore : public Remote::IObjectStore
{
    public:
    struct StoredObject {
        std::string data;
        Remote::ObjectMetadata metadata;
        std::uint64_t declared_length = 0;
    };

    StorageResult<void> PutObject(
        const std::string& key, std::shared_ptr<std::iostream> body, std::uint64_t content_length,
        const Remote::ObjectMetadata& metadata
    ) override
    {
        if (put_delay_.count() > 0) {
            std::this_thread::sleep_for(put_delay_);
        }
        std::lock_guard lock(mutex_);
        put_calls_++;
        if (fail_puts_) {
            return std::unexpected(
                Storage::make_error_code(Storage::StorageErrc::RemoteUnavailable)
            );
        }
        StoredObject object;
        if (body) {
            object.data.assign(
                std::istreambuf_iterator<char>(*body), std::istreambuf_iterator<char>()
            );
        }
        object.declared_length = content_length;
        if (!drop_metadata_) {
            object.metadata = metadata;
        }
        objects_[key] = std::move(object);
        return {};
    }

    StorageResult<std::optional<Remote::RemoteObject>> GetObject(const std::string& key) override
    {
        std::lock_guard lock(mutex_);
        get_calls_++;
        if (fail_gets_) {
            return std::unexpected(Storage::make_error_code(Storage::StorageErrc::RemoteError));
        }
        auto it = objects_.find(key);
        if (it == objects_.end()) {
            return std::nullopt;
        }
        const std::string data = truncate_gets_ ? std::string() : it->second.data;
        Remote::RemoteObject object;
        object.content_length = data.size();
        object.metadata       = it->second.metadata;
        object.body           = std::make_shared<std::istringstream>(data);
        return object;
    }

    std::string Describe() const override { return "fake://bucket"; }

    //------------------------------------------------------------------------------//
    // Test controls
    //------------------------------------------------------------------------------//

    void SetObject(const std::string& key, std::string data, Remote::ObjectMetadata metadata)
    {
        std::lock_guard lock(mutex_);
        const std::uint64_t length = data.size();
        objects_[key]              = StoredObject{std::move(data), std::move(metadata), length};
    }

    std::optional<StoredObject> Find(const std::string& key) const
    {
        std::lock_guard lock(mutex_);
        auto it = objects_.find(key);
        if (it == objects_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::size_t ObjectCount() const
    {
        std::lock_guard lock(mutex_);
        return objects_.size();
    }

    int PutCalls() const
    {
        std::lock_guard lock(mutex_);
        return put_calls_;
    }

    int GetCalls() const
    {
        std::lock_guard lock(mutex_);
        return get_calls_;
    }

    void SetFailPuts(bool fail)
    {
        std::lock_guard lock(mutex_);
        fail_puts_ = fail;
    }

    void SetFailGets(bool fail)
    {
        std::lock_guard lock(mutex_);
        fail_gets_ = fail;
    }

    void SetDropMetadata(bool drop)
    {
        std::lock_guard lock(mutex_);
        drop_metadata_ = drop;
    }

    // Gets return an empty body, as a bucket that lost the payload would.
    void SetTruncateGets(bool truncate)
    {
        std::lock_guard lock(mutex_);
        truncate_gets_ = truncate;
    }

    // Set before any concurrent use.
    void SetPutDelay(std::chrono::milliseconds delay) { put_delay_ = delay; }

    private:
    mutable std::mutex mutex_;
    std::map<std::string, StoredObject> objects_;
    int put_calls_      = 0;
    int get_calls_      = 0;
    bool fail_puts_     = false;
    bool fail_gets_     = false;
    bool drop_metadata_ = false;
    bool truncate_gets_ = false;
    std::chrono::milliseconds put_delay_{0};
};

}  // namespace BuildCacheS3::Testing

#endif  // BUILDCACHES3_TESTS_FAKE_OBJECT_STORE_HPP_
