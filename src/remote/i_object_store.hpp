#ifndef BUILDCACHES3_SRC_REMOTE_I_OBJECT_STORE_HPP_
#define BUILDCACHES3_SRC_REMOTE_I_OBJECT_STORE_HPP_

#include "storage/storage_error.hpp"

#include <concepts>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace BuildCacheS3::Remote
{

using Storage::StorageResult;

using ObjectMetadata = std::map<std::string, std::string>;

struct RemoteObject {
    std::uint64_t content_length = 0;
    ObjectMetadata metadata;
    std::shared_ptr<std::istream> body;  ///< Valid for as long as the caller holds it
};

// Adapter over an object store backend. Implementations translate their
// native error taxonomy into: object found, not found (nullopt), or error.
class IObjectStore
{
    public:
    virtual ~IObjectStore() = default;

    virtual StorageResult<void> PutObject(
        const std::string& key, std::shared_ptr<std::iostream> body, std::uint64_t content_length,
        const ObjectMetadata& metadata
    ) = 0;

    virtual StorageResult<std::optional<RemoteObject>> GetObject(const std::string& key) = 0;

    // Short human readable description for logs, e.g. "s3://bucket".
    virtual std::string Describe() const = 0;
};

template <typename T>
concept IsObjectStore = std::derived_from<T, IObjectStore>;

}  // namespace BuildCacheS3::Remote

#endif  // BUILDCACHES3_SRC_REMOTE_I_OBJECT_STORE_HPP_
