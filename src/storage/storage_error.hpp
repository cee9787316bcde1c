#ifndef BUILDCACHES3_SRC_STORAGE_STORAGE_ERROR_HPP_
#define BUILDCACHES3_SRC_STORAGE_STORAGE_ERROR_HPP_

#include <cerrno>
#include <expected>
#include <string>
#include <system_error>
#include <type_traits>

namespace BuildCacheS3::Storage
{

//------------------------------------------------------------------------------//
// Error Codes declared for Cache Operations
//------------------------------------------------------------------------------//

// clang-format off
enum class StorageErrc {
    Success = 0,        // Not an error
    FileNotFound,       // Path does not exist
    PermissionDenied,   // Operation not permitted
    IOError,            // General I/O error during read/write/etc.
    OutOfSpace,         // No space left on the storage medium
    AlreadyExists,      // Attempted to create something that already exists
    NotADirectory,      // Expected a directory, found a file
    IsADirectory,       // Expected a file, found a directory
    InvalidPath,        // Key cannot be used as a file name
    SizeMismatch,       // Bytes written differ from the declared size
    MetadataError,      // Error encoding or decoding an index entry
    RemoteError,        // Object store rejected or failed the request
    RemoteUnavailable,  // Object store could not be reached
    MissingOutputId,    // Remote object carries no OutputID metadata
    ProbeFailed,        // Startup self-test against the object store failed
    QueueClosed,        // Replication queue no longer accepts work
    ProtocolError,      // Malformed request on the cache program protocol
    UnknownError,       // An unspecified error occurred
};
// clang-format on

std::error_code make_error_code(StorageErrc e);

inline StorageErrc ErrnoToStorageErrc(int err_no)
{
    switch (err_no) {
        case 0:
            return StorageErrc::Success;
        case ENOENT:
            return StorageErrc::FileNotFound;
        case EACCES:
        case EPERM:
        case EROFS:
            return StorageErrc::PermissionDenied;
        case EIO:
            return StorageErrc::IOError;
        case ENOSPC:
        case EDQUOT:
            return StorageErrc::OutOfSpace;
        case EEXIST:
            return StorageErrc::AlreadyExists;
        case ENOTDIR:
            return StorageErrc::NotADirectory;
        case EISDIR:
            return StorageErrc::IsADirectory;
        case ENAMETOOLONG:
            return StorageErrc::InvalidPath;

        default:
            return StorageErrc::UnknownError;
    }
}

//------------------------------------------------------------------------------//
// Error Category Definition (Private Implementation Detail)
//------------------------------------------------------------------------------//
namespace detail
{
class StorageErrorCategory : public std::error_category
{
    public:
    const char* name() const noexcept override { return "BuildCacheS3::Storage"; }
    std::string message(int ev) const override
    {
        switch (static_cast<StorageErrc>(ev)) {
            case StorageErrc::Success:
                return "Success";
            case StorageErrc::FileNotFound:
                return "File or directory not found";
            case StorageErrc::PermissionDenied:
                return "Permission denied";
            case StorageErrc::IOError:
                return "Input/output error";
            case StorageErrc::OutOfSpace:
                return "No space left on device";
            case StorageErrc::AlreadyExists:
                return "File or directory already exists";
            case StorageErrc::NotADirectory:
                return "Path is not a directory";
            case StorageErrc::IsADirectory:
                return "Path is a directory";
            case StorageErrc::InvalidPath:
                return "Key is not a valid file name";
            case StorageErrc::SizeMismatch:
                return "Written size differs from declared size";
            case StorageErrc::MetadataError:
                return "Error encoding or decoding index entry";
            case StorageErrc::RemoteError:
                return "Object store request failed";
            case StorageErrc::RemoteUnavailable:
                return "Object store unreachable";
            case StorageErrc::MissingOutputId:
                return "Remote object has no outputid metadata";
            case StorageErrc::ProbeFailed:
                return "Object store probe failed";
            case StorageErrc::QueueClosed:
                return "Replication queue is closed";
            case StorageErrc::ProtocolError:
                return "Malformed cache program request";
            case StorageErrc::UnknownError:
                return "Unknown storage/cache error";
            default:
                return "Unrecognized error code";
        }
    }
};
}  // namespace detail

// Global instance of the category
inline const detail::StorageErrorCategory storage_error_category;

// Make the enum usable with std::error_code
inline std::error_code make_error_code(StorageErrc e)
{
    return {static_cast<int>(e), storage_error_category};
}

//------------------------------------------------------------------------------//
// Result Type Alias
//------------------------------------------------------------------------------//
template <typename T>
using StorageResult = std::expected<T, std::error_code>;

//------------------------------------------------------------------------------//
// Helper to map a raw errno / std::filesystem error into the storage category
//------------------------------------------------------------------------------//
inline std::error_code MapSystemError(const std::error_code& ec)
{
    if (!ec) {
        return {};
    }
    if (ec.category() == std::generic_category() || ec.category() == std::system_category()) {
        return make_error_code(ErrnoToStorageErrc(ec.value()));
    }
    return ec;
}

inline std::error_code ErrnoToErrorCode(int err_no)
{
    return make_error_code(ErrnoToStorageErrc(err_no));
}

}  // namespace BuildCacheS3::Storage

// Enable std::error_code implicit conversion for StorageErrc
namespace std
{
template <>
struct is_error_code_enum<BuildCacheS3::Storage::StorageErrc> : true_type {
};
}  // namespace std

#endif  // BUILDCACHES3_SRC_STORAGE_STORAGE_ERROR_HPP_
