#ifndef BUILDCACHES3_SRC_REMOTE_NOT_FOUND_CLASSIFIER_HPP_
#define BUILDCACHES3_SRC_REMOTE_NOT_FOUND_CLASSIFIER_HPP_

#include <string_view>

namespace BuildCacheS3::Remote
{

/**
 * @brief Decides whether a failed S3 GetObject means "the key does not exist".
 *
 * `NoSuchKey` is the canonical answer. Buckets without ListBucket permission
 * answer `AccessDenied` for missing keys instead, so that code also counts as
 * not found, except when the message shows a signature mismatch: then the
 * request never reached the key lookup and existence is unknown.
 *
 * This is a heuristic. A backend that returns AccessDenied for a real
 * permission problem on an existing key will be read as a miss.
 *
 * @param error_code The backend's error code, e.g. "NoSuchKey".
 * @param message    The full error message returned with it.
 */
bool IsObjectNotFound(std::string_view error_code, std::string_view message);

}  // namespace BuildCacheS3::Remote

#endif  // BUILDCACHES3_SRC_REMOTE_NOT_FOUND_CLASSIFIER_HPP_
