#ifndef BUILDCACHES3_SRC_PROTOCOL_ENCODING_HPP_
#define BUILDCACHES3_SRC_PROTOCOL_ENCODING_HPP_

#include "storage/storage_error.hpp"

#include <string>
#include <string_view>

namespace BuildCacheS3::Protocol
{

using Storage::StorageResult;

// Standard alphabet with '=' padding, as the go command marshals []byte.
std::string EncodeBase64(std::string_view bytes);

// ProtocolError on bad length, bad padding or characters outside the alphabet.
StorageResult<std::string> DecodeBase64(std::string_view text);

// Lower-case hex of raw bytes. This is how protocol IDs become cache keys.
std::string ToHex(std::string_view bytes);

// ProtocolError for odd length or non-hex digits.
StorageResult<std::string> FromHex(std::string_view hex);

}  // namespace BuildCacheS3::Protocol

#endif  // BUILDCACHES3_SRC_PROTOCOL_ENCODING_HPP_
