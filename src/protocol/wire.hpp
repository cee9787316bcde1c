#ifndef BUILDCACHES3_SRC_PROTOCOL_WIRE_HPP_
#define BUILDCACHES3_SRC_PROTOCOL_WIRE_HPP_

#include "storage/storage_error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace BuildCacheS3::Protocol
{

using Storage::StorageResult;

//------------------------------------------------------------------------------//
// Commands
//------------------------------------------------------------------------------//

constexpr std::string_view CMD_GET   = "get";
constexpr std::string_view CMD_PUT   = "put";
constexpr std::string_view CMD_CLOSE = "close";

//------------------------------------------------------------------------------//
// Messages
//------------------------------------------------------------------------------//

/// One request line from the go command. IDs are kept in their base64 form;
/// decoding them is part of handling the request.
struct Request {
    std::int64_t id = 0;
    std::string command;
    std::string action_id;  ///< base64, may be empty
    std::string output_id;  ///< base64, may be empty
    std::int64_t body_size = 0;
};

/// Fields left at their zero value are omitted from the encoded line.
struct Response {
    std::int64_t id = 0;
    std::string err;
    std::vector<std::string> known_commands;
    bool miss = false;
    std::string output_id;  ///< raw bytes, encoded as base64 on the wire
    std::int64_t size = 0;
    std::optional<std::int64_t> time_nanos;
    std::string disk_path;
};

// ProtocolError when the line is not a JSON object of the expected shape.
StorageResult<Request> ParseRequest(std::string_view line);

// Decodes the line that follows a put request: a JSON string holding base64.
StorageResult<std::string> ParseBody(std::string_view line);

// Single line of JSON without the trailing newline.
std::string SerializeResponse(const Response& response);

// Unix nanoseconds as RFC 3339 in UTC, fractional seconds without trailing zeros.
std::string FormatRfc3339Nano(std::int64_t unix_nanos);

}  // namespace BuildCacheS3::Protocol

#endif  // BUILDCACHES3_SRC_PROTOCOL_WIRE_HPP_
