#include "protocol/wire.hpp"

#include "protocol/encoding.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <ctime>

namespace BuildCacheS3::Protocol
{

namespace
{

constexpr std::int64_t kNanosPerSecond = 1'000'000'000;

std::error_code ProtocolError()
{
    return Storage::make_error_code(Storage::StorageErrc::ProtocolError);
}

// A missing key or JSON null leaves the target untouched.
template <typename T>
void ReadOptional(const nlohmann::json& j, const char* key, T& target)
{
    if (auto it = j.find(key); it != j.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

}  // namespace

StorageResult<Request> ParseRequest(std::string_view line)
{
    Request request;
    try {
        const auto j = nlohmann::json::parse(line);
        if (!j.is_object()) {
            spdlog::error("protocol: request is not a JSON object");
            return std::unexpected(ProtocolError());
        }
        ReadOptional(j, "ID", request.id);
        ReadOptional(j, "Command", request.command);
        ReadOptional(j, "ActionID", request.action_id);
        ReadOptional(j, "OutputID", request.output_id);
        ReadOptional(j, "BodySize", request.body_size);
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("protocol: malformed request: {}", e.what());
        return std::unexpected(ProtocolError());
    }
    if (request.body_size < 0) {
        spdlog::error(
            "protocol: negative BodySize {} in request {}", request.body_size, request.id
        );
        return std::unexpected(ProtocolError());
    }
    return request;
}

StorageResult<std::string> ParseBody(std::string_view line)
{
    std::string encoded;
    try {
        const auto j = nlohmann::json::parse(line);
        if (!j.is_string()) {
            spdlog::error("protocol: request body is not a JSON string");
            return std::unexpected(ProtocolError());
        }
        encoded = j.get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("protocol: malformed request body: {}", e.what());
        return std::unexpected(ProtocolError());
    }
    return DecodeBase64(encoded);
}

std::string SerializeResponse(const Response& response)
{
    // Field order follows the go command's own Response type.
    nlohmann::ordered_json j;
    j["ID"] = response.id;
    if (!response.err.empty()) {
        j["Err"] = response.err;
    }
    if (!response.known_commands.empty()) {
        j["KnownCommands"] = response.known_commands;
    }
    if (response.miss) {
        j["Miss"] = true;
    }
    if (!response.output_id.empty()) {
        j["OutputID"] = EncodeBase64(response.output_id);
    }
    if (response.size != 0) {
        j["Size"] = response.size;
    }
    if (response.time_nanos.has_value()) {
        j["Time"] = FormatRfc3339Nano(*response.time_nanos);
    }
    if (!response.disk_path.empty()) {
        j["DiskPath"] = response.disk_path;
    }
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string FormatRfc3339Nano(std::int64_t unix_nanos)
{
    std::int64_t seconds = unix_nanos / kNanosPerSecond;
    std::int64_t nanos   = unix_nanos % kNanosPerSecond;
    if (nanos < 0) {
        nanos += kNanosPerSecond;
        seconds -= 1;
    }

    const std::time_t as_time = static_cast<std::time_t>(seconds);
    std::tm utc{};
    ::gmtime_r(&as_time, &utc);

    std::string text = fmt::format(
        "{:04}-{:02}-{:02}T{:02}:{:02}:{:02}", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
        utc.tm_hour, utc.tm_min, utc.tm_sec
    );
    if (nanos != 0) {
        std::string fraction = fmt::format("{:09}", nanos);
        fraction.erase(fraction.find_last_not_of('0') + 1);
        text += "." + fraction;
    }
    text += "Z";
    return text;
}

}  // namespace BuildCacheS3::Protocol
