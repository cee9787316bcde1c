#include "protocol/cache_process.hpp"

#include "protocol/encoding.hpp"

#include <spdlog/spdlog.h>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace BuildCacheS3::Protocol
{

namespace
{

bool IsBlank(const std::string& line)
{
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

std::string AbsolutePath(const std::filesystem::path& path)
{
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    return ec ? path.string() : absolute.string();
}

}  // namespace

CacheProcess::CacheProcess(Cache::TieredCache& cache, std::size_t num_threads)
    : cache_(cache), executor_(num_threads)
{
}

StorageResult<void> CacheProcess::Run(std::istream& in, std::ostream& out)
{
    Response hello;
    hello.known_commands = {std::string(CMD_GET), std::string(CMD_PUT), std::string(CMD_CLOSE)};
    WriteResponse(out, hello);

    std::string line;
    while (std::getline(in, line)) {
        if (IsBlank(line)) {
            continue;
        }
        auto request = ParseRequest(line);
        if (!request) {
            if (auto res = Shutdown(); !res) {
                spdlog::error(
                    "protocol: close after bad request failed: {}", res.error().message()
                );
            }
            return std::unexpected(request.error());
        }
        spdlog::debug("protocol: request ID={} command={}", request->id, request->command);

        if (request->command == CMD_CLOSE) {
            auto res = Shutdown();
            Response response{.id = request->id};
            if (!res) {
                response.err = "close: " + res.error().message();
            }
            WriteResponse(out, response);
            return res;
        }

        if (request->command == CMD_GET) {
            executor_.SubmitTask([this, &out, req = std::move(*request)] {
                Response response;
                try {
                    response = HandleGet(req);
                } catch (const std::exception& e) {
                    response = Response{.id = req.id, .err = e.what()};
                }
                WriteResponse(out, response);
            });
            continue;
        }

        if (request->command == CMD_PUT) {
            // The body line belongs to this request and must be consumed here.
            std::string body_line;
            if (request->body_size > 0) {
                bool have_body = false;
                while (std::getline(in, body_line)) {
                    if (!IsBlank(body_line)) {
                        have_body = true;
                        break;
                    }
                }
                if (!have_body) {
                    spdlog::error("protocol: input ended before body of request {}", request->id);
                    if (auto res = Shutdown(); !res) {
                        spdlog::error("protocol: close failed: {}", res.error().message());
                    }
                    return std::unexpected(
                        Storage::make_error_code(Storage::StorageErrc::ProtocolError)
                    );
                }
            }
            executor_.SubmitTask([this, &out, req = std::move(*request),
                                  body_line = std::move(body_line)] {
                Response response;
                try {
                    std::string body;
                    if (req.body_size > 0) {
                        auto decoded = ParseBody(body_line);
                        if (!decoded) {
                            WriteResponse(
                                out, Response{.id = req.id, .err = "put: invalid request body"}
                            );
                            return;
                        }
                        body = std::move(*decoded);
                    }
                    response = HandlePut(req, body);
                } catch (const std::exception& e) {
                    response = Response{.id = req.id, .err = e.what()};
                }
                WriteResponse(out, response);
            });
            continue;
        }

        spdlog::warn(
            "protocol: unknown command '{}' in request {}", request->command, request->id
        );
        WriteResponse(
            out, Response{.id = request->id, .err = "unknown command " + request->command}
        );
    }

    if (in.bad()) {
        spdlog::error("protocol: reading requests failed");
    }
    spdlog::debug("protocol: end of input");
    return Shutdown();
}

Response CacheProcess::HandleGet(const Request& request)
{
    Response response{.id = request.id};

    auto action_id = DecodeBase64(request.action_id);
    if (!action_id || action_id->empty()) {
        response.err = "get: invalid ActionID";
        return response;
    }

    auto entry = cache_.Get(ToHex(*action_id));
    if (!entry) {
        response.err = "get: " + entry.error().message();
        return response;
    }
    if (!entry->has_value()) {
        response.miss = true;
        return response;
    }

    const Cache::CacheEntry& hit = **entry;
    auto output_id               = FromHex(hit.output_id);
    if (!output_id) {
        response.err = "get: stored OutputID is not hex";
        return response;
    }
    response.output_id  = std::move(*output_id);
    response.size       = static_cast<std::int64_t>(hit.size);
    response.time_nanos = hit.time_nanos;
    response.disk_path  = AbsolutePath(hit.disk_path);
    return response;
}

Response CacheProcess::HandlePut(const Request& request, const std::string& body)
{
    Response response{.id = request.id};

    auto action_id = DecodeBase64(request.action_id);
    auto output_id = DecodeBase64(request.output_id);
    if (!action_id || action_id->empty() || !output_id || output_id->empty()) {
        response.err = "put: invalid ActionID or OutputID";
        return response;
    }
    if (body.size() != static_cast<std::uint64_t>(request.body_size)) {
        response.err = "put: body is " + std::to_string(body.size()) + " bytes, BodySize is " +
                       std::to_string(request.body_size);
        return response;
    }

    std::istringstream stream(body);
    auto disk_path = cache_.Put(ToHex(*action_id), ToHex(*output_id), body.size(), stream);
    if (!disk_path) {
        response.err = "put: " + disk_path.error().message();
        return response;
    }
    response.disk_path = AbsolutePath(*disk_path);
    return response;
}

StorageResult<void> CacheProcess::Shutdown()
{
    executor_.WaitIdle();
    if (!cache_.IsStarted()) {
        return {};
    }
    return cache_.Close();
}

void CacheProcess::WriteResponse(std::ostream& out, const Response& response)
{
    const std::string line = SerializeResponse(response);
    std::lock_guard lock(out_mutex_);
    out << line << '\n';
    out.flush();
    if (!out) {
        spdlog::error("protocol: failed to write response {}", response.id);
    }
}

}  // namespace BuildCacheS3::Protocol
