#ifndef BUILDCACHES3_SRC_PROTOCOL_CACHE_PROCESS_HPP_
#define BUILDCACHES3_SRC_PROTOCOL_CACHE_PROCESS_HPP_

#include "app_constants.hpp"
#include "cache/tiered_cache.hpp"
#include "protocol/request_executor.hpp"
#include "protocol/wire.hpp"
#include "storage/storage_error.hpp"

#include <cstddef>
#include <istream>
#include <mutex>
#include <ostream>
#include <string>

namespace BuildCacheS3::Protocol
{

/**
 * @brief Serves the go command's GOCACHEPROG protocol on top of a started
 * TieredCache.
 *
 * Requests are read one line at a time and handled on a thread pool, so
 * responses can be written out of order. Each response is one line, written
 * under a mutex. The loop ends on "close" or end of input; both wait for
 * outstanding requests and close the cache.
 */
class CacheProcess
{
    public:
    explicit CacheProcess(
        Cache::TieredCache& cache, std::size_t num_threads = Constants::DEFAULT_REQUEST_THREADS
    );
    ~CacheProcess() = default;

    CacheProcess(const CacheProcess&)            = delete;
    CacheProcess& operator=(const CacheProcess&) = delete;

    // Returns the error that ended the loop, or the result of closing the cache.
    StorageResult<void> Run(std::istream& in, std::ostream& out);

    private:
    Response HandleGet(const Request& request);
    Response HandlePut(const Request& request, const std::string& body);
    StorageResult<void> Shutdown();
    void WriteResponse(std::ostream& out, const Response& response);

    Cache::TieredCache& cache_;
    RequestExecutor executor_;
    std::mutex out_mutex_;
};

}  // namespace BuildCacheS3::Protocol

#endif  // BUILDCACHES3_SRC_PROTOCOL_CACHE_PROCESS_HPP_
