/**
 * @file CAsyncFallbackHandler.hpp
 * @brief Runs CFallbackHandler operations on a worker pool
 * @version 1.0
 * @date 2025-12-01
 *
 * Contracts are those of the synchronous calls. Arguments are copied into the
 * task, so the caller's values may go out of scope before the future is ready.
 * The wrapped handler must outlive this object.
 */
#ifndef LAP_RDS_ASYNCFALLBACKHANDLER_HPP
#define LAP_RDS_ASYNCFALLBACKHANDLER_HPP

#include <future>

#include "CFallbackHandler.hpp"
#include "CWorkerPool.hpp"

namespace lap {
namespace rds {

class CAsyncFallbackHandler {
public:
    explicit CAsyncFallbackHandler(
        CFallbackHandler& handler,
        core::UInt32 workerCount = LAP_RDS_DEFAULT_ASYNC_WORKERS
    ) noexcept;
    ~CAsyncFallbackHandler() = default;

    CAsyncFallbackHandler(const CAsyncFallbackHandler&) = delete;
    CAsyncFallbackHandler& operator=(const CAsyncFallbackHandler&) = delete;

    std::future<core::Bool>             safeWriteJSON(Json value, core::String path, Optional<core::Int32> indent = Optional<core::Int32>());
    std::future<core::Bool>             safeWriteJSONLines(Json records, core::String path);
    std::future<core::Bool>             safeWriteCSV(Json records, core::String path);

    std::future<Optional<Json>>         safeReadJSON(core::String path);
    std::future<Optional<Json>>         safeReadJSONLines(core::String path);
    std::future<Optional<CsvRows>>      safeReadCSV(core::String path);

    CFallbackHandler&                   handler() noexcept          { return m_handler; }

private:
    CFallbackHandler&                   m_handler;
    CWorkerPool                         m_pool;
};

} // namespace rds
} // namespace lap

#endif // LAP_RDS_ASYNCFALLBACKHANDLER_HPP
