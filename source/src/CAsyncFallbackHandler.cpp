/**
 * @file CAsyncFallbackHandler.cpp
 * @brief Implementation of the asynchronous facade
 * @version 1.0
 * @date 2025-12-01
 */

#include "CAsyncFallbackHandler.hpp"

namespace lap {
namespace rds {

using namespace core;

CAsyncFallbackHandler::CAsyncFallbackHandler(CFallbackHandler& handler, UInt32 workerCount) noexcept
    : m_handler(handler)
    , m_pool(workerCount)
{
}

std::future<Bool> CAsyncFallbackHandler::safeWriteJSON(Json value, String path, Optional<Int32> indent) {
    return m_pool.submit([this, value = std::move(value), path = std::move(path), indent]() {
        return m_handler.safeWriteJSON(value, path, indent);
    });
}

std::future<Bool> CAsyncFallbackHandler::safeWriteJSONLines(Json records, String path) {
    return m_pool.submit([this, records = std::move(records), path = std::move(path)]() {
        return m_handler.safeWriteJSONLines(records, path);
    });
}

std::future<Bool> CAsyncFallbackHandler::safeWriteCSV(Json records, String path) {
    return m_pool.submit([this, records = std::move(records), path = std::move(path)]() {
        return m_handler.safeWriteCSV(records, path);
    });
}

std::future<Optional<Json>> CAsyncFallbackHandler::safeReadJSON(String path) {
    return m_pool.submit([this, path = std::move(path)]() {
        return m_handler.safeReadJSON(path);
    });
}

std::future<Optional<Json>> CAsyncFallbackHandler::safeReadJSONLines(String path) {
    return m_pool.submit([this, path = std::move(path)]() {
        return m_handler.safeReadJSONLines(path);
    });
}

std::future<Optional<CsvRows>> CAsyncFallbackHandler::safeReadCSV(String path) {
    return m_pool.submit([this, path = std::move(path)]() {
        return m_handler.safeReadCSV(path);
    });
}

} // namespace rds
} // namespace lap
