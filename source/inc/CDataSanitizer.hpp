/**
 * @file CDataSanitizer.hpp
 * @brief Conversion of arbitrary values into serializable representations
 * @version 1.0
 * @date 2025-12-01
 *
 * JSON sanitization keeps objects, arrays and primitives and degrades
 * everything else (binary blobs, non-finite numbers, discarded values) to a
 * string. CSV sanitization flattens every value to a single cell string.
 */
#ifndef LAP_RDS_DATASANITIZER_HPP
#define LAP_RDS_DATASANITIZER_HPP

#include <deque>

#include <lap/core/CString.hpp>
#include <lap/core/CSync.hpp>
#include "CDataType.hpp"

namespace lap {
namespace rds {

/**
 * @brief Value sanitizer with a bounded, content-keyed result cache
 *
 * Cache keys are the SHA-256 of the compact serialization of the input, or an
 * explicit key supplied by the caller. Eviction is oldest-inserted-first.
 */
class CDataSanitizer {
public:
    explicit CDataSanitizer(core::UInt32 maxCacheEntries = LAP_RDS_DEFAULT_SANITIZER_CACHE_ENTRIES) noexcept;
    ~CDataSanitizer() = default;

    CDataSanitizer(const CDataSanitizer&) = delete;
    CDataSanitizer& operator=(const CDataSanitizer&) = delete;

    /**
     * @brief Sanitize a value for JSON output, using the cache
     * @param value Input value
     * @return Value whose leaves are string, number, boolean or null; strings
     *         and keys are valid UTF-8 (invalid sequences become U+FFFD)
     */
    Json sanitizeForJSON(const Json& value) noexcept;

    /**
     * @brief Sanitize a value for JSON output, caching under an explicit key
     */
    Json sanitizeForJSON(const Json& value, const core::String& cacheKey) noexcept;

    /**
     * @brief Flatten a value into one CSV cell
     *
     * null becomes "", objects and arrays their compact JSON encoding,
     * strings stay unchanged, other scalars their JSON text.
     */
    static core::String sanitizeForCSV(const Json& value) noexcept;

    /**
     * @brief Apply sanitizeForCSV to every value of an object, keys preserved
     * @return Empty map if value is not an object
     */
    static CsvRow sanitizeDictForCSV(const Json& value) noexcept;

    /// Uncached recursive JSON sanitization
    static Json sanitizeValue(const Json& value) noexcept;

    void clearCache() noexcept;
    core::Size cacheSize() const noexcept;

private:
    Json lookupOrInsert(const core::String& key, const Json& value) noexcept;

    core::UInt32                                m_maxCacheEntries;
    mutable core::Mutex                         m_cacheMutex;
    core::UnorderedMap<core::String, Json>      m_cache;
    std::deque<core::String>                    m_insertionOrder;
};

} // namespace rds
} // namespace lap

#endif // LAP_RDS_DATASANITIZER_HPP
