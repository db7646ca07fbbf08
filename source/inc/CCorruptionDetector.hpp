/**
 * @file CCorruptionDetector.hpp
 * @brief Format specific structural validation of stored files
 * @version 1.0
 * @date 2025-12-01
 */
#ifndef LAP_RDS_CORRUPTIONDETECTOR_HPP
#define LAP_RDS_CORRUPTIONDETECTOR_HPP

#include <lap/core/CString.hpp>
#include "CDataType.hpp"
#include "CFileCache.hpp"

namespace lap {
namespace rds {

/**
 * @brief Decides whether a file is syntactically valid for its declared format
 *
 * Verdicts are cached per (format, path) for the configured time-to-live and
 * are discarded as soon as the file on disk changes.
 */
class CCorruptionDetector {
public:
    explicit CCorruptionDetector(
        core::UInt32 ttlSeconds = LAP_RDS_DEFAULT_CORRUPTION_CACHE_TTL_SEC,
        core::UInt32 maxEntries = LAP_RDS_DEFAULT_CORRUPTION_CACHE_ENTRIES
    ) noexcept;
    ~CCorruptionDetector() = default;

    CCorruptionDetector(const CCorruptionDetector&) = delete;
    CCorruptionDetector& operator=(const CCorruptionDetector&) = delete;

    /// Whole file parses as one JSON value
    core::Bool isValidJSON(const core::String& path) noexcept;

    /// Every non-blank line parses as JSON on its own
    core::Bool isValidJSONLines(const core::String& path) noexcept;

    /// Readable, non-empty, free of NUL bytes and tokenizable as CSV
    core::Bool isValidCSV(const core::String& path) noexcept;

    /// File exists and can be read
    core::Bool isReadable(const core::String& path) noexcept;

    /**
     * @brief Check a file against its declared format
     * @return true if the file is corrupted (or unreadable)
     */
    core::Bool detectCorruption(const core::String& path, FormatKind format) noexcept;
    core::Bool detectCorruption(const core::String& path, core::StringView format) noexcept;

    /// Drop cached verdicts of one path
    void invalidate(const core::String& path) noexcept;

    void clearCache() noexcept;
    core::Size cacheSize() const noexcept;

private:
    using Validator = core::Bool (*)(const core::String&);

    core::Bool cachedCheck(const core::String& path, FormatKind format, Validator validator) noexcept;

    static core::Bool checkJSON(const core::String& content) noexcept;
    static core::Bool checkJSONLines(const core::String& content) noexcept;
    static core::Bool checkCSV(const core::String& content) noexcept;
    static core::Bool checkReadable(const core::String& content) noexcept;

    CFileCache<core::Bool>      m_cache;
};

} // namespace rds
} // namespace lap

#endif // LAP_RDS_CORRUPTIONDETECTOR_HPP
