/**
 * @file CDataRecovery.hpp
 * @brief Best-effort reconstruction of records from damaged files
 * @version 1.0
 * @date 2025-12-01
 *
 * JSON recovery, first stage that yields anything wins:
 * 1. Line pass: every non-blank line is parsed on its own, failures skipped
 * 2. Brace scan: balanced {...} spans are cut out of the raw text and parsed.
 *    Braces inside string literals (including escaped quotes) do not count.
 *
 * CSV recovery keeps every row whose field count matches the header.
 */
#ifndef LAP_RDS_DATARECOVERY_HPP
#define LAP_RDS_DATARECOVERY_HPP

#include <lap/core/CString.hpp>
#include "CDataType.hpp"
#include "CFileCache.hpp"

namespace lap {
namespace rds {

class CDataRecovery {
public:
    CDataRecovery() noexcept;
    ~CDataRecovery() = default;

    CDataRecovery(const CDataRecovery&) = delete;
    CDataRecovery& operator=(const CDataRecovery&) = delete;

    /**
     * @brief Recover JSON records from a file
     * @return JSON array of the recovered values, empty if nothing was recovered
     */
    Optional<Json> recoverJSONFile(const core::String& path) noexcept;

    /**
     * @brief Recover CSV rows from a file
     * @return Rows keyed by header, empty if no row was recovered
     */
    Optional<CsvRows> recoverCSVFile(const core::String& path) noexcept;

    /// Line pass over text, exposed for reuse by readers of JSON-Lines
    static Json recoverLines(const core::String& text) noexcept;

    /// Escape aware brace scan over text
    static Json recoverObjects(const core::String& text) noexcept;

    /// Forget cached recoveries of one path
    void invalidate(const core::String& path) noexcept;

    void clearCache() noexcept;
    core::Size cacheSize() const noexcept;

private:
    CFileCache<Json>            m_jsonCache;
    CFileCache<CsvRows>         m_csvCache;
};

} // namespace rds
} // namespace lap

#endif // LAP_RDS_DATARECOVERY_HPP
