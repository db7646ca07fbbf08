/**
 * @file CFallbackHandler.hpp
 * @brief Public entry point of the resilient data store
 * @version 1.0
 * @date 2025-12-01
 *
 * Write protocol, under the per-path lock:
 * 1. Back up the existing target (best effort)
 * 2. Sanitize the payload
 * 3. Atomic write
 * 4. On failure, restore the newest backup if the target is now corrupted
 *
 * Read protocol, under the per-path lock:
 * 1. Missing file: nothing
 * 2. Corruption detection for the declared format
 * 3. Corrupted: recovery, else restore the newest backup and parse again
 * 4. Normal parse; a final parse failure returns nothing
 *
 * No public operation throws. Failures are logged and reported through the
 * returned Bool / Optional.
 */
#ifndef LAP_RDS_FALLBACKHANDLER_HPP
#define LAP_RDS_FALLBACKHANDLER_HPP

#include <functional>

#include <lap/core/CResult.hpp>
#include <lap/core/CString.hpp>
#include <lap/core/CConfig.hpp>
#include "CDataType.hpp"
#include "CDataSanitizer.hpp"
#include "CCorruptionDetector.hpp"
#include "CAtomicWriter.hpp"
#include "CBackupManager.hpp"
#include "CDataRecovery.hpp"
#include "CFileLockRegistry.hpp"

namespace lap {
namespace rds {

class CFallbackHandler {
public:
    IMP_OPERATOR_NEW(CFallbackHandler)

    explicit CFallbackHandler(const RdsConfig& config = RdsConfig()) noexcept;
    ~CFallbackHandler() = default;

    CFallbackHandler(const CFallbackHandler&) = delete;
    CFallbackHandler& operator=(const CFallbackHandler&) = delete;

    // ==================== Write ====================

    /**
     * @brief Write one JSON value
     * @param indent Pretty print indentation, config jsonIndent when empty
     * @return true if the new contents (or, after a failed write, a backup) are in place
     */
    core::Bool safeWriteJSON(
        const Json& value,
        const core::String& path,
        Optional<core::Int32> indent = Optional<core::Int32>()
    ) noexcept;

    /// Write a JSON array as one record per line
    core::Bool safeWriteJSONLines(const Json& records, const core::String& path) noexcept;

    /// Write a JSON array of objects as CSV, header from the first object
    core::Bool safeWriteCSV(const Json& records, const core::String& path) noexcept;

    // ==================== Read ====================

    Optional<Json> safeReadJSON(const core::String& path) noexcept;

    /// @return JSON array of the records in the file
    Optional<Json> safeReadJSONLines(const core::String& path) noexcept;

    Optional<CsvRows> safeReadCSV(const core::String& path) noexcept;

    // ==================== Diagnostics ====================

    void clearAllCaches() noexcept;

    /**
     * @brief Cache and lock registry sizes
     *
     * Keys: sanitizer_cache_size, corruption_cache_size, recovery_cache_size,
     * file_locks_count
     */
    core::Map<core::String, core::UInt64> getPerformanceStats() const noexcept;

    // ==================== Configuration ====================

    /**
     * @brief Read configuration from the "resilientStore" ConfigManager module
     * @return Defaults when the module is absent, error on malformed values
     */
    static core::Result<RdsConfig> loadConfig() noexcept;
    static core::Result<void> validateConfig(const RdsConfig& config) noexcept;

    const RdsConfig&            config() const noexcept             { return m_config; }

    CDataSanitizer&             sanitizer() noexcept                { return m_sanitizer; }
    CCorruptionDetector&        corruptionDetector() noexcept       { return m_detector; }
    CAtomicWriter&              atomicWriter() noexcept             { return m_writer; }
    CBackupManager&             backupManager() noexcept            { return m_backupManager; }
    CDataRecovery&              dataRecovery() noexcept             { return m_recovery; }

private:
    using WriteOperation = std::function<core::Result<void>(const core::String&)>;

    core::Bool guardedWrite(const core::String& path, FormatKind format, const WriteOperation& operation) noexcept;

    /// Caller holds the per-path lock
    core::Bool restoreLatestBackup(const core::String& canonicalPath) noexcept;
    void invalidateCaches(const core::String& canonicalPath) noexcept;

    Optional<Json> parseJSONFile(const core::String& canonicalPath) noexcept;
    Optional<Json> parseJSONLinesFile(const core::String& canonicalPath) noexcept;
    Optional<CsvRows> parseCSVFile(const core::String& canonicalPath) noexcept;

    RdsConfig                   m_config;
    CDataSanitizer              m_sanitizer;
    CCorruptionDetector         m_detector;
    CAtomicWriter               m_writer;
    CBackupManager              m_backupManager;
    CDataRecovery               m_recovery;
    CFileLockRegistry           m_locks;
};

} // namespace rds
} // namespace lap

#endif // LAP_RDS_FALLBACKHANDLER_HPP
