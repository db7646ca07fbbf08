/**
 * @file CFallbackHandler.cpp
 * @brief Implementation of the write and read protocols
 * @version 1.0
 * @date 2025-12-01
 */

#include "CFallbackHandler.hpp"
#include "CCsvCodec.hpp"
#include <lap/core/CFile.hpp>

namespace lap {
namespace rds {

using namespace core;

// Replace the values validateConfig() rejects with their defaults
static RdsConfig WithValidDefaults(const RdsConfig& config) noexcept {
    if (CFallbackHandler::validateConfig(config).HasValue()) {
        return config;
    }

    RdsConfig fixed = config;
    if (fixed.backupSuffix.empty()) fixed.backupSuffix = LAP_RDS_DEFAULT_BACKUP_SUFFIX;
    if (fixed.tempSuffix.empty()) fixed.tempSuffix = LAP_RDS_DEFAULT_TEMP_SUFFIX;
    if (fixed.backupSuffix == fixed.tempSuffix) {
        fixed.backupSuffix = LAP_RDS_DEFAULT_BACKUP_SUFFIX;
        fixed.tempSuffix = LAP_RDS_DEFAULT_TEMP_SUFFIX;
    }
    if (fixed.asyncWorkerCount == 0) fixed.asyncWorkerCount = LAP_RDS_DEFAULT_ASYNC_WORKERS;
    if (fixed.journal.maxRetries == 0) fixed.journal.maxRetries = LAP_RDS_DEFAULT_JOURNAL_MAX_RETRIES;

    LAP_RDS_LOG_WARN << "Invalid resilient store config, using defaults for rejected values (backupSuffix "
                     << fixed.backupSuffix << ", tempSuffix " << fixed.tempSuffix << ")";
    return fixed;
}

CFallbackHandler::CFallbackHandler(const RdsConfig& config) noexcept
    : m_config(WithValidDefaults(config))
    , m_sanitizer(m_config.sanitizerCacheMaxEntries)
    , m_detector(m_config.corruptionCacheTtlSeconds, m_config.corruptionCacheMaxEntries)
    , m_writer(m_config.tempSuffix, m_config.fsyncOnWrite)
    , m_backupManager(m_config.backupDir, m_config.backupSuffix, m_config.tempSuffix, m_config.fsyncOnWrite)
{
    LAP_RDS_LOG_INFO << "FallbackHandler initialized, backups "
                     << (m_config.backupDir.empty() ? String("beside files") : "in " + m_config.backupDir);
}

// ==================== Write Protocol ====================

Bool CFallbackHandler::guardedWrite(const String& path, FormatKind format, const WriteOperation& operation) noexcept {
    if (path.empty()) {
        LAP_RDS_LOG_ERROR << "Write rejected: empty path";
        return false;
    }

    String canonicalPath = normalizePath(path);
    auto fileLock = m_locks.lockFor(canonicalPath);
    LockGuard guard(*fileLock);

    try {
        // Step 1: backup, a failed backup does not stop the write
        if (File::Util::exists(canonicalPath)) {
            auto backupPath = m_backupManager.createBackup(canonicalPath);
            if (!backupPath.has_value()) {
                LAP_RDS_LOG_WARN << "Continuing without backup: " << canonicalPath;
            }
        }

        // Steps 2 and 3: sanitize and write atomically
        auto writeResult = operation(canonicalPath);
        invalidateCaches(canonicalPath);

        if (writeResult.HasValue()) {
            return true;
        }

        LAP_RDS_LOG_ERROR << "Write failed for " << canonicalPath << " : " << writeResult.Error().Message();

        // Step 4: roll back damage
        if (File::Util::exists(canonicalPath) && m_detector.detectCorruption(canonicalPath, format)) {
            LAP_RDS_LOG_WARN << "Target corrupted after failed write, restoring backup: " << canonicalPath;
            return restoreLatestBackup(canonicalPath);
        }
    } catch (const std::exception& e) {
        LAP_RDS_LOG_ERROR << "Write of " << canonicalPath << " aborted: " << e.what();
        invalidateCaches(canonicalPath);
    }

    return false;
}

Bool CFallbackHandler::safeWriteJSON(const Json& value, const String& path, Optional<Int32> indent) noexcept {
    Optional<Int32> effectiveIndent = indent;
    if (!effectiveIndent.has_value() && m_config.jsonIndent >= 0) {
        effectiveIndent = m_config.jsonIndent;
    }

    return guardedWrite(path, FormatKind::kJson, [&](const String& target) {
        Json sanitized = m_sanitizer.sanitizeForJSON(value);
        return m_writer.writeJSONAtomic(sanitized, target, effectiveIndent);
    });
}

Bool CFallbackHandler::safeWriteJSONLines(const Json& records, const String& path) noexcept {
    return guardedWrite(path, FormatKind::kJsonLines, [&](const String& target) {
        Json sanitized = m_sanitizer.sanitizeForJSON(records);
        return m_writer.writeJSONLinesAtomic(sanitized, target);
    });
}

Bool CFallbackHandler::safeWriteCSV(const Json& records, const String& path) noexcept {
    // rows are flattened to strings by the writer
    return guardedWrite(path, FormatKind::kCsv, [&](const String& target) {
        return m_writer.writeCSVAtomic(records, target);
    });
}

// ==================== Read Protocol ====================

Optional<Json> CFallbackHandler::safeReadJSON(const String& path) noexcept {
    if (path.empty()) return Optional<Json>();

    String canonicalPath = normalizePath(path);
    auto fileLock = m_locks.lockFor(canonicalPath);
    LockGuard guard(*fileLock);

    if (!File::Util::exists(canonicalPath)) {
        return Optional<Json>();
    }

    if (m_detector.detectCorruption(canonicalPath, FormatKind::kJson)) {
        LAP_RDS_LOG_WARN << "Corrupted JSON file detected: " << canonicalPath;

        auto recovered = m_recovery.recoverJSONFile(canonicalPath);
        if (recovered.has_value()) {
            return recovered;
        }

        if (!restoreLatestBackup(canonicalPath)) {
            LAP_RDS_LOG_ERROR << "Unable to recover or restore " << canonicalPath;
            return Optional<Json>();
        }
    }

    return parseJSONFile(canonicalPath);
}

Optional<Json> CFallbackHandler::safeReadJSONLines(const String& path) noexcept {
    if (path.empty()) return Optional<Json>();

    String canonicalPath = normalizePath(path);
    auto fileLock = m_locks.lockFor(canonicalPath);
    LockGuard guard(*fileLock);

    if (!File::Util::exists(canonicalPath)) {
        return Optional<Json>();
    }

    if (m_detector.detectCorruption(canonicalPath, FormatKind::kJsonLines)) {
        LAP_RDS_LOG_WARN << "Corrupted JSON-Lines file detected: " << canonicalPath;

        auto recovered = m_recovery.recoverJSONFile(canonicalPath);
        if (recovered.has_value()) {
            return recovered;
        }

        if (!restoreLatestBackup(canonicalPath)) {
            LAP_RDS_LOG_ERROR << "Unable to recover or restore " << canonicalPath;
            return Optional<Json>();
        }
    }

    return parseJSONLinesFile(canonicalPath);
}

Optional<CsvRows> CFallbackHandler::safeReadCSV(const String& path) noexcept {
    if (path.empty()) return Optional<CsvRows>();

    String canonicalPath = normalizePath(path);
    auto fileLock = m_locks.lockFor(canonicalPath);
    LockGuard guard(*fileLock);

    FileFingerprint fingerprint = fingerprintOf(canonicalPath);
    if (!fingerprint.exists) {
        return Optional<CsvRows>();
    }

    // an empty record list is written as an empty file
    if (fingerprint.size == 0) {
        return Optional<CsvRows>(CsvRows());
    }

    if (m_detector.detectCorruption(canonicalPath, FormatKind::kCsv)) {
        LAP_RDS_LOG_WARN << "Corrupted CSV file detected: " << canonicalPath;

        auto recovered = m_recovery.recoverCSVFile(canonicalPath);
        if (recovered.has_value()) {
            return recovered;
        }

        if (!restoreLatestBackup(canonicalPath)) {
            LAP_RDS_LOG_ERROR << "Unable to recover or restore " << canonicalPath;
            return Optional<CsvRows>();
        }
    }

    return parseCSVFile(canonicalPath);
}

// ==================== Helpers ====================

Bool CFallbackHandler::restoreLatestBackup(const String& canonicalPath) noexcept {
    auto latest = m_backupManager.findLatestBackup(canonicalPath);
    if (!latest.has_value()) {
        LAP_RDS_LOG_WARN << "No backup available for " << canonicalPath;
        return false;
    }

    Bool restored = m_backupManager.restoreFromBackup(canonicalPath, *latest);
    invalidateCaches(canonicalPath);
    return restored;
}

void CFallbackHandler::invalidateCaches(const String& canonicalPath) noexcept {
    m_detector.invalidate(canonicalPath);
    m_recovery.invalidate(canonicalPath);
}

Optional<Json> CFallbackHandler::parseJSONFile(const String& canonicalPath) noexcept {
    String content;
    if (!readFileText(canonicalPath, content)) {
        LAP_RDS_LOG_ERROR << "Failed to read " << canonicalPath;
        return Optional<Json>();
    }

    try {
        return Optional<Json>(Json::parse(content));
    } catch (const Json::parse_error& e) {
        LAP_RDS_LOG_ERROR.logFormat("Parse JSON %s failed with exception: %s", canonicalPath.c_str(), e.what());
        return Optional<Json>();
    }
}

Optional<Json> CFallbackHandler::parseJSONLinesFile(const String& canonicalPath) noexcept {
    String content;
    if (File::Util::size(canonicalPath) > 0 && !readFileText(canonicalPath, content)) {
        LAP_RDS_LOG_ERROR << "Failed to read " << canonicalPath;
        return Optional<Json>();
    }

    // after validation every non-blank line parses
    return Optional<Json>(CDataRecovery::recoverLines(content));
}

Optional<CsvRows> CFallbackHandler::parseCSVFile(const String& canonicalPath) noexcept {
    String content;
    if (!readFileText(canonicalPath, content)) {
        LAP_RDS_LOG_ERROR << "Failed to read " << canonicalPath;
        return Optional<CsvRows>();
    }

    auto table = CCsvCodec::parse(content);
    if (!table.HasValue() || table.Value().empty()) {
        LAP_RDS_LOG_ERROR << "Failed to parse CSV " << canonicalPath;
        return Optional<CsvRows>();
    }

    const auto& fields = table.Value();
    const CsvFields& header = fields.front();
    CsvRows rows;
    rows.reserve(fields.size() - 1);

    // short rows get empty cells, surplus cells are ignored
    for (Size r = 1; r < fields.size(); ++r) {
        CsvRow row;
        for (Size c = 0; c < header.size(); ++c) {
            row[header[c]] = c < fields[r].size() ? fields[r][c] : String();
        }
        rows.push_back(std::move(row));
    }

    return Optional<CsvRows>(std::move(rows));
}

// ==================== Diagnostics ====================

void CFallbackHandler::clearAllCaches() noexcept {
    m_sanitizer.clearCache();
    m_detector.clearCache();
    m_recovery.clearCache();
    LAP_RDS_LOG_DEBUG << "All caches cleared";
}

Map<String, UInt64> CFallbackHandler::getPerformanceStats() const noexcept {
    Map<String, UInt64> stats;
    stats[LAP_RDS_STAT_SANITIZER_CACHE]     = m_sanitizer.cacheSize();
    stats[LAP_RDS_STAT_CORRUPTION_CACHE]    = m_detector.cacheSize();
    stats[LAP_RDS_STAT_RECOVERY_CACHE]      = m_recovery.cacheSize();
    stats[LAP_RDS_STAT_FILE_LOCKS]          = m_locks.size();
    return stats;
}

// ==================== Configuration ====================

Result<RdsConfig> CFallbackHandler::loadConfig() noexcept {
    using result = Result<RdsConfig>;

    try {
        auto& configMgr = ConfigManager::getInstance();
        auto moduleConfig = configMgr.getModuleConfigJson(LAP_RDS_CONFIG_MODULE);

        if (moduleConfig.is_null() || moduleConfig.empty()) {
            LAP_RDS_LOG_WARN << "Resilient store config not found, using defaults";
            return result::FromValue(RdsConfig());
        }

        RdsConfig config;
        config.backupDir = moduleConfig.value("backupDir", "");
        config.backupSuffix = moduleConfig.value("backupSuffix", LAP_RDS_DEFAULT_BACKUP_SUFFIX);
        config.tempSuffix = moduleConfig.value("tempSuffix", LAP_RDS_DEFAULT_TEMP_SUFFIX);
        config.jsonIndent = moduleConfig.value("jsonIndent", Int32(LAP_RDS_DEFAULT_JSON_INDENT));
        config.corruptionCacheTtlSeconds = moduleConfig.value("corruptionCacheTtlSeconds", UInt32(LAP_RDS_DEFAULT_CORRUPTION_CACHE_TTL_SEC));
        config.corruptionCacheMaxEntries = moduleConfig.value("corruptionCacheMaxEntries", UInt32(LAP_RDS_DEFAULT_CORRUPTION_CACHE_ENTRIES));
        config.sanitizerCacheMaxEntries = moduleConfig.value("sanitizerCacheMaxEntries", UInt32(LAP_RDS_DEFAULT_SANITIZER_CACHE_ENTRIES));
        config.asyncWorkerCount = moduleConfig.value("asyncWorkerCount", UInt32(LAP_RDS_DEFAULT_ASYNC_WORKERS));
        config.fsyncOnWrite = moduleConfig.value("fsyncOnWrite", true);

        auto journalJson = moduleConfig.value("journal", nlohmann::json::object());
        config.journal.directory = journalJson.value("directory", LAP_RDS_DEFAULT_JOURNAL_DIR);
        config.journal.maxRetries = journalJson.value("maxRetries", UInt32(LAP_RDS_DEFAULT_JOURNAL_MAX_RETRIES));
        config.journal.failureThreshold = journalJson.value("failureThreshold", UInt32(LAP_RDS_DEFAULT_JOURNAL_FAILURE_THRESHOLD));
        config.journal.circuitTimeoutSeconds = journalJson.value("circuitTimeoutSeconds", UInt32(LAP_RDS_DEFAULT_JOURNAL_CIRCUIT_TIMEOUT_SEC));

        auto validation = validateConfig(config);
        if (!validation.HasValue()) {
            return result::FromError(validation.Error());
        }

        return result::FromValue(config);
    } catch (const std::exception& e) {
        LAP_RDS_LOG_ERROR << "Failed to load resilient store config: " << e.what();
        return result::FromError(MakeErrorCode(RdsErrc::kInvalidArgument, 0));
    }
}

Result<void> CFallbackHandler::validateConfig(const RdsConfig& config) noexcept {
    using result = Result<void>;

    if (config.backupSuffix.empty() || config.tempSuffix.empty()) {
        LAP_RDS_LOG_ERROR << "backupSuffix and tempSuffix must not be empty";
        return result::FromError(MakeErrorCode(RdsErrc::kInvalidArgument, 0));
    }

    if (config.backupSuffix == config.tempSuffix) {
        LAP_RDS_LOG_ERROR << "backupSuffix and tempSuffix must differ: " << config.backupSuffix;
        return result::FromError(MakeErrorCode(RdsErrc::kInvalidArgument, 0));
    }

    if (config.asyncWorkerCount == 0) {
        LAP_RDS_LOG_ERROR << "asyncWorkerCount cannot be zero";
        return result::FromError(MakeErrorCode(RdsErrc::kInvalidArgument, 0));
    }

    if (config.journal.maxRetries == 0) {
        LAP_RDS_LOG_ERROR << "journal.maxRetries cannot be zero";
        return result::FromError(MakeErrorCode(RdsErrc::kInvalidArgument, 0));
    }

    return result::FromValue();
}

} // namespace rds
} // namespace lap
