/**
 * @file CDataType.hpp
 * @author ddkv587 (ddkv587@gmail.com)
 * @brief Common types, logging macros and defaults of the resilient data store
 * @version 0.1
 * @date 2025-12-01
 *
 *
 */
#ifndef LAP_RDS_DATATYPE_HPP
#define LAP_RDS_DATATYPE_HPP

#include <optional>

// core
#include <lap/core/CCore.hpp>
#include <lap/core/CTypedef.hpp>
#include <lap/core/CString.hpp>
#include <lap/log/CLog.hpp>

#include <nlohmann/json.hpp>

// rds common
#include "CRdsErrorDomain.hpp"

namespace lap
{
namespace rds
{
    // ========================================================================
    // Logging Configuration
    // ========================================================================
    #define LAP_RDS_LOG_CONTEXT_ID       "RDS"
    #define LAP_RDS_LOG_CONTEXT_DESC     "RDS log ctx"

    #define LAP_DEBUG

#ifdef LAP_DEBUG
    #define LAP_RDS_LOG                  LAP_LOG( LAP_RDS_LOG_CONTEXT_ID, LAP_RDS_LOG_CONTEXT_DESC, ::lap::log::LogLevel::kVerbose )
    #define LAP_RDS_LOG_VERBOSE          LAP_RDS_LOG.LogVerbose().WithLocation( __FILE__, __LINE__ )
    #define LAP_RDS_LOG_DEBUG            LAP_RDS_LOG.LogDebug().WithLocation( __FILE__, __LINE__ )
    #define LAP_RDS_LOG_INFO             LAP_RDS_LOG.LogInfo().WithLocation( __FILE__, __LINE__ )
#else
    #define LAP_RDS_LOG                  LAP_LOG( LAP_RDS_LOG_CONTEXT_ID, LAP_RDS_LOG_CONTEXT_DESC, ::lap::log::LogLevel::kWarn )
    #define LAP_RDS_LOG_VERBOSE          LAP_RDS_LOG.LogOff()
    #define LAP_RDS_LOG_DEBUG            LAP_RDS_LOG.LogOff()
    #define LAP_RDS_LOG_INFO             LAP_RDS_LOG.LogOff()
#endif
    #define LAP_RDS_LOG_WARN             LAP_RDS_LOG.LogWarn().WithLocation( __FILE__, __LINE__ )
    #define LAP_RDS_LOG_ERROR            LAP_RDS_LOG.LogError().WithLocation( __FILE__, __LINE__ )
    #define LAP_RDS_LOG_FATAL            LAP_RDS_LOG.LogFatal().WithLocation( __FILE__, __LINE__ )

    // ========================================================================
    // Default Configuration
    // ========================================================================
    #define LAP_RDS_CONFIG_MODULE                       "resilientStore"

    // File naming
    #define LAP_RDS_DEFAULT_BACKUP_SUFFIX               ".backup"
    #define LAP_RDS_DEFAULT_TEMP_SUFFIX                 ".tmp"
    #define LAP_RDS_BACKUP_TIMESTAMP_FORMAT             "%Y%m%d_%H%M%S"

    // Serialization
    #define LAP_RDS_DEFAULT_JSON_INDENT                 -1      // compact

    // Caches
    #define LAP_RDS_DEFAULT_CORRUPTION_CACHE_TTL_SEC    60U
    #define LAP_RDS_DEFAULT_CORRUPTION_CACHE_ENTRIES    1000U
    #define LAP_RDS_DEFAULT_SANITIZER_CACHE_ENTRIES     1000U

    // Async
    #define LAP_RDS_DEFAULT_ASYNC_WORKERS               4U

    // Message journal
    #define LAP_RDS_DEFAULT_JOURNAL_DIR                 ".rds_journal"
    #define LAP_RDS_DEFAULT_JOURNAL_MAX_RETRIES         3U
    #define LAP_RDS_DEFAULT_JOURNAL_FAILURE_THRESHOLD   5U
    #define LAP_RDS_DEFAULT_JOURNAL_CIRCUIT_TIMEOUT_SEC 30U
    #define LAP_RDS_JOURNAL_RETRY_BASE_MS               10U

    // Statistic keys
    #define LAP_RDS_STAT_SANITIZER_CACHE                "sanitizer_cache_size"
    #define LAP_RDS_STAT_CORRUPTION_CACHE               "corruption_cache_size"
    #define LAP_RDS_STAT_RECOVERY_CACHE                 "recovery_cache_size"
    #define LAP_RDS_STAT_FILE_LOCKS                     "file_locks_count"

    template< class T >
    using Optional = ::std::optional< T >;

    using Json      = ::nlohmann::json;
    using CsvRow    = core::Map< core::String, core::String >;
    using CsvRows   = core::Vector< CsvRow >;

    /**
     * @brief Declared on-disk format of a file target
     */
    enum class FormatKind : core::UInt8
    {
        kJson       = 0,
        kJsonArray  = 1,
        kJsonLines  = 2,
        kCsv        = 3,
        kUnknown    = 0xFF
    };

    inline FormatKind formatFromString( core::StringView strFormat ) noexcept
    {
        if ( strFormat == "json" )          return FormatKind::kJson;
        if ( strFormat == "json_array" )    return FormatKind::kJsonArray;
        if ( strFormat == "json_lines" )    return FormatKind::kJsonLines;
        if ( strFormat == "csv" )           return FormatKind::kCsv;

        return FormatKind::kUnknown;
    }

    inline const core::Char* formatToString( FormatKind kind ) noexcept
    {
        switch ( kind ) {
        case FormatKind::kJson:         return "json";
        case FormatKind::kJsonArray:    return "json_array";
        case FormatKind::kJsonLines:    return "json_lines";
        case FormatKind::kCsv:          return "csv";
        default:                        return "unknown";
        }
    }

    // ========================================================================
    // Resilient Store Configuration Structure
    // ========================================================================

    /**
     * @brief Resilient store configuration
     * Loaded from Core::ConfigManager "resilientStore" module
     */
    struct RdsConfig {
        core::String backupDir{""};                         // empty: backups beside the file
        core::String backupSuffix{LAP_RDS_DEFAULT_BACKUP_SUFFIX};
        core::String tempSuffix{LAP_RDS_DEFAULT_TEMP_SUFFIX};
        core::Int32 jsonIndent{LAP_RDS_DEFAULT_JSON_INDENT};
        core::UInt32 corruptionCacheTtlSeconds{LAP_RDS_DEFAULT_CORRUPTION_CACHE_TTL_SEC};
        core::UInt32 corruptionCacheMaxEntries{LAP_RDS_DEFAULT_CORRUPTION_CACHE_ENTRIES};
        core::UInt32 sanitizerCacheMaxEntries{LAP_RDS_DEFAULT_SANITIZER_CACHE_ENTRIES};
        core::UInt32 asyncWorkerCount{LAP_RDS_DEFAULT_ASYNC_WORKERS};
        core::Bool fsyncOnWrite{true};

        struct JournalConfig {
            core::String directory{LAP_RDS_DEFAULT_JOURNAL_DIR};
            core::UInt32 maxRetries{LAP_RDS_DEFAULT_JOURNAL_MAX_RETRIES};
            core::UInt32 failureThreshold{LAP_RDS_DEFAULT_JOURNAL_FAILURE_THRESHOLD};
            core::UInt32 circuitTimeoutSeconds{LAP_RDS_DEFAULT_JOURNAL_CIRCUIT_TIMEOUT_SEC};
        } journal;
    };

    /**
     * @brief Inode, size and modification time of a file, used to decide
     *        whether a cached verdict about the file still applies
     */
    struct FileFingerprint {
        core::Bool   exists{false};
        core::UInt64 inode{0};
        core::UInt64 size{0};
        core::Int64  mtimeNs{0};

        core::Bool operator==( const FileFingerprint& other ) const noexcept
        {
            return exists == other.exists && inode == other.inode && size == other.size && mtimeNs == other.mtimeNs;
        }

        core::Bool operator!=( const FileFingerprint& other ) const noexcept   { return !( *this == other ); }
    };

    FileFingerprint fingerprintOf( core::StringView strPath ) noexcept;
    core::String normalizePath( core::StringView strPath ) noexcept;
    core::String parentDirectory( core::StringView strPath ) noexcept;
    core::Bool readFileText( core::StringView strPath, core::String& strContent ) noexcept;

} // rds
} // lap

#endif
