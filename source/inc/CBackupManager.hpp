/**
 * @file CBackupManager.hpp
 * @brief Backup copies of files about to be overwritten
 * @version 1.0
 * @date 2025-12-01
 *
 * Backup naming:
 * - no backup directory:   {path}{suffix}                       (one per file, replaced each time)
 * - with backup directory: {backupDir}/{name}_{digest}_YYYYmmdd_HHMMSS[_N]{suffix}
 *   where {name} is the file name of the target and {digest} the CRC32 (hex)
 *   of its normalized path
 *
 * When several backups exist the newest modification time wins.
 */
#ifndef LAP_RDS_BACKUPMANAGER_HPP
#define LAP_RDS_BACKUPMANAGER_HPP

#include <lap/core/CResult.hpp>
#include <lap/core/CString.hpp>
#include <lap/core/CSync.hpp>
#include "CDataType.hpp"
#include "CAtomicWriter.hpp"

namespace lap {
namespace rds {

class CBackupManager {
public:
    explicit CBackupManager(
        const core::String& backupDir = "",
        const core::String& backupSuffix = LAP_RDS_DEFAULT_BACKUP_SUFFIX,
        const core::String& tempSuffix = LAP_RDS_DEFAULT_TEMP_SUFFIX,
        core::Bool fsyncOnWrite = true
    ) noexcept;
    ~CBackupManager() = default;

    CBackupManager(const CBackupManager&) = delete;
    CBackupManager& operator=(const CBackupManager&) = delete;

    /**
     * @brief Copy the current contents of path to a new backup
     * @return Backup path, empty if path does not exist or the copy failed
     */
    Optional<core::String> createBackup(const core::String& path) noexcept;

    /**
     * @brief Copy backupPath over path (atomically)
     * @return true on success
     */
    core::Bool restoreFromBackup(const core::String& path, const core::String& backupPath) noexcept;

    /// Newest backup of path by modification time
    Optional<core::String> findLatestBackup(const core::String& path) const noexcept;

    /// All backups of path, in no particular order
    core::Vector<core::String> listBackups(const core::String& path) const noexcept;

    /**
     * @brief Remove backups in the backup directory older than maxAgeSeconds
     * @return Number of removed files
     */
    core::UInt32 cleanupOldBackups(core::UInt64 maxAgeSeconds) noexcept;

    const core::String& backupDir() const noexcept      { return m_backupDir; }
    const core::String& backupSuffix() const noexcept   { return m_backupSuffix; }
    CAtomicWriter& atomicWriter() noexcept              { return m_writer; }

private:
    core::String backupStem(const core::String& path) const noexcept;
    core::String makeBackupPath(const core::String& path) const noexcept;
    core::Bool isBackupNameOf(const core::String& candidate, const core::String& stem) const noexcept;

    core::String                m_backupDir;
    core::String                m_backupSuffix;
    CAtomicWriter               m_writer;
    core::Mutex                 m_nameMutex;
};

} // namespace rds
} // namespace lap

#endif // LAP_RDS_BACKUPMANAGER_HPP
