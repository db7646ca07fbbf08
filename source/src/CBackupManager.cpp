/**
 * @file CBackupManager.cpp
 * @brief Implementation of backup creation, lookup and restore
 * @version 1.0
 * @date 2025-12-01
 */

#include "CBackupManager.hpp"
#include <lap/core/CCrypto.hpp>
#include <lap/core/CFile.hpp>
#include <lap/core/CPath.hpp>
#include <cctype>
#include <ctime>

namespace lap {
namespace rds {

using namespace core;

static String CurrentTimestamp() noexcept {
    std::time_t now = std::time(nullptr);
    struct tm localTime;
    localtime_r(&now, &localTime);

    Char buffer[32] = {0};
    std::strftime(buffer, sizeof(buffer), LAP_RDS_BACKUP_TIMESTAMP_FORMAT, &localTime);
    return String(buffer);
}

static inline Bool AllDigits(const String& text, Size pos, Size count) noexcept {
    if (pos + count > text.size()) return false;
    for (Size i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
    }
    return true;
}

// Short hex digest of the canonical path, keeps same-named files of different directories apart
static String PathDigest(const String& canonicalPath) noexcept {
    UInt32 crc32 = Crypto::Util::computeCrc32(reinterpret_cast<const UInt8*>(canonicalPath.data()), canonicalPath.size());
    UInt8 bytes[4] = {
        static_cast<UInt8>((crc32 >> 24) & 0xFF),
        static_cast<UInt8>((crc32 >> 16) & 0xFF),
        static_cast<UInt8>((crc32 >> 8) & 0xFF),
        static_cast<UInt8>(crc32 & 0xFF)
    };
    return Crypto::Util::bytesToHex(bytes, 4);
}

CBackupManager::CBackupManager(const String& backupDir, const String& backupSuffix,
                               const String& tempSuffix, Bool fsyncOnWrite) noexcept
    : m_backupDir(backupDir.empty() ? backupDir : normalizePath(backupDir))
    , m_backupSuffix(backupSuffix)
    , m_writer(tempSuffix, fsyncOnWrite)
{
    if (m_backupSuffix.empty()) {
        LAP_RDS_LOG_WARN << "Empty backup suffix, using " << LAP_RDS_DEFAULT_BACKUP_SUFFIX;
        m_backupSuffix = LAP_RDS_DEFAULT_BACKUP_SUFFIX;
    }
}

String CBackupManager::backupStem(const String& path) const noexcept {
    String canonicalPath = normalizePath(path);
    return Path::basename(canonicalPath) + "_" + PathDigest(canonicalPath);
}

String CBackupManager::makeBackupPath(const String& path) const noexcept {
    if (m_backupDir.empty()) {
        return path + m_backupSuffix;
    }

    String base = Path::appendString(m_backupDir, backupStem(path) + "_" + CurrentTimestamp());
    String candidate = base + m_backupSuffix;

    // several backups within the same second
    for (UInt32 index = 1; File::Util::exists(candidate); ++index) {
        candidate = base + "_" + std::to_string(index) + m_backupSuffix;
    }
    return candidate;
}

// {stem}_YYYYmmdd_HHMMSS[_N]{suffix}
Bool CBackupManager::isBackupNameOf(const String& candidate, const String& stem) const noexcept {
    String prefix = stem + "_";
    if (candidate.size() < prefix.size() + 15 + m_backupSuffix.size()) return false;
    if (candidate.compare(0, prefix.size(), prefix) != 0) return false;
    if (candidate.compare(candidate.size() - m_backupSuffix.size(), m_backupSuffix.size(), m_backupSuffix) != 0) return false;

    Size pos = prefix.size();
    if (!AllDigits(candidate, pos, 8) || candidate[pos + 8] != '_' || !AllDigits(candidate, pos + 9, 6)) {
        return false;
    }

    Size end = candidate.size() - m_backupSuffix.size();
    pos += 15;
    if (pos == end) return true;

    return candidate[pos] == '_' && pos + 1 < end && AllDigits(candidate, pos + 1, end - pos - 1);
}

Optional<String> CBackupManager::createBackup(const String& path) noexcept {
    if (!File::Util::exists(path)) {
        return Optional<String>();
    }

    if (!m_backupDir.empty() && !Path::isDirectory(m_backupDir) && !Path::createDirectory(m_backupDir)) {
        LAP_RDS_LOG_ERROR << "Failed to create backup directory: " << m_backupDir;
        return Optional<String>();
    }

    String content;
    if (!readFileText(path, content) && File::Util::size(path) != 0) {
        LAP_RDS_LOG_ERROR << "Failed to read file for backup: " << path;
        return Optional<String>();
    }

    // name selection and write are one step, writers of other paths share the backup directory
    LockGuard lock(m_nameMutex);
    String backupPath = makeBackupPath(path);
    auto writeResult = m_writer.writeTextAtomic(content, backupPath);
    if (!writeResult.HasValue()) {
        LAP_RDS_LOG_ERROR << "Failed to write backup " << backupPath << " : " << writeResult.Error().Message();
        return Optional<String>();
    }

    LAP_RDS_LOG_INFO << "Backup created: " << backupPath;
    return Optional<String>(backupPath);
}

Bool CBackupManager::restoreFromBackup(const String& path, const String& backupPath) noexcept {
    String content;
    if (!File::Util::exists(backupPath)) {
        LAP_RDS_LOG_ERROR << "Backup not found: " << backupPath;
        return false;
    }
    if (!readFileText(backupPath, content) && File::Util::size(backupPath) != 0) {
        LAP_RDS_LOG_ERROR << "Failed to read backup: " << backupPath;
        return false;
    }

    auto writeResult = m_writer.writeTextAtomic(content, path);
    if (!writeResult.HasValue()) {
        LAP_RDS_LOG_ERROR << "Failed to restore " << path << " from " << backupPath
                          << " : " << writeResult.Error().Message();
        return false;
    }

    LAP_RDS_LOG_WARN << "Restored " << path << " from backup " << backupPath;
    return true;
}

Vector<String> CBackupManager::listBackups(const String& path) const noexcept {
    Vector<String> backups;

    String besidePath = path + m_backupSuffix;
    if (File::Util::exists(besidePath)) {
        backups.push_back(besidePath);
    }

    if (!m_backupDir.empty() && Path::isDirectory(m_backupDir)) {
        String stem = backupStem(path);
        for (const auto& entry : Path::listFiles(m_backupDir)) {
            String name = Path::basename(String(entry));
            if (isBackupNameOf(name, stem)) {
                backups.push_back(Path::appendString(m_backupDir, name));
            }
        }
    }

    return backups;
}

Optional<String> CBackupManager::findLatestBackup(const String& path) const noexcept {
    Optional<String> latest;
    Int64 latestMtime = 0;

    for (const auto& candidate : listBackups(path)) {
        FileFingerprint fp = fingerprintOf(candidate);
        if (!fp.exists) continue;

        // ties go to the lexically greater name, which carries the later timestamp/index
        if (!latest.has_value() || fp.mtimeNs > latestMtime ||
            (fp.mtimeNs == latestMtime && candidate > *latest)) {
            latest = candidate;
            latestMtime = fp.mtimeNs;
        }
    }

    return latest;
}

UInt32 CBackupManager::cleanupOldBackups(UInt64 maxAgeSeconds) noexcept {
    if (m_backupDir.empty() || !Path::isDirectory(m_backupDir)) {
        LAP_RDS_LOG_DEBUG << "No backup directory to clean up";
        return 0;
    }

    Int64 nowNs = static_cast<Int64>(std::time(nullptr)) * 1000000000LL;
    Int64 maxAgeNs = static_cast<Int64>(maxAgeSeconds) * 1000000000LL;
    UInt32 removed = 0;

    for (const auto& entry : Path::listFiles(m_backupDir)) {
        String name = Path::basename(String(entry));
        if (name.size() <= m_backupSuffix.size() ||
            name.compare(name.size() - m_backupSuffix.size(), m_backupSuffix.size(), m_backupSuffix) != 0) {
            continue;
        }

        String fullPath = Path::appendString(m_backupDir, name);
        FileFingerprint fp = fingerprintOf(fullPath);
        if (!fp.exists || nowNs - fp.mtimeNs <= maxAgeNs) continue;

        if (File::Util::remove(fullPath)) {
            ++removed;
        } else {
            LAP_RDS_LOG_WARN << "Failed to remove old backup: " << fullPath;
        }
    }

    LAP_RDS_LOG_INFO << "Removed " << removed << " backups older than " << maxAgeSeconds << "s";
    return removed;
}

} // namespace rds
} // namespace lap
