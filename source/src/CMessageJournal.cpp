/**
 * @file CMessageJournal.cpp
 * @brief Implementation of the message journal
 * @version 1.0
 * @date 2025-12-01
 */

#include "CMessageJournal.hpp"
#include "CDataSanitizer.hpp"
#include <lap/core/CFile.hpp>
#include <lap/core/CPath.hpp>
#include <algorithm>
#include <ctime>
#include <thread>

namespace lap {
namespace rds {

using namespace core;

static inline Bool EndsWith(const String& text, const String& suffix) noexcept {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// {queue}_{epochNs}_{sequence}.json
static Bool IsJournalNameOf(const String& name, const String& queueName) noexcept {
    String prefix = queueName + "_";
    if (name.size() < prefix.size() + 5 || !EndsWith(name, ".json") || name.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }

    String stamp = name.substr(prefix.size(), name.size() - prefix.size() - 5);
    auto separator = stamp.find('_');
    if (separator == String::npos || separator == 0 || separator + 1 == stamp.size()) {
        return false;
    }
    for (Size i = 0; i < stamp.size(); ++i) {
        if (i != separator && (stamp[i] < '0' || stamp[i] > '9')) return false;
    }
    return true;
}

CMessageJournal::CMessageJournal(const RdsConfig::JournalConfig& config, const String& tempSuffix,
                                 Bool fsyncOnWrite) noexcept
    : m_config(config)
    , m_writer(tempSuffix, fsyncOnWrite)
{
    if (m_config.maxRetries == 0) {
        LAP_RDS_LOG_WARN << "Journal maxRetries is 0, setting to 1";
        m_config.maxRetries = 1;
    }

    for (const Char* key : {"backup_attempts", "backup_successes", "backup_failures",
                            "restore_attempts", "restore_successes", "restore_failures",
                            "messages_backed_up", "messages_restored"}) {
        m_stats[key] = 0;
    }

    if (!Path::isDirectory(m_config.directory) && !Path::createDirectory(m_config.directory)) {
        LAP_RDS_LOG_ERROR << "Failed to create journal directory: " << m_config.directory;
    }
}

Bool CMessageJournal::isValidQueueName(const String& queueName) noexcept {
    return !queueName.empty() && queueName.find('/') == String::npos && queueName != "." && queueName != "..";
}

Bool CMessageJournal::circuitAllows() noexcept {
    if (!m_circuitOpen) {
        return true;
    }

    if (Clock::now() - m_lastFailure > std::chrono::seconds(m_config.circuitTimeoutSeconds)) {
        LAP_RDS_LOG_INFO << "Journal circuit closed after timeout";
        m_circuitOpen = false;
        m_failureCount = 0;
        return true;
    }
    return false;
}

void CMessageJournal::recordFailure() noexcept {
    ++m_failureCount;
    if (m_failureCount >= m_config.failureThreshold && !m_circuitOpen) {
        LAP_RDS_LOG_ERROR << "Journal circuit opened after " << m_failureCount << " consecutive failures";
        m_circuitOpen = true;
        m_lastFailure = Clock::now();
    }
}

Bool CMessageJournal::isCircuitOpen() noexcept {
    LockGuard lock(m_mutex);
    return !circuitAllows();
}

Bool CMessageJournal::backupMessage(const Json& message, const String& queueName) noexcept {
    LockGuard lock(m_mutex);
    ++m_stats["backup_attempts"];

    if (!isValidQueueName(queueName)) {
        LAP_RDS_LOG_ERROR << "Invalid journal queue name: " << queueName;
        ++m_stats["backup_failures"];
        return false;
    }

    if (!circuitAllows()) {
        LAP_RDS_LOG_WARN << "Journal circuit open, rejecting backup for queue " << queueName;
        ++m_stats["backup_failures"];
        return false;
    }

    auto now = std::chrono::system_clock::now().time_since_epoch();
    Json document;
    document["type"] = "generic";
    document["message"] = CDataSanitizer::sanitizeValue(message);
    document["timestamp"] = std::chrono::duration<Double>(now).count();

    Int64 epochNs = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();

    for (UInt32 attempt = 0; attempt < m_config.maxRetries; ++attempt) {
        String journalName = queueName + "_" + std::to_string(epochNs) + "_" + std::to_string(m_sequence++) + ".json";
        String filePath = Path::appendString(m_config.directory, journalName);

        auto writeResult = m_writer.writeJSONAtomic(document, filePath);
        if (writeResult.HasValue()) {
            ++m_stats["backup_successes"];
            ++m_stats["messages_backed_up"];
            m_failureCount = 0;
            return true;
        }

        LAP_RDS_LOG_WARN << "Journal write attempt " << (attempt + 1) << "/" << m_config.maxRetries
                         << " failed for queue " << queueName << " : " << writeResult.Error().Message();
        recordFailure();

        // a document that cannot be serialized fails the same way on every attempt
        if (m_circuitOpen || writeResult.Error().Value() == static_cast<Int32>(RdsErrc::kSerializationFailed)) {
            break;
        }
        if (attempt + 1 < m_config.maxRetries) {
            std::this_thread::sleep_for(std::chrono::milliseconds(LAP_RDS_JOURNAL_RETRY_BASE_MS << attempt));
        }
    }

    ++m_stats["backup_failures"];
    return false;
}

Vector<String> CMessageJournal::journalFiles(const String& queueName) const noexcept {
    Vector<String> files;
    if (!Path::isDirectory(m_config.directory)) {
        return files;
    }

    for (const auto& entry : Path::listFiles(m_config.directory)) {
        String name = Path::basename(String(entry));
        Bool matches = queueName.empty() ? EndsWith(name, ".json") : IsJournalNameOf(name, queueName);
        if (matches) {
            files.push_back(Path::appendString(m_config.directory, name));
        }
    }
    return files;
}

Vector<Json> CMessageJournal::restoreMessages(const String& queueName) noexcept {
    LockGuard lock(m_mutex);
    ++m_stats["restore_attempts"];

    Vector<Json> messages;
    if (!isValidQueueName(queueName)) {
        LAP_RDS_LOG_ERROR << "Invalid journal queue name: " << queueName;
        ++m_stats["restore_failures"];
        return messages;
    }

    struct Entry {
        String path;
        Int64 mtimeNs;
    };
    Vector<Entry> entries;
    for (const auto& path : journalFiles(queueName)) {
        entries.push_back(Entry{path, fingerprintOf(path).mtimeNs});
    }

    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
        return a.mtimeNs != b.mtimeNs ? a.mtimeNs < b.mtimeNs : a.path < b.path;
    });

    for (const auto& entry : entries) {
        String content;
        if (!readFileText(entry.path, content)) {
            LAP_RDS_LOG_WARN << "Failed to read journal file: " << entry.path;
            continue;
        }

        try {
            Json document = Json::parse(content);
            if (document.is_object() && document.contains("message")) {
                messages.push_back(document["message"]);
            } else {
                messages.push_back(document);
            }
        } catch (const Json::parse_error& e) {
            LAP_RDS_LOG_WARN << "Skipping unreadable journal file " << entry.path << " : " << e.what();
            continue;
        }

        if (!File::Util::remove(entry.path)) {
            LAP_RDS_LOG_WARN << "Failed to remove restored journal file: " << entry.path;
        }
    }

    ++m_stats["restore_successes"];
    m_stats["messages_restored"] += messages.size();
    LAP_RDS_LOG_INFO << "Restored " << messages.size() << " messages from queue " << queueName;
    return messages;
}

UInt32 CMessageJournal::cleanupOldBackups(UInt64 maxAgeSeconds) noexcept {
    LockGuard lock(m_mutex);

    Int64 nowNs = static_cast<Int64>(std::time(nullptr)) * 1000000000LL;
    Int64 maxAgeNs = static_cast<Int64>(maxAgeSeconds) * 1000000000LL;
    UInt32 removed = 0;

    for (const auto& path : journalFiles("")) {
        FileFingerprint fp = fingerprintOf(path);
        if (!fp.exists || nowNs - fp.mtimeNs <= maxAgeNs) continue;

        if (File::Util::remove(path)) {
            ++removed;
        } else {
            LAP_RDS_LOG_WARN << "Failed to remove old journal file: " << path;
        }
    }

    return removed;
}

Map<String, UInt64> CMessageJournal::getProtectionStats() const noexcept {
    LockGuard lock(m_mutex);

    Map<String, UInt64> stats = m_stats;
    stats["failure_count"] = m_failureCount;
    stats["circuit_open"] = m_circuitOpen ? 1 : 0;
    stats["backup_files"] = journalFiles("").size();
    return stats;
}

} // namespace rds
} // namespace lap
