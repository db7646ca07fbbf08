/**
 * @file CMessageJournal.hpp
 * @brief Durable per-queue message journal with retry and circuit breaker
 * @version 1.0
 * @date 2025-12-01
 *
 * Every message is stored as its own JSON document
 *   {directory}/{queue}_{epochNs}_{sequence}.json
 * written through CAtomicWriter. restoreMessages() returns the messages of a
 * queue oldest first and deletes the files it read.
 *
 * Failed writes are retried with exponential backoff. After failureThreshold
 * consecutive failures the circuit opens and backups are rejected until
 * circuitTimeoutSeconds have passed.
 */
#ifndef LAP_RDS_MESSAGEJOURNAL_HPP
#define LAP_RDS_MESSAGEJOURNAL_HPP

#include <chrono>

#include <lap/core/CString.hpp>
#include <lap/core/CSync.hpp>
#include "CDataType.hpp"
#include "CAtomicWriter.hpp"

namespace lap {
namespace rds {

class CMessageJournal {
public:
    explicit CMessageJournal(
        const RdsConfig::JournalConfig& config = RdsConfig::JournalConfig(),
        const core::String& tempSuffix = LAP_RDS_DEFAULT_TEMP_SUFFIX,
        core::Bool fsyncOnWrite = true
    ) noexcept;
    ~CMessageJournal() = default;

    CMessageJournal(const CMessageJournal&) = delete;
    CMessageJournal& operator=(const CMessageJournal&) = delete;

    /**
     * @brief Persist one message
     * @return false if the circuit is open, the queue name is invalid or all
     *         attempts failed
     */
    core::Bool backupMessage(const Json& message, const core::String& queueName = "default") noexcept;

    /**
     * @brief Read back and remove every message of a queue
     * @return Messages ordered by write time, oldest first
     */
    core::Vector<Json> restoreMessages(const core::String& queueName = "default") noexcept;

    /**
     * @brief Remove journal files older than maxAgeSeconds
     * @return Number of removed files
     */
    core::UInt32 cleanupOldBackups(core::UInt64 maxAgeSeconds) noexcept;

    core::Bool isCircuitOpen() noexcept;

    /**
     * @brief Counters and state
     *
     * Keys: backup_attempts, backup_successes, backup_failures,
     * restore_attempts, restore_successes, restore_failures,
     * messages_backed_up, messages_restored, failure_count, circuit_open,
     * backup_files
     */
    core::Map<core::String, core::UInt64> getProtectionStats() const noexcept;

    const core::String&     directory() const noexcept      { return m_config.directory; }
    CAtomicWriter&          atomicWriter() noexcept         { return m_writer; }

private:
    using Clock = std::chrono::steady_clock;

    /// Caller holds m_mutex
    core::Bool circuitAllows() noexcept;
    void recordFailure() noexcept;

    /// Journal files of one queue, or of all queues when queueName is empty
    core::Vector<core::String> journalFiles(const core::String& queueName) const noexcept;
    static core::Bool isValidQueueName(const core::String& queueName) noexcept;

    RdsConfig::JournalConfig                m_config;
    CAtomicWriter                           m_writer;
    mutable core::Mutex                     m_mutex;

    core::Bool                              m_circuitOpen{false};
    core::UInt32                            m_failureCount{0};
    Clock::time_point                       m_lastFailure;
    core::UInt64                            m_sequence{0};

    core::Map<core::String, core::UInt64>   m_stats;
};

} // namespace rds
} // namespace lap

#endif // LAP_RDS_MESSAGEJOURNAL_HPP
