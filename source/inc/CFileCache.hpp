/**
 * @file CFileCache.hpp
 * @brief Path keyed cache whose entries are bound to the file state they were computed from
 * @version 1.0
 * @date 2025-12-01
 *
 * An entry is returned only while
 * - it is younger than the time-to-live (when one is set), and
 * - the file's inode, size and modification time still match the fingerprint
 *   recorded on insertion.
 * Eviction is oldest-inserted-first once maxEntries is reached
 * (0 means unbounded).
 */
#ifndef LAP_RDS_FILECACHE_HPP
#define LAP_RDS_FILECACHE_HPP

#include <chrono>
#include <deque>

#include <lap/core/CSync.hpp>
#include "CDataType.hpp"

namespace lap {
namespace rds {

template <class T>
class CFileCache {
public:
    using Clock = std::chrono::steady_clock;

    CFileCache(std::chrono::seconds ttl, core::UInt32 maxEntries) noexcept
        : m_ttl(ttl)
        , m_maxEntries(maxEntries)
    {
    }

    CFileCache(const CFileCache&) = delete;
    CFileCache& operator=(const CFileCache&) = delete;

    Optional<T> get(const core::String& key, const FileFingerprint& current) noexcept {
        core::LockGuard lock(m_mutex);

        auto it = m_entries.find(key);
        if (it == m_entries.end()) {
            return Optional<T>();
        }

        const Entry& entry = it->second;
        if (m_ttl.count() > 0 && Clock::now() - entry.storedAt >= m_ttl) {
            return Optional<T>();
        }
        if (entry.fingerprint != current) {
            return Optional<T>();
        }

        return Optional<T>(entry.value);
    }

    void put(const core::String& key, const FileFingerprint& fingerprint, T value) noexcept {
        core::LockGuard lock(m_mutex);

        auto it = m_entries.find(key);
        if (it != m_entries.end()) {
            it->second.value = std::move(value);
            it->second.fingerprint = fingerprint;
            it->second.storedAt = Clock::now();
            return;
        }

        if (m_maxEntries > 0) {
            while (m_entries.size() >= m_maxEntries && !m_order.empty()) {
                m_entries.erase(m_order.front());
                m_order.pop_front();
            }
        }

        m_entries.emplace(key, Entry{std::move(value), fingerprint, Clock::now()});
        m_order.push_back(key);
    }

    void erase(const core::String& key) noexcept {
        core::LockGuard lock(m_mutex);

        if (m_entries.erase(key) > 0) {
            for (auto it = m_order.begin(); it != m_order.end(); ++it) {
                if (*it == key) {
                    m_order.erase(it);
                    break;
                }
            }
        }
    }

    /// Remove every entry whose key starts with prefix
    void erasePrefix(const core::String& prefix) noexcept {
        core::LockGuard lock(m_mutex);

        for (auto it = m_order.begin(); it != m_order.end();) {
            if (it->compare(0, prefix.size(), prefix) == 0) {
                m_entries.erase(*it);
                it = m_order.erase(it);
            } else {
                ++it;
            }
        }
    }

    void clear() noexcept {
        core::LockGuard lock(m_mutex);
        m_entries.clear();
        m_order.clear();
    }

    core::Size size() const noexcept {
        core::LockGuard lock(m_mutex);
        return m_entries.size();
    }

private:
    struct Entry {
        T                   value;
        FileFingerprint     fingerprint;
        Clock::time_point   storedAt;
    };

    std::chrono::seconds                        m_ttl;
    core::UInt32                                m_maxEntries;
    mutable core::Mutex                         m_mutex;
    core::UnorderedMap<core::String, Entry>     m_entries;
    std::deque<core::String>                    m_order;
};

} // namespace rds
} // namespace lap

#endif // LAP_RDS_FILECACHE_HPP
