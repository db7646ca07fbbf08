/**
 * @file CFileLockRegistry.cpp
 * @brief Implementation of the per-path lock registry
 * @version 1.0
 * @date 2025-12-01
 */

#include "CFileLockRegistry.hpp"

namespace lap {
namespace rds {

using namespace core;

SharedHandle<Mutex> CFileLockRegistry::lockFor(const String& canonicalPath) noexcept {
    LockGuard lock(m_registryMutex);

    auto it = m_locks.find(canonicalPath);
    if (it != m_locks.end()) {
        return it->second;
    }

    auto fileLock = std::make_shared<Mutex>();
    m_locks.emplace(canonicalPath, fileLock);
    LAP_RDS_LOG_VERBOSE << "Created file lock for " << canonicalPath;
    return fileLock;
}

Size CFileLockRegistry::size() const noexcept {
    LockGuard lock(m_registryMutex);
    return m_locks.size();
}

} // namespace rds
} // namespace lap
