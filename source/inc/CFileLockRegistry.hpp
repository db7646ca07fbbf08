/**
 * @file CFileLockRegistry.hpp
 * @brief One mutex per canonical file path
 * @version 1.0
 * @date 2025-12-01
 *
 * Locks are created on first use and kept for the lifetime of the registry.
 * The registry mutex is held only to look up or insert an entry, never while
 * a per-path lock is held by a caller.
 */
#ifndef LAP_RDS_FILELOCKREGISTRY_HPP
#define LAP_RDS_FILELOCKREGISTRY_HPP

#include <lap/core/CMemory.hpp>
#include <lap/core/CSync.hpp>
#include <lap/core/CString.hpp>
#include "CDataType.hpp"

namespace lap {
namespace rds {

class CFileLockRegistry {
public:
    CFileLockRegistry() noexcept = default;
    ~CFileLockRegistry() = default;

    CFileLockRegistry(const CFileLockRegistry&) = delete;
    CFileLockRegistry& operator=(const CFileLockRegistry&) = delete;

    /**
     * @brief Lock guarding path
     * @param canonicalPath Path already passed through normalizePath()
     */
    core::SharedHandle<core::Mutex> lockFor(const core::String& canonicalPath) noexcept;

    core::Size size() const noexcept;

private:
    mutable core::Mutex                                                 m_registryMutex;
    core::UnorderedMap<core::String, core::SharedHandle<core::Mutex>>   m_locks;
};

} // namespace rds
} // namespace lap

#endif // LAP_RDS_FILELOCKREGISTRY_HPP
