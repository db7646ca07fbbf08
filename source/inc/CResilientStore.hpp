/**
 * @file CResilientStore.hpp
 * @author ddkv587 (ddkv587@gmail.com)
 * @brief Umbrella header of the resilient data store
 * @version 0.1
 * @date 2025-12-01
 * 
 * 
 */
#ifndef LAP_RDS_RESILIENTSTORE_HPP
#define LAP_RDS_RESILIENTSTORE_HPP

#include <lap/core/CCore.hpp>
#include <lap/log/CLog.hpp>

// rds common
#include "CDataType.hpp"
#include "CRdsErrorDomain.hpp"

// building blocks
#include "CDataSanitizer.hpp"
#include "CCsvCodec.hpp"
#include "CCorruptionDetector.hpp"
#include "CAtomicWriter.hpp"
#include "CBackupManager.hpp"
#include "CDataRecovery.hpp"
#include "CFileLockRegistry.hpp"

// entry points
#include "CFallbackHandler.hpp"
#include "CAsyncFallbackHandler.hpp"
#include "CMessageJournal.hpp"

#endif
