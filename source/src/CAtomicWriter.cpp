/**
 * @file CAtomicWriter.cpp
 * @brief Implementation of atomic file replacement
 * @version 1.0
 * @date 2025-12-01
 */

#include "CAtomicWriter.hpp"
#include "CCsvCodec.hpp"
#include "CDataSanitizer.hpp"
#include <lap/core/CFile.hpp>
#include <lap/core/CPath.hpp>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>

namespace lap {
namespace rds {

using namespace core;

CAtomicWriter::CAtomicWriter(const String& tempSuffix, Bool fsyncOnWrite) noexcept
    : m_tempSuffix(tempSuffix)
    , m_fsyncOnWrite(fsyncOnWrite)
{
    if (m_tempSuffix.empty()) {
        LAP_RDS_LOG_WARN << "Empty temp suffix, using " << LAP_RDS_DEFAULT_TEMP_SUFFIX;
        m_tempSuffix = LAP_RDS_DEFAULT_TEMP_SUFFIX;
    }
}

void CAtomicWriter::setPreRenameHook(PreRenameHook hook) noexcept {
    m_preRenameHook = std::move(hook);
}

Result<void> CAtomicWriter::syncFile(const String& path) noexcept {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        LAP_RDS_LOG_ERROR << "Failed to open for fsync: " << path << " : " << strerror(errno);
        return Result<void>::FromError(MakeErrorCode(RdsErrc::kPhysicalStorageFailure, 0));
    }

    int rc = ::fsync(fd);
    int savedErrno = errno;
    ::close(fd);

    if (rc != 0) {
        LAP_RDS_LOG_ERROR << "fsync failed: " << path << " : " << strerror(savedErrno);
        return Result<void>::FromError(MakeErrorCode(RdsErrc::kPhysicalStorageFailure, 0));
    }
    return Result<void>::FromValue();
}

Result<void> CAtomicWriter::writeTextAtomic(const String& content, const String& path) noexcept {
    using result = Result<void>;

    if (path.empty()) {
        return result::FromError(MakeErrorCode(RdsErrc::kInvalidArgument, 0));
    }

    String tempPath = tempPathFor(path);
    String dirPath = parentDirectory(path);

    if (!Path::isDirectory(dirPath) && !Path::createDirectory(dirPath)) {
        LAP_RDS_LOG_ERROR << "Failed to create directory: " << dirPath;
        return result::FromError(MakeErrorCode(RdsErrc::kPhysicalStorageFailure, 0));
    }

    // Step 1: temp file
    Bool written = content.empty()
        ? File::Util::create(tempPath)
        : File::Util::WriteBinary(tempPath,
                                  reinterpret_cast<const UInt8*>(content.data()),
                                  content.size(),
                                  true);
    if (!written) {
        LAP_RDS_LOG_ERROR << "Failed to write temp file: " << tempPath;
        File::Util::remove(tempPath);
        return result::FromError(MakeErrorCode(RdsErrc::kPhysicalStorageFailure, 0));
    }

    // Step 2: durability
    if (m_fsyncOnWrite) {
        auto syncResult = syncFile(tempPath);
        if (!syncResult.HasValue()) {
            File::Util::remove(tempPath);
            return syncResult;
        }
    }

    if (m_preRenameHook && !m_preRenameHook(tempPath)) {
        LAP_RDS_LOG_WARN << "Write aborted before rename: " << path;
        File::Util::remove(tempPath);
        return result::FromError(MakeErrorCode(RdsErrc::kPhysicalStorageFailure, 0));
    }

    // Step 3: atomic rename (POSIX rename is atomic)
    if (::rename(tempPath.c_str(), path.c_str()) != 0) {
        LAP_RDS_LOG_ERROR << "Atomic rename failed: " << tempPath << " -> " << path << " : " << strerror(errno);
        File::Util::remove(tempPath);
        return result::FromError(MakeErrorCode(RdsErrc::kRenameFailed, 0));
    }

    LAP_RDS_LOG_VERBOSE << "Atomic write complete: " << path << " (" << content.size() << " bytes)";
    return result::FromValue();
}

Result<void> CAtomicWriter::writeJSONAtomic(const Json& value, const String& path, Optional<Int32> indent) noexcept {
    String content;
    try {
        content = value.dump(indent.has_value() ? *indent : -1);
    } catch (const Json::type_error& e) {
        LAP_RDS_LOG_ERROR << "JSON serialization failed for " << path << " : " << e.what();
        return Result<void>::FromError(MakeErrorCode(RdsErrc::kSerializationFailed, 0));
    }

    return writeTextAtomic(content, path);
}

Result<void> CAtomicWriter::writeJSONLinesAtomic(const Json& records, const String& path) noexcept {
    String content;
    try {
        if (records.is_array()) {
            for (const auto& record : records) {
                content += record.dump();
                content += '\n';
            }
        } else if (!records.is_null()) {
            content += records.dump();
            content += '\n';
        }
    } catch (const Json::type_error& e) {
        LAP_RDS_LOG_ERROR << "JSON-Lines serialization failed for " << path << " : " << e.what();
        return Result<void>::FromError(MakeErrorCode(RdsErrc::kSerializationFailed, 0));
    }

    return writeTextAtomic(content, path);
}

Result<void> CAtomicWriter::writeCSVAtomic(const Json& records, const String& path) noexcept {
    if (!records.is_array() && !records.is_null()) {
        LAP_RDS_LOG_ERROR << "CSV records must be an array: " << path;
        return Result<void>::FromError(MakeErrorCode(RdsErrc::kInvalidArgument, 0));
    }

    String content;
    CsvFields header;
    Bool headerWritten = false;

    if (records.is_array()) {
        for (const auto& record : records) {
            if (!record.is_object()) {
                LAP_RDS_LOG_WARN << "Skipping non-object CSV record in " << path;
                continue;
            }

            CsvRow row = CDataSanitizer::sanitizeDictForCSV(record);

            if (!headerWritten) {
                for (const auto& kv : row) {
                    header.push_back(kv.first);
                }
                content += CCsvCodec::encodeRow(header);
                headerWritten = true;
            }

            CsvFields fields;
            fields.reserve(header.size());
            for (const auto& column : header) {
                auto it = row.find(column);
                fields.push_back(it != row.end() ? it->second : String());
            }
            content += CCsvCodec::encodeRow(fields);
        }
    }

    return writeTextAtomic(content, path);
}

} // namespace rds
} // namespace lap
