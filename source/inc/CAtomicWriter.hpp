/**
 * @file CAtomicWriter.hpp
 * @brief Temp-file-then-rename writer for JSON, JSON-Lines and CSV
 * @version 1.0
 * @date 2025-12-01
 *
 * Workflow for every write:
 * 1. Serialize the payload in memory
 * 2. Write it to {path}{tempSuffix} in the same directory
 * 3. fsync the temporary file
 * 4. rename() the temporary file over {path}
 * Any failure before step 4 removes the temporary file and leaves {path}
 * untouched.
 */
#ifndef LAP_RDS_ATOMICWRITER_HPP
#define LAP_RDS_ATOMICWRITER_HPP

#include <functional>

#include <lap/core/CResult.hpp>
#include <lap/core/CString.hpp>
#include "CDataType.hpp"

namespace lap {
namespace rds {

class CAtomicWriter {
public:
    /// Called with the temporary path after it was written and synced,
    /// returning false aborts the write before the rename
    using PreRenameHook = std::function<core::Bool(const core::String&)>;

    explicit CAtomicWriter(
        const core::String& tempSuffix = LAP_RDS_DEFAULT_TEMP_SUFFIX,
        core::Bool fsyncOnWrite = true
    ) noexcept;
    ~CAtomicWriter() = default;

    CAtomicWriter(const CAtomicWriter&) = delete;
    CAtomicWriter& operator=(const CAtomicWriter&) = delete;

    /**
     * @brief Write one JSON value
     * @param indent Pretty print indentation, empty for compact output
     */
    core::Result<void> writeJSONAtomic(
        const Json& value,
        const core::String& path,
        Optional<core::Int32> indent = Optional<core::Int32>()
    ) noexcept;

    /**
     * @brief Write one compact JSON value per '\n' terminated line
     * @param records JSON array; a non-array value is written as a single line
     */
    core::Result<void> writeJSONLinesAtomic(const Json& records, const core::String& path) noexcept;

    /**
     * @brief Write records as CSV
     *
     * The header is the key set of the first object. Each record is passed
     * through CDataSanitizer::sanitizeDictForCSV; keys missing from a later
     * record produce empty cells and keys absent from the header are ignored.
     */
    core::Result<void> writeCSVAtomic(const Json& records, const core::String& path) noexcept;

    /// Write raw bytes with the same protocol
    core::Result<void> writeTextAtomic(const core::String& content, const core::String& path) noexcept;

    core::String tempPathFor(const core::String& path) const noexcept        { return path + m_tempSuffix; }
    core::Bool fsyncOnWrite() const noexcept                                  { return m_fsyncOnWrite; }

    void setPreRenameHook(PreRenameHook hook) noexcept;

private:
    core::Result<void> syncFile(const core::String& path) noexcept;

    core::String                m_tempSuffix;
    core::Bool                  m_fsyncOnWrite;
    PreRenameHook               m_preRenameHook;
};

} // namespace rds
} // namespace lap

#endif // LAP_RDS_ATOMICWRITER_HPP
