/**
 * @file CCsvCodec.hpp
 * @brief Comma separated values encoding and tokenizing
 * @version 1.0
 * @date 2025-12-01
 *
 * Fields containing a comma, double quote, CR or LF are quoted and embedded
 * quotes are doubled. Rows are terminated by '\n'; '\r\n' is accepted on input.
 */
#ifndef LAP_RDS_CSVCODEC_HPP
#define LAP_RDS_CSVCODEC_HPP

#include <lap/core/CResult.hpp>
#include <lap/core/CString.hpp>
#include "CDataType.hpp"

namespace lap {
namespace rds {

using CsvFields = core::Vector<core::String>;

class CCsvCodec {
public:
    static core::String encodeField(const core::String& field) noexcept;
    static core::String encodeRow(const CsvFields& fields) noexcept;

    /**
     * @brief Tokenize a whole document
     * @return Rows in file order, blank lines skipped;
     *         kIntegrityCorrupted on an unterminated quoted field
     */
    static core::Result<core::Vector<CsvFields>> parse(const core::String& text) noexcept;

    /**
     * @brief Tokenize as much of a document as possible
     *
     * A trailing row left open by an unterminated quote is dropped instead of
     * failing the whole document.
     */
    static core::Vector<CsvFields> parsePermissive(const core::String& text) noexcept;

private:
    static core::Bool tokenize(const core::String& text, core::Vector<CsvFields>& rows) noexcept;
};

} // namespace rds
} // namespace lap

#endif // LAP_RDS_CSVCODEC_HPP
