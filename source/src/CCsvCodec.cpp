/**
 * @file CCsvCodec.cpp
 * @brief Implementation of the CSV codec
 * @version 1.0
 * @date 2025-12-01
 */

#include "CCsvCodec.hpp"

namespace lap {
namespace rds {

using namespace core;

String CCsvCodec::encodeField(const String& field) noexcept {
    if (field.find_first_of(",\"\r\n") == String::npos) {
        return field;
    }

    String quoted;
    quoted.reserve(field.size() + 2);
    quoted += '"';
    for (Char ch : field) {
        if (ch == '"') quoted += '"';
        quoted += ch;
    }
    quoted += '"';
    return quoted;
}

String CCsvCodec::encodeRow(const CsvFields& fields) noexcept {
    String line;
    if (fields.size() == 1 && fields[0].empty()) {
        // a bare empty line would be read back as no row at all
        return "\"\"\n";
    }
    for (Size i = 0; i < fields.size(); ++i) {
        if (i > 0) line += ',';
        line += encodeField(fields[i]);
    }
    line += '\n';
    return line;
}

// Returns false when the text ends inside a quoted field. Complete rows
// parsed before that point are left in rows.
Bool CCsvCodec::tokenize(const String& text, Vector<CsvFields>& rows) noexcept {
    CsvFields current;
    String field;
    Bool inQuotes = false;
    Bool rowHasContent = false;

    auto endRow = [&]() {
        if (rowHasContent || !field.empty() || !current.empty()) {
            current.push_back(field);
            rows.push_back(std::move(current));
        }
        current = CsvFields();
        field.clear();
        rowHasContent = false;
    };

    for (Size i = 0; i < text.size(); ++i) {
        Char ch = text[i];

        if (inQuotes) {
            if (ch == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field += ch;
            }
            continue;
        }

        switch (ch) {
            case '"':
                inQuotes = true;
                rowHasContent = true;
                break;
            case ',':
                current.push_back(field);
                field.clear();
                rowHasContent = true;
                break;
            case '\r':
                if (i + 1 < text.size() && text[i + 1] == '\n') {
                    ++i;
                }
                endRow();
                break;
            case '\n':
                endRow();
                break;
            default:
                field += ch;
                rowHasContent = true;
                break;
        }
    }

    if (inQuotes) {
        return false;
    }

    endRow();
    return true;
}

Result<Vector<CsvFields>> CCsvCodec::parse(const String& text) noexcept {
    Vector<CsvFields> rows;
    if (!tokenize(text, rows)) {
        return Result<Vector<CsvFields>>::FromError(
            MakeErrorCode(RdsErrc::kIntegrityCorrupted, 0)
        );
    }
    return Result<Vector<CsvFields>>::FromValue(std::move(rows));
}

Vector<CsvFields> CCsvCodec::parsePermissive(const String& text) noexcept {
    Vector<CsvFields> rows;
    if (!tokenize(text, rows)) {
        LAP_RDS_LOG_DEBUG << "CSV text ends inside a quoted field, dropped trailing row";
    }
    return rows;
}

} // namespace rds
} // namespace lap
