/**
 * @file CDataRecovery.cpp
 * @brief Implementation of JSON and CSV recovery
 * @version 1.0
 * @date 2025-12-01
 */

#include "CDataRecovery.hpp"
#include "CCsvCodec.hpp"

namespace lap {
namespace rds {

using namespace core;

CDataRecovery::CDataRecovery() noexcept
    : m_jsonCache(std::chrono::seconds(0), 0)
    , m_csvCache(std::chrono::seconds(0), 0)
{
}

Json CDataRecovery::recoverLines(const String& text) noexcept {
    Json records = Json::array();

    Size start = 0;
    while (start < text.size()) {
        Size end = text.find('\n', start);
        if (end == String::npos) end = text.size();

        String line = text.substr(start, end - start);
        start = end + 1;

        if (line.find_first_not_of(" \t\r") == String::npos) continue;

        try {
            records.push_back(Json::parse(line));
        } catch (const Json::parse_error& e) {
            LAP_RDS_LOG_VERBOSE << "Skipping unparsable line: " << e.what();
        }
    }

    return records;
}

Json CDataRecovery::recoverObjects(const String& text) noexcept {
    Json records = Json::array();

    UInt32 depth = 0;
    Size objectStart = 0;
    Bool inString = false;
    Bool escaped = false;

    for (Size i = 0; i < text.size(); ++i) {
        Char ch = text[i];

        // string state only matters inside an object
        if (inString) {
            if (escaped) {
                escaped = false;
            } else if (ch == '\\') {
                escaped = true;
            } else if (ch == '"') {
                inString = false;
            }
            continue;
        }

        if (ch == '"' && depth > 0) {
            inString = true;
        } else if (ch == '{') {
            if (depth == 0) objectStart = i;
            ++depth;
        } else if (ch == '}' && depth > 0) {
            --depth;
            if (depth == 0) {
                try {
                    records.push_back(Json::parse(text.substr(objectStart, i - objectStart + 1)));
                } catch (const Json::parse_error& e) {
                    LAP_RDS_LOG_VERBOSE << "Skipping unparsable object at offset " << objectStart << ": " << e.what();
                }
            }
        }
    }

    return records;
}

Optional<Json> CDataRecovery::recoverJSONFile(const String& path) noexcept {
    FileFingerprint fingerprint = fingerprintOf(path);
    if (!fingerprint.exists) {
        return Optional<Json>();
    }

    auto cached = m_jsonCache.get(path, fingerprint);
    if (cached.has_value()) {
        LAP_RDS_LOG_DEBUG << "Using cached recovery for " << path;
        return cached;
    }

    String content;
    if (!readFileText(path, content)) {
        LAP_RDS_LOG_ERROR << "Recovery cannot read file: " << path;
        return Optional<Json>();
    }

    // an intact document is returned as is, a single value as a one element list
    Json records = Json::parse(content, nullptr, false);
    if (records.is_discarded()) {
        records = recoverLines(content);
        if (records.empty()) {
            records = recoverObjects(content);
        }
    } else if (!records.is_array()) {
        records = Json::array({records});
    }

    if (records.empty()) {
        LAP_RDS_LOG_WARN << "No JSON records recovered from " << path;
        return Optional<Json>();
    }

    LAP_RDS_LOG_WARN << "Recovered " << records.size() << " JSON records from " << path;
    m_jsonCache.put(path, fingerprint, records);
    return Optional<Json>(std::move(records));
}

Optional<CsvRows> CDataRecovery::recoverCSVFile(const String& path) noexcept {
    FileFingerprint fingerprint = fingerprintOf(path);
    if (!fingerprint.exists) {
        return Optional<CsvRows>();
    }

    auto cached = m_csvCache.get(path, fingerprint);
    if (cached.has_value()) {
        LAP_RDS_LOG_DEBUG << "Using cached recovery for " << path;
        return cached;
    }

    String content;
    if (!readFileText(path, content)) {
        LAP_RDS_LOG_ERROR << "Recovery cannot read file: " << path;
        return Optional<CsvRows>();
    }

    if (content.find('\0') != String::npos) {
        LAP_RDS_LOG_WARN << "CSV file contains NUL bytes, not recoverable: " << path;
        return Optional<CsvRows>();
    }

    Vector<CsvFields> table = CCsvCodec::parsePermissive(content);
    if (table.size() < 2) {
        LAP_RDS_LOG_WARN << "No CSV rows recovered from " << path;
        return Optional<CsvRows>();
    }

    const CsvFields& header = table.front();
    CsvRows rows;
    Size dropped = 0;

    for (Size r = 1; r < table.size(); ++r) {
        if (table[r].size() != header.size()) {
            ++dropped;
            continue;
        }

        CsvRow row;
        for (Size c = 0; c < header.size(); ++c) {
            row[header[c]] = table[r][c];
        }
        rows.push_back(std::move(row));
    }

    if (rows.empty()) {
        LAP_RDS_LOG_WARN << "No CSV rows recovered from " << path;
        return Optional<CsvRows>();
    }

    LAP_RDS_LOG_WARN << "Recovered " << rows.size() << " CSV rows from " << path
                     << ", dropped " << dropped;
    m_csvCache.put(path, fingerprint, rows);
    return Optional<CsvRows>(std::move(rows));
}

void CDataRecovery::invalidate(const String& path) noexcept {
    m_jsonCache.erase(path);
    m_csvCache.erase(path);
}

void CDataRecovery::clearCache() noexcept {
    m_jsonCache.clear();
    m_csvCache.clear();
}

Size CDataRecovery::cacheSize() const noexcept {
    return m_jsonCache.size() + m_csvCache.size();
}

} // namespace rds
} // namespace lap
