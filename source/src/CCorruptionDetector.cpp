/**
 * @file CCorruptionDetector.cpp
 * @brief Implementation of format validation
 * @version 1.0
 * @date 2025-12-01
 */

#include "CCorruptionDetector.hpp"
#include "CCsvCodec.hpp"
#include <lap/core/CFile.hpp>

namespace lap {
namespace rds {

using namespace core;

static inline String CacheKey(FormatKind format, const String& path) noexcept {
    return path + "|" + formatToString(format);
}

CCorruptionDetector::CCorruptionDetector(UInt32 ttlSeconds, UInt32 maxEntries) noexcept
    : m_cache(std::chrono::seconds(ttlSeconds), maxEntries)
{
}

Bool CCorruptionDetector::checkJSON(const String& content) noexcept {
    return Json::accept(content);
}

Bool CCorruptionDetector::checkJSONLines(const String& content) noexcept {
    Size start = 0;
    while (start < content.size()) {
        Size end = content.find('\n', start);
        if (end == String::npos) end = content.size();

        String line = content.substr(start, end - start);
        if (line.find_first_not_of(" \t\r") != String::npos && !Json::accept(line)) {
            return false;
        }

        start = end + 1;
    }
    return true;
}

Bool CCorruptionDetector::checkCSV(const String& content) noexcept {
    if (content.empty()) {
        return false;
    }
    if (content.find('\0') != String::npos) {
        return false;
    }

    auto rows = CCsvCodec::parse(content);
    return rows.HasValue() && !rows.Value().empty();
}

Bool CCorruptionDetector::checkReadable(const String& content) noexcept {
    UNUSED(content);
    return true;
}

Bool CCorruptionDetector::cachedCheck(const String& path, FormatKind format, Validator validator) noexcept {
    String key = CacheKey(format, path);
    FileFingerprint fingerprint = fingerprintOf(path);

    auto cached = m_cache.get(key, fingerprint);
    if (cached.has_value()) {
        return *cached;
    }

    Bool valid = false;
    String content;
    if (!fingerprint.exists) {
        LAP_RDS_LOG_DEBUG << "Validation target does not exist: " << path;
    } else if (fingerprint.size > 0 && !readFileText(path, content)) {
        LAP_RDS_LOG_WARN << "Validation target cannot be read: " << path;
    } else {
        valid = validator(content);
    }

    if (!valid) {
        LAP_RDS_LOG_INFO << "File failed " << formatToString(format) << " validation: " << path;
    }

    // only cache verdicts about files that exist
    if (fingerprint.exists) {
        m_cache.put(key, fingerprint, valid);
    }
    return valid;
}

Bool CCorruptionDetector::isValidJSON(const String& path) noexcept {
    return cachedCheck(path, FormatKind::kJson, &CCorruptionDetector::checkJSON);
}

Bool CCorruptionDetector::isValidJSONLines(const String& path) noexcept {
    return cachedCheck(path, FormatKind::kJsonLines, &CCorruptionDetector::checkJSONLines);
}

Bool CCorruptionDetector::isValidCSV(const String& path) noexcept {
    return cachedCheck(path, FormatKind::kCsv, &CCorruptionDetector::checkCSV);
}

Bool CCorruptionDetector::isReadable(const String& path) noexcept {
    return cachedCheck(path, FormatKind::kUnknown, &CCorruptionDetector::checkReadable);
}

Bool CCorruptionDetector::detectCorruption(const String& path, FormatKind format) noexcept {
    switch (format) {
        case FormatKind::kJson:
        case FormatKind::kJsonArray:
            return !isValidJSON(path);
        case FormatKind::kJsonLines:
            return !isValidJSONLines(path);
        case FormatKind::kCsv:
            return !isValidCSV(path);
        default:
            return !isReadable(path);
    }
}

Bool CCorruptionDetector::detectCorruption(const String& path, StringView format) noexcept {
    return detectCorruption(path, formatFromString(format));
}

void CCorruptionDetector::invalidate(const String& path) noexcept {
    m_cache.erasePrefix(path + "|");
}

void CCorruptionDetector::clearCache() noexcept {
    m_cache.clear();
}

Size CCorruptionDetector::cacheSize() const noexcept {
    return m_cache.size();
}

} // namespace rds
} // namespace lap
