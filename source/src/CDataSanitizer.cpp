/**
 * @file CDataSanitizer.cpp
 * @brief Implementation of value sanitization
 * @version 1.0
 * @date 2025-12-01
 */

#include "CDataSanitizer.hpp"
#include <lap/core/CCrypto.hpp>
#include <cmath>

namespace lap {
namespace rds {

using namespace core;

static String NonFiniteToString(Double value) noexcept {
    if (std::isnan(value)) return "nan";
    return value > 0 ? "inf" : "-inf";
}

// Invalid UTF-8 sequences become U+FFFD, valid text is returned unchanged
static String ToValidUtf8(const String& text) noexcept {
    Json encoded(text);
    try {
        (void)encoded.dump();
        return text;
    } catch (const Json::type_error&) {
        Json repaired = Json::parse(encoded.dump(-1, ' ', false, Json::error_handler_t::replace), nullptr, false);
        return repaired.is_string() ? repaired.get<std::string>() : String();
    }
}

static String ContentKey(const Json& value) noexcept {
    try {
        std::string text = value.dump(-1, ' ', false, Json::error_handler_t::replace);
        return Crypto::Util::computeSha256(reinterpret_cast<const UInt8*>(text.data()), text.size());
    } catch (const std::exception& e) {
        LAP_RDS_LOG_WARN << "Sanitizer could not compute cache key: " << e.what();
        return String();
    }
}

CDataSanitizer::CDataSanitizer(UInt32 maxCacheEntries) noexcept
    : m_maxCacheEntries(maxCacheEntries)
{
    if (m_maxCacheEntries == 0) {
        LAP_RDS_LOG_WARN << "Sanitizer cache size is 0, setting to 1";
        m_maxCacheEntries = 1;
    }
}

Json CDataSanitizer::sanitizeValue(const Json& value) noexcept {
    switch (value.type()) {
        case Json::value_t::object: {
            Json result = Json::object();
            for (auto it = value.begin(); it != value.end(); ++it) {
                result[ToValidUtf8(it.key())] = sanitizeValue(it.value());
            }
            return result;
        }
        case Json::value_t::array: {
            Json result = Json::array();
            for (const auto& element : value) {
                result.push_back(sanitizeValue(element));
            }
            return result;
        }
        case Json::value_t::number_float: {
            Double number = value.get<Double>();
            if (!std::isfinite(number)) {
                return Json(NonFiniteToString(number));
            }
            return value;
        }
        case Json::value_t::string:
            return Json(ToValidUtf8(value.get_ref<const std::string&>()));
        case Json::value_t::null:
        case Json::value_t::boolean:
        case Json::value_t::number_integer:
        case Json::value_t::number_unsigned:
            return value;
        case Json::value_t::binary: {
            const auto& bytes = value.get_binary();
            return Json(Crypto::Util::bytesToHex(bytes.data(), bytes.size()));
        }
        case Json::value_t::discarded:
        default:
            return Json("<discarded>");
    }
}

Json CDataSanitizer::sanitizeForJSON(const Json& value) noexcept {
    String key = ContentKey(value);
    if (key.empty()) {
        return sanitizeValue(value);
    }
    return lookupOrInsert(key, value);
}

Json CDataSanitizer::sanitizeForJSON(const Json& value, const String& cacheKey) noexcept {
    if (cacheKey.empty()) {
        return sanitizeForJSON(value);
    }
    return lookupOrInsert("key:" + cacheKey, value);
}

Json CDataSanitizer::lookupOrInsert(const String& key, const Json& value) noexcept {
    {
        LockGuard lock(m_cacheMutex);
        auto it = m_cache.find(key);
        if (it != m_cache.end()) {
            return it->second;
        }
    }

    // sanitize outside the lock, the result only depends on the input
    Json sanitized = sanitizeValue(value);

    LockGuard lock(m_cacheMutex);
    if (m_cache.find(key) == m_cache.end()) {
        while (m_cache.size() >= m_maxCacheEntries && !m_insertionOrder.empty()) {
            m_cache.erase(m_insertionOrder.front());
            m_insertionOrder.pop_front();
        }
        m_cache.emplace(key, sanitized);
        m_insertionOrder.push_back(key);
    }

    return sanitized;
}

String CDataSanitizer::sanitizeForCSV(const Json& value) noexcept {
    switch (value.type()) {
        case Json::value_t::null:
            return String();
        case Json::value_t::string:
            return value.get<std::string>();
        case Json::value_t::boolean:
            return value.get<Bool>() ? "true" : "false";
        case Json::value_t::number_float: {
            Double number = value.get<Double>();
            if (!std::isfinite(number)) {
                return NonFiniteToString(number);
            }
            return value.dump();
        }
        default:
            // objects, arrays and integers
            return sanitizeValue(value).dump(-1, ' ', false, Json::error_handler_t::replace);
    }
}

CsvRow CDataSanitizer::sanitizeDictForCSV(const Json& value) noexcept {
    CsvRow row;
    if (!value.is_object()) {
        return row;
    }

    for (auto it = value.begin(); it != value.end(); ++it) {
        row[it.key()] = sanitizeForCSV(it.value());
    }
    return row;
}

void CDataSanitizer::clearCache() noexcept {
    LockGuard lock(m_cacheMutex);
    m_cache.clear();
    m_insertionOrder.clear();
}

Size CDataSanitizer::cacheSize() const noexcept {
    LockGuard lock(m_cacheMutex);
    return m_cache.size();
}

} // namespace rds
} // namespace lap
