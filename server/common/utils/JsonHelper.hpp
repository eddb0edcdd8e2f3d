#pragma once

#include "AppException.hpp"

/**
 * @brief JSON (de)serialization helpers
 */
namespace JsonHelper {

/**
 * @brief Compact single-line serialization
 */
inline std::string serialize(const Json::Value& value) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    writer["emitUTF8"] = true;
    return Json::writeString(writer, value);
}

/**
 * @brief Parse a JSON string
 * @throws ValidationException on malformed input
 */
inline Json::Value parse(const std::string& jsonStr) {
    Json::CharReaderBuilder reader;
    Json::Value result;
    std::string errs;
    std::istringstream iss(jsonStr);
    if (!Json::parseFromStream(reader, iss, &result, &errs)) {
        throw ValidationException("Malformed JSON: " + errs);
    }
    return result;
}

/** String member or fallback; numbers are rendered as text */
inline std::string getString(const Json::Value& obj, const char* key, const std::string& fallback = "") {
    if (!obj.isObject() || !obj.isMember(key) || obj[key].isNull()) return fallback;
    const auto& v = obj[key];
    if (v.isString()) return v.asString();
    if (v.isIntegral()) return std::to_string(v.asInt64());
    if (v.isNumeric() || v.isBool()) return v.asString();
    return fallback;
}

/** Frappe check fields arrive as 0/1 integers, bools or "0"/"1" strings */
inline bool getFlag(const Json::Value& obj, const char* key, bool fallback = false) {
    if (!obj.isObject() || !obj.isMember(key) || obj[key].isNull()) return fallback;
    const auto& v = obj[key];
    if (v.isBool()) return v.asBool();
    if (v.isNumeric()) return v.asInt() != 0;
    if (v.isString()) return v.asString() == "1" || v.asString() == "true";
    return fallback;
}

}  // namespace JsonHelper
