// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "Error.hpp"

namespace mcpman::json
{

/// @brief Parses a JSON string, returning a Result.
/// @tparam Json The nlohmann JSON flavour to produce (json or ordered_json).
/// @param input The JSON string to parse.
/// @param code The error code to report on malformed input.
/// @return The parsed JSON value or an Error.
template <typename Json = nlohmann::json>
[[nodiscard]] auto parse(std::string_view input, ErrorCode code = ErrorCode::ParseError) -> Result<Json>
{
    try
    {
        return Json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(code, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Extracts a required string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @return The string value or an Error.
template <typename Json>
[[nodiscard]] auto getString(const Json& obj, std::string_view key) -> Result<std::string>
{
    auto keyStr = std::string(key);
    if (!obj.is_object() || !obj.contains(keyStr) || !obj[keyStr].is_string())
        return makeError(ErrorCode::ParseError, std::format("Missing or invalid string field: {}", key));
    return obj[keyStr].template get<std::string>();
}

/// @brief Extracts an optional string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @param defaultValue The value to return if the field is missing.
/// @return The string value or the default.
template <typename Json>
[[nodiscard]] auto getStringOr(const Json& obj, std::string_view key, std::string_view defaultValue)
    -> std::string
{
    auto keyStr = std::string(key);
    if (obj.is_object() && obj.contains(keyStr) && obj[keyStr].is_string())
        return obj[keyStr].template get<std::string>();
    return std::string(defaultValue);
}

/// @brief Extracts the string elements of an array field, skipping non-strings.
/// @param obj The JSON object.
/// @param key The field name.
/// @return The strings in array order, or an empty vector if the field is missing.
template <typename Json>
[[nodiscard]] auto getStringArray(const Json& obj, std::string_view key) -> std::vector<std::string>
{
    auto result = std::vector<std::string> {};
    auto keyStr = std::string(key);
    if (!obj.is_object() || !obj.contains(keyStr) || !obj[keyStr].is_array())
        return result;

    for (const auto& item: obj[keyStr])
    {
        if (item.is_string())
            result.push_back(item.template get<std::string>());
    }
    return result;
}

/// @brief Extracts the string members of an object field, skipping non-strings.
/// @param obj The JSON object.
/// @param key The field name.
/// @return The key/value pairs, or an empty map if the field is missing.
template <typename Json>
[[nodiscard]] auto getStringMap(const Json& obj, std::string_view key) -> std::map<std::string, std::string>
{
    auto result = std::map<std::string, std::string> {};
    auto keyStr = std::string(key);
    if (!obj.is_object() || !obj.contains(keyStr) || !obj[keyStr].is_object())
        return result;

    for (const auto& [name, value]: obj[keyStr].items())
    {
        if (value.is_string())
            result[name] = value.template get<std::string>();
    }
    return result;
}

} // namespace mcpman::json
