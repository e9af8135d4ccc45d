// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "Error.hpp"

namespace modelmatch::json
{

/// @brief Parses a JSON document, returning a Result instead of throwing.
/// @param input The JSON text to parse.
/// @return The parsed JSON value or a ProtocolError.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::ProtocolError, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Extracts a required string field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @return The string value or a ProtocolError naming the field.
[[nodiscard]] inline auto getString(const nlohmann::json& obj, std::string_view key) -> Result<std::string>
{
    auto const it = obj.find(std::string(key));
    if (it == obj.end() || !it->is_string())
        return makeError(ErrorCode::ProtocolError, std::format("Missing or invalid string field: {}", key));
    return it->get<std::string>();
}

/// @brief Extracts a required integer field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @return The integer value or a ProtocolError naming the field.
[[nodiscard]] inline auto getInt64(const nlohmann::json& obj, std::string_view key) -> Result<std::int64_t>
{
    auto const it = obj.find(std::string(key));
    if (it == obj.end() || !it->is_number_integer())
        return makeError(ErrorCode::ProtocolError, std::format("Missing or invalid integer field: {}", key));
    return it->get<std::int64_t>();
}

/// @brief Extracts a required array field from a JSON object.
/// @param obj The JSON object.
/// @param key The field name.
/// @return A pointer to the array (owned by @p obj) or a ProtocolError naming the field.
[[nodiscard]] inline auto getArray(const nlohmann::json& obj, std::string_view key) -> Result<const nlohmann::json*>
{
    auto const it = obj.find(std::string(key));
    if (it == obj.end() || !it->is_array())
        return makeError(ErrorCode::ProtocolError, std::format("Missing or invalid array field: {}", key));
    return &*it;
}

/// @brief Extracts an optional string field from a JSON object.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_string())
        return it->get<std::string>();
    return std::string(defaultValue);
}

/// @brief Extracts an optional integer field from a JSON object.
[[nodiscard]] inline auto getIntOr(const nlohmann::json& obj, std::string_view key, int defaultValue) -> int
{
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_number_integer())
        return it->get<int>();
    return defaultValue;
}

/// @brief Extracts an optional array of strings, skipping non-string elements.
/// @return The strings in document order, or an empty vector if the field is absent.
[[nodiscard]] inline auto getStringList(const nlohmann::json& obj, std::string_view key)
    -> std::vector<std::string>
{
    auto result = std::vector<std::string> {};
    auto const it = obj.find(std::string(key));
    if (it == obj.end() || !it->is_array())
        return result;
    for (auto const& element: *it)
        if (element.is_string())
            result.push_back(element.get<std::string>());
    return result;
}

} // namespace modelmatch::json
