// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdint>
#include <format>
#include <limits>
#include <string>
#include <string_view>
#include <utility>

#include "Error.hpp"

namespace storyloom::json
{

/// @brief Parses a JSON string, returning a Result.
/// @param input The JSON string to parse.
/// @return The parsed JSON document or an InvalidConfig error.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::InvalidConfig, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Joins a section name and a key into the dotted form used in error messages.
[[nodiscard]] inline auto qualifiedKey(std::string_view section, std::string_view key) -> std::string
{
    if (section.empty())
        return std::string(key);
    return std::format("{}.{}", section, key);
}

/// @brief Looks up an optional object-valued section.
/// @param root The enclosing JSON object.
/// @param name The section name.
/// @return Pointer to the section, nullptr if absent, or an error if present but not an object.
[[nodiscard]] inline auto section(const nlohmann::json& root, std::string_view name)
    -> Result<const nlohmann::json*>
{
    auto const it = root.find(std::string(name));
    if (it == root.end())
        return nullptr;
    if (!it->is_object())
        return makeConfigError(name, "expected an object");
    return &*it;
}

/// @brief Reads an optional string field, leaving @p out untouched if the key is absent.
/// @return Success, or InvalidConfig if the key is present with the wrong type.
[[nodiscard]] inline auto read(const nlohmann::json& obj,
                               std::string_view sectionName,
                               std::string_view key,
                               std::string& out) -> VoidResult
{
    auto const it = obj.find(std::string(key));
    if (it == obj.end())
        return {};
    if (!it->is_string())
        return makeConfigError(qualifiedKey(sectionName, key), "expected a string");
    out = it->get<std::string>();
    return {};
}

/// @brief Reads an optional integer field into any integer type, rejecting values it cannot hold.
template <typename T>
[[nodiscard]] auto readInteger(const nlohmann::json& obj,
                               std::string_view sectionName,
                               std::string_view key,
                               T& out) -> VoidResult
{
    auto const it = obj.find(std::string(key));
    if (it == obj.end())
        return {};
    if (!it->is_number_integer())
        return makeConfigError(qualifiedKey(sectionName, key), "expected an integer");

    auto const outOfRange = [&] {
        return makeConfigError(qualifiedKey(sectionName, key),
                               std::format("must be in [{}, {}]",
                                           std::numeric_limits<T>::min(),
                                           std::numeric_limits<T>::max()));
    };

    // Values above INT64_MAX are only representable as unsigned.
    if (it->is_number_unsigned())
    {
        auto const value = it->get<std::uint64_t>();
        if (!std::in_range<T>(value))
            return outOfRange();
        out = static_cast<T>(value);
        return {};
    }

    auto const value = it->get<std::int64_t>();
    if (!std::in_range<T>(value))
        return outOfRange();
    out = static_cast<T>(value);
    return {};
}

/// @brief Reads an optional integer field, leaving @p out untouched if the key is absent.
/// @return Success, or InvalidConfig if the value is not an integer or does not fit an int.
[[nodiscard]] inline auto read(const nlohmann::json& obj,
                               std::string_view sectionName,
                               std::string_view key,
                               int& out) -> VoidResult
{
    return readInteger(obj, sectionName, key, out);
}

/// @brief Reads an optional 64-bit integer field, leaving @p out untouched if the key is absent.
[[nodiscard]] inline auto read(const nlohmann::json& obj,
                               std::string_view sectionName,
                               std::string_view key,
                               std::int64_t& out) -> VoidResult
{
    return readInteger(obj, sectionName, key, out);
}

/// @brief Reads an optional floating point field, leaving @p out untouched if the key is absent.
[[nodiscard]] inline auto read(const nlohmann::json& obj,
                               std::string_view sectionName,
                               std::string_view key,
                               float& out) -> VoidResult
{
    auto const it = obj.find(std::string(key));
    if (it == obj.end())
        return {};
    if (!it->is_number())
        return makeConfigError(qualifiedKey(sectionName, key), "expected a number");
    auto const value = it->get<double>();
    if (std::abs(value) > static_cast<double>(std::numeric_limits<float>::max()))
        return makeConfigError(qualifiedKey(sectionName, key), "out of range");
    out = static_cast<float>(value);
    return {};
}

/// @brief Reads an optional boolean field, leaving @p out untouched if the key is absent.
///
/// Accepts the strings "on" and "off" as well.
[[nodiscard]] inline auto read(const nlohmann::json& obj,
                               std::string_view sectionName,
                               std::string_view key,
                               bool& out) -> VoidResult
{
    auto const it = obj.find(std::string(key));
    if (it == obj.end())
        return {};
    if (it->is_boolean())
    {
        out = it->get<bool>();
        return {};
    }
    if (it->is_string())
    {
        auto const value = it->get<std::string>();
        if (value == "on" || value == "off")
        {
            out = value == "on";
            return {};
        }
    }
    return makeConfigError(qualifiedKey(sectionName, key), "expected a boolean");
}

} // namespace storyloom::json
