// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace mcpman::strings
{

[[nodiscard]] inline auto isSpace(char ch) -> bool
{
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

/// @brief Returns the view with leading and trailing whitespace removed.
[[nodiscard]] inline auto trim(std::string_view text) -> std::string_view
{
    while (!text.empty() && isSpace(text.front()))
        text.remove_prefix(1);
    while (!text.empty() && isSpace(text.back()))
        text.remove_suffix(1);
    return text;
}

/// @brief Returns the view with trailing whitespace (including '\r') removed.
[[nodiscard]] inline auto trimEnd(std::string_view text) -> std::string_view
{
    while (!text.empty() && isSpace(text.back()))
        text.remove_suffix(1);
    return text;
}

[[nodiscard]] inline auto toLower(std::string_view str) -> std::string
{
    auto result = std::string {};
    result.reserve(str.size());
    for (auto ch: str)
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return result;
}

/// @brief Splits text into lines on '\n'. A trailing '\r' stays part of its line.
[[nodiscard]] inline auto splitLines(std::string_view text) -> std::vector<std::string_view>
{
    auto lines = std::vector<std::string_view> {};
    if (text.empty())
        return lines;

    auto start = size_t { 0 };
    while (true)
    {
        auto const newline = text.find('\n', start);
        if (newline == std::string_view::npos)
        {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, newline - start));
        start = newline + 1;
        if (start == text.size())
            break;
    }
    return lines;
}

/// @brief Splits text on runs of whitespace, dropping empty tokens.
[[nodiscard]] inline auto splitWhitespace(std::string_view text) -> std::vector<std::string>
{
    auto tokens = std::vector<std::string> {};
    auto current = std::string {};
    for (auto ch: text)
    {
        if (isSpace(ch))
        {
            if (!current.empty())
                tokens.push_back(std::move(current));
            current.clear();
        }
        else
        {
            current += ch;
        }
    }
    if (!current.empty())
        tokens.push_back(std::move(current));
    return tokens;
}

/// @brief Concatenates @p parts with @p separator between consecutive elements.
[[nodiscard]] inline auto join(const std::vector<std::string>& parts, std::string_view separator) -> std::string
{
    auto result = std::string {};
    for (size_t i = 0; i < parts.size(); ++i)
    {
        if (i > 0)
            result += separator;
        result += parts[i];
    }
    return result;
}

} // namespace mcpman::strings
