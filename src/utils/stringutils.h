/*
 * Copyright (C) 2024, Robert Patterson
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <filesystem>
#include <fstream>
#include <algorithm>
#include <optional>
#include <cstdint>
#include <cstdlib>
#include <cctype>

namespace utils {

inline std::string utf8ToString(std::u8string_view utf8)
{
    return std::string(reinterpret_cast<const char*>(utf8.data()), utf8.size());
}

inline std::u8string stringToUtf8(std::string_view str)
{
    return std::u8string(reinterpret_cast<const char8_t*>(str.data()), str.size());
}

inline std::filesystem::path utf8ToPath(std::string_view str)
{
    return std::filesystem::path(stringToUtf8(str));
}

inline std::string pathToString(const std::filesystem::path& path)
{
    return utf8ToString(path.u8string());
}

/// @brief Case-insensitive (ASCII) comparison of a path's extension, given without the dot.
inline bool pathExtensionEquals(const std::filesystem::path& path, std::string_view extensionWithoutDot)
{
    const std::string extension = utf8ToString(path.extension().u8string());
    if (extension.size() != extensionWithoutDot.size() + 1 || extension.front() != '.') {
        return false;
    }
    return std::equal(extensionWithoutDot.begin(), extensionWithoutDot.end(), extension.begin() + 1,
        [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
        });
}

inline std::optional<std::string> getEnvironmentValue(const char* name)
{
    if (!name || !*name) {
        return std::nullopt;
    }
    if (const char* value = std::getenv(name)) {
        return std::string(value);
    }
    return std::nullopt;
}

inline std::string toLowerCase(const std::string& inp)
{
    std::string s = inp;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

inline std::string trim(std::string_view inp)
{
    constexpr std::string_view whitespace = " \t\r\n\f\v";
    const auto first = inp.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = inp.find_last_not_of(whitespace);
    return std::string(inp.substr(first, last - first + 1));
}

/// @brief Splits @p inp at each @p separator. When @p maxParts is non-zero, the last part keeps the remainder unsplit.
inline std::vector<std::string> split(std::string_view inp, char separator, std::size_t maxParts = 0)
{
    std::vector<std::string> result;
    std::size_t start = 0;
    while (true) {
        if (maxParts && result.size() + 1 == maxParts) {
            result.emplace_back(inp.substr(start));
            break;
        }
        const auto next = inp.find(separator, start);
        if (next == std::string_view::npos) {
            result.emplace_back(inp.substr(start));
            break;
        }
        result.emplace_back(inp.substr(start, next - start));
        start = next + 1;
    }
    return result;
}

inline void appendCodepointAsUtf8(std::string& target, char32_t codepoint)
{
    if (codepoint <= 0x7F) {
        target.push_back(static_cast<char>(codepoint));
    } else if (codepoint <= 0x7FF) {
        target.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
        target.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else if (codepoint <= 0xFFFF) {
        target.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
        target.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        target.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else if (codepoint <= 0x10FFFF) {
        target.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
        target.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
        target.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        target.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
}

/// @brief Decodes big-endian UTF-16 (as stored in OpenType name records) to utf-8.
/// Unpaired surrogates are replaced with U+FFFD.
inline std::string utf16BEToUtf8(const std::uint8_t* data, std::size_t byteCount)
{
    std::string result;
    result.reserve(byteCount);
    for (std::size_t i = 0; i + 1 < byteCount; i += 2) {
        char32_t unit = (static_cast<char32_t>(data[i]) << 8) | data[i + 1];
        if (unit >= 0xD800 && unit <= 0xDBFF) {
            if (i + 3 < byteCount) {
                const char32_t low = (static_cast<char32_t>(data[i + 2]) << 8) | data[i + 3];
                if (low >= 0xDC00 && low <= 0xDFFF) {
                    unit = 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00);
                    i += 2;
                } else {
                    unit = 0xFFFD;
                }
            } else {
                unit = 0xFFFD;
            }
        } else if (unit >= 0xDC00 && unit <= 0xDFFF) {
            unit = 0xFFFD;
        }
        appendCodepointAsUtf8(result, unit);
    }
    return result;
}

inline std::string fileToString(const std::filesystem::path& pathToRead)
{
    std::ifstream file;
    file.exceptions(std::ios::failbit | std::ios::badbit);
    file.open(pathToRead, std::ios::binary | std::ios::ate);

    // Preallocate retval based on file size
    std::streamsize fileSize = file.tellg();
    file.seekg(0, std::ios::beg);

    std::string retval(static_cast<std::size_t>(fileSize), 0);
    file.read(retval.data(), fileSize);
    return retval;
}

} // namespace utils
