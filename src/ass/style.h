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
#include <ostream>
#include <unordered_map>
#include <unordered_set>
#include <functional>

#include "utils/stringutils.h"

namespace fontcollector {

inline constexpr int FONT_WEIGHT_REGULAR = 400;
inline constexpr int FONT_WEIGHT_BOLD    = 700;

/// @brief Normalizes a font family name for comparison: trims, lower-cases, and strips the
/// leading '@' that ASS uses to request vertical text.
inline std::string normalizeFontName(std::string_view fontName)
{
    std::string result = utils::toLowerCase(utils::trim(fontName));
    if (!result.empty() && result.front() == '@') {
        result.erase(result.begin());
    }
    return result;
}

/**
 * @brief The effective text appearance at some point in a script.
 *
 * Equality and hashing cover the three fields only. Two styles derived from different markup
 * but with the same family, weight, and italic flag require the same font.
 */
struct Style
{
    std::string fontFamily;             ///< normalized with #normalizeFontName
    int weight{ FONT_WEIGHT_REGULAR };  ///< 100-900 OpenType scale
    bool italic{};

    bool operator==(const Style& other) const
    {
        return weight == other.weight && italic == other.italic && fontFamily == other.fontFamily;
    }

    bool operator!=(const Style& other) const { return !(*this == other); }

    /// @brief Orders by family, then weight, then italic. Used for stable report output.
    bool operator<(const Style& other) const
    {
        if (fontFamily != other.fontFamily) return fontFamily < other.fontFamily;
        if (weight != other.weight) return weight < other.weight;
        return italic < other.italic;
    }
};

inline std::ostream& operator<<(std::ostream& os, const Style& style)
{
    os << "FontName: " << style.fontFamily << " Weight: " << style.weight << " Italic: " << (style.italic ? "true" : "false");
    return os;
}

struct StyleHash
{
    std::size_t operator()(const Style& value) const
    {
        std::size_t result = std::hash<std::string>()(value.fontFamily);
        result ^= std::hash<int>()(value.weight) << 1;
        result ^= std::hash<bool>()(value.italic) << 2;
        return result;
    }
};

/// @brief The distinct styles that rendered glyphs of a script (or a single line) require.
using RequiredStyleSet = std::unordered_set<Style, StyleHash>;

/// @brief The named base styles declared in a script's styles section.
using StyleRegistry = std::unordered_map<std::string, Style>;

} // namespace fontcollector
