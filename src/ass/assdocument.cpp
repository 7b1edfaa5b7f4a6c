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
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <algorithm>
#include <stdexcept>
#include <cstdlib>

#include "ass/assdocument.h"
#include "utils/stringutils.h"

namespace fontcollector {
namespace ass {

namespace {

enum class Section
{
    Other,
    Styles,
    Events
};

using ColumnLayout = std::vector<std::string>;

const ColumnLayout& defaultStyleLayout()
{
    static const ColumnLayout layout = {
        "name", "fontname", "fontsize", "primarycolour", "secondarycolour", "outlinecolour", "backcolour",
        "bold", "italic", "underline", "strikeout", "scalex", "scaley", "spacing", "angle", "borderstyle",
        "outline", "shadow", "alignment", "marginl", "marginr", "marginv", "encoding"
    };
    return layout;
}

const ColumnLayout& defaultEventLayout()
{
    static const ColumnLayout layout = {
        "layer", "start", "end", "style", "name", "marginl", "marginr", "marginv", "effect", "text"
    };
    return layout;
}

ColumnLayout parseFormat(std::string_view value)
{
    ColumnLayout result;
    for (const auto& column : utils::split(value, ',')) {
        result.push_back(utils::toLowerCase(utils::trim(column)));
    }
    return result;
}

std::optional<std::size_t> columnIndex(const ColumnLayout& layout, std::string_view name)
{
    const auto it = std::find(layout.begin(), layout.end(), name);
    if (it == layout.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - layout.begin());
}

// ASS writes true as -1, but any non-zero value counts
bool parseFlag(const std::string& field)
{
    return std::strtol(field.c_str(), nullptr, 10) != 0;
}

} // namespace

AssDocument AssDocument::fromFile(const std::filesystem::path& filePath)
{
    std::string contents;
    try {
        contents = utils::fileToString(filePath);
    } catch (const std::ios_base::failure&) {
        throw std::runtime_error("Unable to read subtitle file " + utils::pathToString(filePath));
    }
    return fromString(contents);
}

AssDocument AssDocument::fromString(std::string_view text)
{
    constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";
    if (text.substr(0, kUtf8Bom.size()) == kUtf8Bom) {
        text.remove_prefix(kUtf8Bom.size());
    }

    AssDocument result;
    Section section = Section::Other;
    ColumnLayout styleLayout = defaultStyleLayout();
    ColumnLayout eventLayout = defaultEventLayout();

    std::size_t lineNumber = 0;
    for (std::string_view rawLine : utils::split(text, '\n')) {
        lineNumber++;
        if (!rawLine.empty() && rawLine.back() == '\r') {
            rawLine.remove_suffix(1);
        }
        const std::string line = utils::trim(rawLine);
        if (line.empty() || line.front() == ';') {
            continue;
        }
        if (line.front() == '[' && line.back() == ']') {
            const std::string header = utils::toLowerCase(line);
            if (header == "[v4+ styles]" || header == "[v4 styles]" || header == "[v4 styles+]") {
                section = Section::Styles;
            } else if (header == "[events]") {
                section = Section::Events;
            } else {
                section = Section::Other;
            }
            continue;
        }
        if (section == Section::Other) {
            continue;
        }

        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        const std::string key = utils::toLowerCase(utils::trim(std::string_view(line).substr(0, colon)));
        std::string_view value = std::string_view(line).substr(colon + 1);
        while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
            value.remove_prefix(1);
        }

        if (key == "format") {
            (section == Section::Styles ? styleLayout : eventLayout) = parseFormat(value);
            continue;
        }

        if (section == Section::Styles && key == "style") {
            const auto fields = utils::split(value, ',', styleLayout.size());
            const auto nameIndex = columnIndex(styleLayout, "name");
            const auto fontIndex = columnIndex(styleLayout, "fontname");
            if (!nameIndex || !fontIndex || *nameIndex >= fields.size() || *fontIndex >= fields.size()) {
                continue;
            }
            Style style;
            style.fontFamily = normalizeFontName(fields[*fontIndex]);
            const auto boldIndex = columnIndex(styleLayout, "bold");
            if (boldIndex && *boldIndex < fields.size() && parseFlag(fields[*boldIndex])) {
                style.weight = FONT_WEIGHT_BOLD;
            }
            const auto italicIndex = columnIndex(styleLayout, "italic");
            if (italicIndex && *italicIndex < fields.size()) {
                style.italic = parseFlag(fields[*italicIndex]);
            }
            result.m_styles[utils::trim(fields[*nameIndex])] = style;
        } else if (section == Section::Events && key == "dialogue") {
            // the text column is last and keeps its commas
            const auto fields = utils::split(value, ',', eventLayout.size());
            const auto styleIndex = columnIndex(eventLayout, "style");
            const auto textIndex = columnIndex(eventLayout, "text");
            if (!styleIndex || !textIndex || *styleIndex >= fields.size() || *textIndex >= fields.size()) {
                continue;
            }
            result.m_events.push_back(DialogueEvent{ utils::trim(fields[*styleIndex]), fields[*textIndex], lineNumber });
        }
    }
    return result;
}

} // namespace ass
} // namespace fontcollector
