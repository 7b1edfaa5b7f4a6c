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
#include <cctype>
#include <algorithm>

#include "ass/tagscanner.h"
#include "fontcollector.h"

namespace fontcollector {
namespace ass {

std::vector<LineSegment> splitLine(std::string_view lineText)
{
    std::vector<LineSegment> result;
    std::size_t pos = 0;
    while (pos < lineText.size()) {
        LineSegment segment;
        if (lineText[pos] == '{') {
            const auto close = lineText.find('}', pos + 1);
            if (close == std::string_view::npos) {
                segment.overrideBlock = lineText.substr(pos + 1);
                pos = lineText.size();
            } else {
                segment.overrideBlock = lineText.substr(pos + 1, close - pos - 1);
                pos = close + 1;
            }
        }
        const auto nextBlock = std::min(lineText.find('{', pos), lineText.size());
        segment.text = lineText.substr(pos, nextBlock - pos);
        pos = nextBlock;
        result.push_back(segment);
    }
    return result;
}

std::optional<int> parseTagInteger(std::string_view argument)
{
    // larger values all land in the same bucket, so saturate rather than overflow
    constexpr int kSaturation = 1000000;

    std::size_t pos = 0;
    bool negative = false;
    if (pos < argument.size() && (argument[pos] == '+' || argument[pos] == '-')) {
        negative = argument[pos] == '-';
        pos++;
    }
    if (pos >= argument.size() || !std::isdigit(static_cast<unsigned char>(argument[pos]))) {
        return std::nullopt;
    }
    int value = 0;
    for (; pos < argument.size() && std::isdigit(static_cast<unsigned char>(argument[pos])); pos++) {
        if (value < kSaturation) {
            value = value * 10 + (argument[pos] - '0');
        }
    }
    return negative ? -value : value;
}

int weightFromBoldTag(int value)
{
    if (value <= 0) {
        return FONT_WEIGHT_REGULAR;
    }
    if (value == 1) {
        return FONT_WEIGHT_BOLD;
    }
    if (value >= 851) {
        return 900;
    }
    if (value <= 150) {
        return 100;
    }
    // 151-250 -> 200, 251-350 -> 300, ... 751-850 -> 800
    return ((value - 151) / 100 + 2) * 100;
}

void TagState::applyOverrideBlock(std::string_view block, std::vector<std::string>* rejectedFontNames)
{
    // anything before the first backslash is a comment
    auto start = block.find('\\');
    while (start != std::string_view::npos) {
        const auto next = block.find('\\', start + 1);
        const auto tag = block.substr(start + 1, next == std::string_view::npos ? std::string_view::npos : next - start - 1);
        applyTag(tag, rejectedFontNames);
        start = next;
    }
}

void TagState::applyTag(std::string_view tag, std::vector<std::string>* rejectedFontNames)
{
    if (tag.empty()) {
        return;
    }
    if (tag.rfind("fn", 0) == 0) {
        const std::string_view fontName = tag.substr(2);
        if (fontName.find_first_of("()") != std::string_view::npos) {
            // the markup has no way to express a parenthesis in a font name
            if (rejectedFontNames) {
                rejectedFontNames->emplace_back(fontName);
            }
            return;
        }
        std::string normalized = normalizeFontName(fontName);
        m_current.fontFamily = normalized.empty() ? m_base.fontFamily : std::move(normalized);
        return;
    }
    switch (tag.front()) {
        case 'r':
            m_current = m_base;
            break;
        case 'b':
            if (const auto value = parseTagInteger(tag.substr(1))) {
                m_current.weight = weightFromBoldTag(*value);
            }
            break;
        case 'i':
            if (const auto value = parseTagInteger(tag.substr(1))) {
                m_current.italic = (*value == 1);
            }
            break;
        default:
            break;
    }
}

RequiredStyleSet scanLine(std::string_view lineText, const Style& baseStyle, const FontCollectorContext& context, std::size_t lineNumber)
{
    RequiredStyleSet result;
    TagState state(baseStyle);
    std::vector<std::string> rejectedFontNames;
    for (const auto& segment : splitLine(lineText)) {
        state.applyOverrideBlock(segment.overrideBlock, &rejectedFontNames);
        if (!segment.text.empty()) {
            result.insert(state.current());
        }
    }
    for (const auto& fontName : rejectedFontNames) {
        LogMsg msg;
        if (lineNumber) {
            msg << "Line " << lineNumber << ": ";
        }
        msg << "font name \"" << fontName << "\" contains \"(\" or \")\", which a \\fn tag cannot express. The tag is ignored.";
        context.logMessage(std::move(msg), LogSeverity::Warning);
    }
    return result;
}

} // namespace ass
} // namespace fontcollector
