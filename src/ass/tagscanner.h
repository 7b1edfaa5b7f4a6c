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
#include <optional>

#include "ass/style.h"

namespace fontcollector {

struct FontCollectorContext;

namespace ass {

/// @brief One override block of a dialogue line and the literal text that follows it.
/// The block is empty for text that precedes the first block.
struct LineSegment
{
    std::string_view overrideBlock;     ///< contents between '{' and '}'
    std::string_view text;
};

/// @brief Splits a dialogue line into its (override block, text) segments, in line order.
/// An unterminated '{' takes the remainder of the line as its block.
std::vector<LineSegment> splitLine(std::string_view lineText);

/// @brief Parses the numeric argument of a \\b or \\i tag: an optional sign followed by digits.
/// Trailing characters are ignored. Returns std::nullopt if there are no digits.
std::optional<int> parseTagInteger(std::string_view argument);

/// @brief Maps a \\b argument to its weight bucket: <=0 is 400, 1 is 700, otherwise
/// 100-wide bands from 100 (2-150) to 900 (851 and up).
int weightFromBoldTag(int value);

/**
 * @brief The effective style while walking the override blocks of one line.
 *
 * Overrides are cumulative: a tag stays in effect for the rest of the line unless it is set
 * again or a \\r tag restores the base style. Tag arguments never extend past the end of
 * the block they appear in.
 */
class TagState
{
public:
    explicit TagState(const Style& baseStyle)
        : m_base(baseStyle), m_current(baseStyle)
    {
    }

    /**
     * @brief Applies the tags of one override block in order.
     * @param block the block contents without the braces
     * @param rejectedFontNames if non-null, receives each \\fn argument that was ignored
     * because it cannot be a font name.
     */
    void applyOverrideBlock(std::string_view block, std::vector<std::string>* rejectedFontNames = nullptr);

    const Style& current() const { return m_current; }
    const Style& base() const { return m_base; }

private:
    void applyTag(std::string_view tag, std::vector<std::string>* rejectedFontNames);

    Style m_base;
    Style m_current;
};

/**
 * @brief Computes the distinct styles that the visible text of one dialogue line uses.
 *
 * Text that is empty after a block contributes nothing. Rejected \\fn tags are logged as
 * warnings through @p context.
 * @param lineText the raw Text field of the event
 * @param baseStyle the style the event references
 * @param context the logging context
 * @param lineNumber 1-based line number used in warnings, or 0 to omit it
 */
RequiredStyleSet scanLine(std::string_view lineText, const Style& baseStyle, const FontCollectorContext& context, std::size_t lineNumber = 0);

} // namespace ass
} // namespace fontcollector
