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
#include <vector>
#include <stdexcept>

#include "ass/style.h"
#include "ass/assdocument.h"
#include "fonts/fontdescriptor.h"
#include "collect/matchresult.h"

namespace fontcollector {

struct FontCollectorContext;

/// @brief Thrown when a dialogue event references a style the script does not declare.
class unknown_style_error : public std::runtime_error
{
public:
    unknown_style_error(const std::string& styleName, std::size_t lineNumber)
        : std::runtime_error("Unknown style \"" + styleName + "\" on line " + std::to_string(lineNumber) + "."),
          m_styleName(styleName), m_lineNumber(lineNumber) {}

    const std::string& styleName() const { return m_styleName; }
    std::size_t lineNumber() const { return m_lineNumber; }

private:
    std::string m_styleName;
    std::size_t m_lineNumber;
};

/**
 * @brief Scans every event with its base style and returns the union of the styles used.
 * @throws unknown_style_error if an event references a style missing from @p styles.
 */
RequiredStyleSet collectRequiredStyles(const StyleRegistry& styles, const std::vector<ass::DialogueEvent>& events,
                                       const FontCollectorContext& context);

/// @brief Matches each required style once and partitions the styles into found and missing.
MatchResult matchStyles(const RequiredStyleSet& requiredStyles, const fonts::FontPool& pool);

/**
 * @brief Resolves the fonts a script needs.
 *
 * Nothing is returned if any event references an undeclared style: the first such event
 * throws unknown_style_error.
 */
MatchResult resolve(const StyleRegistry& styles, const std::vector<ass::DialogueEvent>& events,
                    const fonts::FontPool& pool, const FontCollectorContext& context);

} // namespace fontcollector
