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

#include "ass/style.h"

namespace fontcollector {
namespace ass {

/// @brief A Dialogue event of a script. Comment events are not kept.
struct DialogueEvent
{
    std::string styleName;
    std::string text;           ///< raw Text field, override blocks included
    std::size_t lineNumber{};   ///< 1-based line of the event in the script file
};

/**
 * @brief The parts of an Advanced SubStation Alpha script that determine font usage.
 *
 * Column positions are taken from the Format lines of the styles and events sections,
 * with the standard V4+ layouts as defaults.
 */
class AssDocument
{
public:
    /// @brief Reads a script file. Throws std::runtime_error if it cannot be read.
    static AssDocument fromFile(const std::filesystem::path& filePath);

    /// @brief Parses script text (utf-8, optional byte order mark).
    static AssDocument fromString(std::string_view text);

    const StyleRegistry& styles() const { return m_styles; }
    const std::vector<DialogueEvent>& events() const { return m_events; }

private:
    StyleRegistry m_styles;
    std::vector<DialogueEvent> m_events;
};

} // namespace ass
} // namespace fontcollector
