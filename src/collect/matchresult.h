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

#include <set>
#include <map>
#include <string>
#include <vector>
#include <unordered_map>

#include "ass/style.h"
#include "fonts/fontdescriptor.h"

namespace fontcollector {

/**
 * @brief Partition of the required styles of a script.
 *
 * Each required style is either in #found with its best font, or its family is in #missing.
 * Several unmet styles of one family collapse into a single missing name.
 */
struct MatchResult
{
    std::unordered_map<Style, fonts::FontDescriptor, StyleHash> found;
    std::set<std::string> missing;

    /// @brief The distinct font files selected for #found, ordered by path.
    std::vector<fonts::FontDescriptor> selectedFonts() const
    {
        std::map<std::filesystem::path, fonts::FontDescriptor> byPath;
        for (const auto& [style, font] : found) {
            byPath.emplace(font.path, font);
        }
        std::vector<fonts::FontDescriptor> result;
        result.reserve(byPath.size());
        for (auto& [path, font] : byPath) {
            result.push_back(std::move(font));
        }
        return result;
    }
};

} // namespace fontcollector
