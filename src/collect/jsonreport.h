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

#include <filesystem>

#include "nlohmann/json.hpp"

#include "fontcollector.h"

namespace fontcollector {
namespace jsonreport {

using json = nlohmann::ordered_json;

/**
 * @brief Builds the report for one script.
 *
 * Keys: "input" (the script path), "fonts" (the selected font files), "styles" (each found style
 * with the file chosen for it) and "missing" (the family names without a font). Arrays are sorted.
 */
json createReport(const std::filesystem::path& inputPath, const MatchResult& result);

/// @brief Writes #createReport for the current input file. A folder as @p outputPath receives
/// a file named after the script.
void writeReport(const std::filesystem::path& outputPath, const MatchResult& result, const FontCollectorContext& context);

} // namespace jsonreport
} // namespace fontcollector
