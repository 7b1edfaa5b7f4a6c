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
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <vector>

#include "collect/jsonreport.h"

namespace fontcollector {
namespace jsonreport {

json createReport(const std::filesystem::path& inputPath, const MatchResult& result)
{
    json report = json::object();
    report["input"] = utils::pathToString(inputPath);

    json fonts = json::array();
    for (const auto& font : result.selectedFonts()) {
        fonts.push_back({
            { "path", utils::pathToString(font.path) },
            { "family", font.family },
            { "weight", font.weight },
            { "italic", font.italic },
            { "variable", font.isVariable },
        });
    }
    report["fonts"] = std::move(fonts);

    std::vector<Style> foundStyles;
    for (const auto& [style, font] : result.found) {
        foundStyles.push_back(style);
    }
    std::sort(foundStyles.begin(), foundStyles.end());
    json styles = json::array();
    for (const auto& style : foundStyles) {
        styles.push_back({
            { "family", style.fontFamily },
            { "weight", style.weight },
            { "italic", style.italic },
            { "font", utils::pathToString(result.found.at(style).path) },
        });
    }
    report["styles"] = std::move(styles);

    json missing = json::array();
    for (const auto& family : result.missing) {
        missing.push_back(family);
    }
    report["missing"] = std::move(missing);
    return report;
}

void writeReport(const std::filesystem::path& outputPath, const MatchResult& result, const FontCollectorContext& context)
{
    std::filesystem::path reportPath = outputPath;
    if (createDirectoryIfNeeded(reportPath)) {
        std::filesystem::path fileName = context.inputFilePath.filename();
        fileName.replace_extension(JSON_EXTENSION);
        reportPath /= fileName;
    }
    if (!context.validatePathsAndOptions(reportPath)) return;

    const json report = createReport(context.inputFilePath, result);
    std::ofstream file;
    file.exceptions(std::ios::failbit | std::ios::badbit);
    file.open(reportPath, std::ios::out | std::ios::trunc);
    // font names come straight from the script and are not guaranteed to be valid utf-8
    file << report.dump(context.indentSpaces.value_or(-1), ' ', false, json::error_handler_t::replace) << std::endl;
}

} // namespace jsonreport
} // namespace fontcollector
