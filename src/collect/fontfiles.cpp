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
#include <filesystem>
#include <map>
#include <stdexcept>
#include <system_error>

#include "collect/fontfiles.h"

namespace fontcollector {
namespace fontfiles {

void copyFonts(const std::filesystem::path& outputFolderOption, const MatchResult& result, const FontCollectorContext& context)
{
    const std::filesystem::path outputFolder = outputFolderOption.empty() ? std::filesystem::path(".") : outputFolderOption;
    std::error_code ec;
    if (std::filesystem::exists(outputFolder, ec) && !std::filesystem::is_directory(outputFolder, ec)) {
        throw std::runtime_error("Font output " + utils::pathToString(outputFolder) + " is a file, not a folder.");
    }
    std::filesystem::create_directories(outputFolder);

    size_t copied = 0;
    std::map<std::filesystem::path, std::filesystem::path> sourceByFileName;
    for (const auto& font : result.selectedFonts()) {
        const std::filesystem::path target = outputFolder / font.path.filename();
        const auto [previous, inserted] = sourceByFileName.emplace(font.path.filename(), font.path);
        if (!inserted) {
            context.logMessage(LogMsg() << utils::pathToString(font.path) << " has the same file name as " << utils::pathToString(previous->second)
                << " and is not copied.", LogSeverity::Warning);
            continue;
        }
        if (std::filesystem::exists(target, ec) && std::filesystem::equivalent(font.path, target, ec)) {
            context.logMessage(LogMsg() << utils::pathToString(target) << " is already in place.", LogSeverity::Verbose);
            continue;
        }
        if (!context.validatePathsAndOptions(target)) {
            continue;
        }
        std::filesystem::copy_file(font.path, target, std::filesystem::copy_options::overwrite_existing);
        copied++;
    }
    context.logMessage(LogMsg() << copied << " font files copied to " << utils::pathToString(outputFolder) << ".");
}

} // namespace fontfiles
} // namespace fontcollector
