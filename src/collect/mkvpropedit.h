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
#include <string>
#include <string_view>
#include <vector>

#include "fontcollector.h"

namespace fontcollector {
namespace mkvpropedit {

/// @brief Attachment MIME types that renderers load as fonts. Attachments of these types are
/// removed by --delete-fonts.
inline constexpr const char* FONT_MIME_TYPES[] = {
    "application/x-truetype-font",
    "application/vnd.ms-opentype",
    "application/x-font-ttf",
    "application/x-font",
    "application/font-sfnt",
    "font/collection",
    "font/otf",
    "font/sfnt",
    "font/ttf",
};

/// @brief True if the file starts with the EBML signature 1A 45 DF A3.
/// @throws std::runtime_error if the file does not exist.
bool isMkv(const std::filesystem::path& filePath);

/// @brief The --mkvpropedit option if given, otherwise the first mkvpropedit found on PATH.
/// @throws std::runtime_error if there is none.
std::filesystem::path findExecutable(const FontCollectorContext& context);

/// @brief Quotes an argument for the POSIX shell (or cmd.exe on Windows).
std::string escapeShellArg(std::string_view arg);

std::vector<std::string> deleteFontsArguments(const std::filesystem::path& mkvFile);
std::vector<std::string> attachFontsArguments(const std::filesystem::path& mkvFile, const std::vector<fonts::FontDescriptor>& fonts);

struct ProcessResult
{
    int exitCode{};
    std::string output;     ///< stdout and stderr combined
};

/// @brief Runs @p executable with @p arguments and waits for it.
ProcessResult runProcess(const std::filesystem::path& executable, const std::vector<std::string>& arguments);

/// @brief Runs `mkvpropedit --version` and checks that it identifies itself.
/// @throws std::runtime_error if it does not.
void validateExecutable(const std::filesystem::path& executable);

/**
 * @brief Attaches the selected fonts to a Matroska file, first deleting the attached fonts if
 * --delete-fonts was given.
 *
 * mkvpropedit warnings (exit code 1) are logged. Errors throw std::runtime_error, as do
 * a missing or invalid mkvpropedit and a target that is not a Matroska file.
 */
void mergeFontsIntoMkv(const std::filesystem::path& mkvFile, const MatchResult& result, const FontCollectorContext& context);

} // namespace mkvpropedit
} // namespace fontcollector
