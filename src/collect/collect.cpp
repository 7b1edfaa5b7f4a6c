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
#include <iostream>
#include <string>
#include <array>
#include <algorithm>
#include <optional>

#include "collect/collect.h"
#include "collect/resolver.h"
#include "collect/fontfiles.h"
#include "collect/jsonreport.h"
#include "collect/mkvpropedit.h"
#include "ass/assdocument.h"

namespace fontcollector {

static MatchResult readScript(const std::filesystem::path& inputPath, const FontCollectorContext& context)
{
    const auto document = ass::AssDocument::fromFile(inputPath);
    context.logMessage(LogMsg() << document.styles().size() << " styles and " << document.events().size() << " dialogue lines read.",
                       LogSeverity::Verbose);
    auto result = resolve(document.styles(), document.events(), context.getFontPool(), context);
    logMatchResult(result, context);
    return result;
}

// Input format processors
constexpr auto inputProcessors = []() {
    struct InputProcessor
    {
        const char* format;
        MatchResult(*processor)(const std::filesystem::path&, const FontCollectorContext&);
    };

    return std::to_array<InputProcessor>({
            { ASS_EXTENSION, readScript },
            { SSA_EXTENSION, readScript },
        });
    }();

// Output format processors
constexpr auto outputProcessors = []() {
    struct OutputProcessor
    {
        const char* format;
        void(*processor)(const std::filesystem::path&, const MatchResult&, const FontCollectorContext&);
        const char* description;
    };

    return std::to_array<OutputProcessor>({
            { FONTS_OUTPUT, fontfiles::copyFonts, "[optional folder]    Copy the selected font files (default: the folder of the script)" },
            { JSON_EXTENSION, jsonreport::writeReport, "[optional filepath]  Write a json report of found and missing fonts" },
            { MKV_EXTENSION, mkvpropedit::mergeFontsIntoMkv, "[optional filepath]  Attach the selected fonts to a Matroska file (default: script name with .mkv)" },
        });
    }();

void logMatchResult(const MatchResult& result, const FontCollectorContext& context)
{
    std::vector<Style> foundStyles;
    foundStyles.reserve(result.found.size());
    for (const auto& [style, font] : result.found) {
        foundStyles.push_back(style);
    }
    std::sort(foundStyles.begin(), foundStyles.end());
    for (const auto& style : foundStyles) {
        context.logMessage(LogMsg() << style << " => " << utils::pathToString(result.found.at(style).path), LogSeverity::Verbose);
    }

    if (result.missing.empty()) {
        context.logMessage(LogMsg() << "All fonts found.");
    } else {
        LogMsg msg;
        msg << "Some fonts were not found:";
        for (const auto& family : result.missing) {
            msg << std::endl << "    " << family;
        }
        context.logMessage(std::move(msg), LogSeverity::Warning);
    }

    for (const auto& font : result.selectedFonts()) {
        if (font.isVariable) {
            context.logMessage(LogMsg() << "\"" << utils::pathToString(font.path)
                                        << "\" is a variable font. Some renderers may not display it correctly.", LogSeverity::Warning);
        }
    }
}

int CollectCommand::showHelpPage(const std::string_view& programName, const std::string& indentSpaces) const
{
    std::string fullCommand = std::string(programName) + " " + std::string(commandName());
    // Print usage
    std::cout << indentSpaces << "Finds the fonts an Advanced SubStation Alpha script needs." << std::endl;
    std::cout << indentSpaces << "Every font family, weight and italic combination used by the styles and override tags" << std::endl;
    std::cout << indentSpaces << "is matched against the installed fonts and any additional fonts." << std::endl;
    std::cout << std::endl;
    std::cout << indentSpaces << "Usage: " << fullCommand << " <input-pattern> [--output options]" << std::endl;
    std::cout << std::endl;
    std::cout << indentSpaces << "Specific options:" << std::endl;
    std::cout << indentSpaces << "  --additional-fonts path         Also search this font file or folder. May be repeated." << std::endl;
    std::cout << indentSpaces << "  --no-system-fonts               Do not search the installed fonts." << std::endl;
    std::cout << indentSpaces << "  --delete-fonts                  Delete the fonts attached to the Matroska file before attaching new ones." << std::endl;
    std::cout << indentSpaces << "  --mkvpropedit path              Use this mkvpropedit executable rather than searching PATH." << std::endl;
    std::cout << indentSpaces << "  --pretty-print [indent-spaces]  Print human readable json (default: on, " << JSON_INDENT_SPACES << " indent spaces)." << std::endl;
    std::cout << indentSpaces << "  --no-pretty-print               Print compact json with no indentions or new lines." << std::endl;
    std::cout << std::endl;

    // Supported input formats
    std::cout << indentSpaces << "Supported input formats:" << std::endl;
    for (const auto& input : inputProcessors) {
        std::cout << indentSpaces << "  *." << input.format;
        if (input.format == defaultInputFormat()) {
            std::cout << " (default input format)";
        }
        std::cout << std::endl;
    }
    std::cout << indentSpaces << std::endl;

    // Supported output formats
    std::cout << indentSpaces << "Supported output options:" << std::endl;
    for (const auto& output : outputProcessors) {
        std::string option = std::string("--") + output.format;
        option.resize(8, ' ');
        std::cout << indentSpaces << "  " << option << output.description << std::endl;
    }
    std::cout << indentSpaces << "Without an output option the fonts are only reported." << std::endl;
    std::cout << std::endl;

    // Example usage
    std::cout << indentSpaces << "Examples:" << std::endl;
    std::cout << indentSpaces << "  " << fullCommand << " input.ass" << std::endl;
    std::cout << indentSpaces << "  " << fullCommand << " input.ass --fonts collected --json" << std::endl;
    std::cout << indentSpaces << "  " << fullCommand << " input.ass --mkv episode.mkv --delete-fonts" << std::endl;
    std::cout << indentSpaces << "  " << fullCommand << " myfolder --additional-fonts myfonts --no-system-fonts --recursive" << std::endl;

    return 1;
}

bool CollectCommand::canProcess(const std::filesystem::path& inputPath) const
{
    try {
        findProcessor(inputProcessors, utils::pathToString(inputPath.extension()));
        return true;
    } catch (const std::invalid_argument&) {}
    return false;
}

CommandInputData CollectCommand::processInput(const std::filesystem::path& inputPath, const FontCollectorContext& context) const
{
    auto inputProcessor = findProcessor(inputProcessors, utils::pathToString(inputPath.extension()));
    return inputProcessor(inputPath, context);
}

void CollectCommand::processOutput(const CommandInputData& inputData, const std::string& outputFormat, const std::filesystem::path& outputPath,
                                   const std::filesystem::path&, const FontCollectorContext& context) const
{
    auto outputProcessor = findProcessor(outputProcessors, outputFormat);
    outputProcessor(outputPath, inputData, context);
}

std::filesystem::path CollectCommand::defaultOutputPath(const std::string& outputFormat, const std::filesystem::path& inputPath) const
{
    if (utils::toLowerCase(outputFormat) == FONTS_OUTPUT) {
        // a bare file name lives in the current folder
        return inputPath.has_parent_path() ? inputPath.parent_path() : std::filesystem::path(".");
    }
    std::filesystem::path result = inputPath;
    result.replace_extension(outputFormat);
    return result;
}

} // namespace fontcollector
