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
#include <array>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#ifdef _WIN32
#define popen _popen
#define pclose _pclose
#define WIFEXITED(status) (1)
#define WEXITSTATUS(status) (status)
#else
#include <sys/wait.h>
#endif

#include "collect/mkvpropedit.h"

namespace fontcollector {
namespace mkvpropedit {

#ifdef _WIN32
constexpr char kPathSeparator = ';';
constexpr char kExecutableName[] = "mkvpropedit.exe";
#else
constexpr char kPathSeparator = ':';
constexpr char kExecutableName[] = "mkvpropedit";
#endif

constexpr int kExitWarnings = 1;

bool isMkv(const std::filesystem::path& filePath)
{
    if (!std::filesystem::is_regular_file(filePath)) {
        throw std::runtime_error("The file " + utils::pathToString(filePath) + " does not exist.");
    }
    std::ifstream file(filePath, std::ios::binary);
    std::array<char, 4> signature{};
    file.read(signature.data(), signature.size());
    if (file.gcount() != static_cast<std::streamsize>(signature.size())) {
        return false;
    }
    return static_cast<unsigned char>(signature[0]) == 0x1A && static_cast<unsigned char>(signature[1]) == 0x45
        && static_cast<unsigned char>(signature[2]) == 0xDF && static_cast<unsigned char>(signature[3]) == 0xA3;
}

std::filesystem::path findExecutable(const FontCollectorContext& context)
{
    if (context.mkvpropeditPath.has_value()) {
        if (!std::filesystem::is_regular_file(context.mkvpropeditPath.value())) {
            throw std::runtime_error("mkvpropedit was not found at " + utils::pathToString(context.mkvpropeditPath.value()) + ".");
        }
        return context.mkvpropeditPath.value();
    }
    if (const auto searchPath = utils::getEnvironmentValue("PATH")) {
        for (const auto& dir : utils::split(*searchPath, kPathSeparator)) {
            if (dir.empty()) continue;
            std::error_code ec;
            const std::filesystem::path candidate = utils::utf8ToPath(dir) / kExecutableName;
            if (std::filesystem::is_regular_file(candidate, ec)) {
                return candidate;
            }
        }
    }
    throw std::runtime_error("mkvpropedit was not found on PATH. Use --mkvpropedit to specify its location.");
}

std::string escapeShellArg(std::string_view arg)
{
#ifdef _WIN32
    std::string result = "\"";
    for (char c : arg) {
        if (c == '"') {
            result += "\\\"";
        } else {
            result += c;
        }
    }
    result += '"';
    return result;
#else
    std::string result = "'";
    for (char c : arg) {
        if (c == '\'') {
            result += "'\\''";
        } else {
            result += c;
        }
    }
    result += '\'';
    return result;
#endif
}

std::vector<std::string> deleteFontsArguments(const std::filesystem::path& mkvFile)
{
    std::vector<std::string> args{ utils::pathToString(mkvFile) };
    for (const char* mimeType : FONT_MIME_TYPES) {
        args.push_back("--delete-attachment");
        args.push_back(std::string("mime-type:") + mimeType);
    }
    return args;
}

std::vector<std::string> attachFontsArguments(const std::filesystem::path& mkvFile, const std::vector<fonts::FontDescriptor>& fonts)
{
    std::vector<std::string> args{ utils::pathToString(mkvFile) };
    for (const auto& font : fonts) {
        args.push_back("--add-attachment");
        args.push_back(utils::pathToString(font.path));
    }
    return args;
}

ProcessResult runProcess(const std::filesystem::path& executable, const std::vector<std::string>& arguments)
{
    std::string commandLine = escapeShellArg(utils::pathToString(executable));
    for (const auto& arg : arguments) {
        commandLine += ' ';
        commandLine += escapeShellArg(arg);
    }
    commandLine += " 2>&1";

    FILE* pipe = popen(commandLine.c_str(), "r");
    if (!pipe) {
        throw std::runtime_error("Unable to run " + utils::pathToString(executable) + ".");
    }
    ProcessResult result;
    std::array<char, 4096> buffer{};
    size_t bytesRead = 0;
    while ((bytesRead = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        result.output.append(buffer.data(), bytesRead);
    }
    const int status = pclose(pipe);
    if (status == -1) {
        throw std::runtime_error("Unable to get the exit status of " + utils::pathToString(executable) + ".");
    }
    result.exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return result;
}

void validateExecutable(const std::filesystem::path& executable)
{
    const auto result = runProcess(executable, { "--version" });
    if (result.exitCode != 0 || result.output.rfind("mkvpropedit", 0) != 0) {
        throw std::runtime_error(utils::pathToString(executable) + " is not a valid mkvpropedit executable.");
    }
}

static void runMkvpropedit(const std::filesystem::path& executable, const std::vector<std::string>& arguments,
                           const std::string& action, const FontCollectorContext& context)
{
    const auto result = runProcess(executable, arguments);
    if (result.exitCode == 0) {
        return;
    }
    if (result.exitCode == kExitWarnings) {
        context.logMessage(LogMsg() << "mkvpropedit reported warnings when " << action << ": " << utils::trim(result.output), LogSeverity::Warning);
        return;
    }
    throw std::runtime_error("mkvpropedit reported an error when " + action + ": " + utils::trim(result.output));
}

void mergeFontsIntoMkv(const std::filesystem::path& mkvFile, const MatchResult& result, const FontCollectorContext& context)
{
    const auto executable = findExecutable(context);
    validateExecutable(executable);
    if (!isMkv(mkvFile)) {
        throw std::runtime_error("The file " + utils::pathToString(mkvFile) + " is not a Matroska file.");
    }

    if (context.deleteFonts) {
        runMkvpropedit(executable, deleteFontsArguments(mkvFile), "deleting the attached fonts", context);
        context.logMessage(LogMsg() << "Deleted the fonts attached to " << utils::pathToString(mkvFile) << ".");
    }

    const auto fonts = result.selectedFonts();
    if (fonts.empty()) {
        context.logMessage(LogMsg() << "No fonts to attach to " << utils::pathToString(mkvFile) << ".");
        return;
    }
    runMkvpropedit(executable, attachFontsArguments(mkvFile, fonts), "attaching fonts", context);
    context.logMessage(LogMsg() << "Attached " << fonts.size() << " fonts to " << utils::pathToString(mkvFile) << ".");
}

} // namespace mkvpropedit
} // namespace fontcollector
