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
#include <sstream>
#include <vector>
#include <optional>
#include <memory>
#include <fstream>
#include <filesystem>
#include <stdexcept>

#include "collect/matchresult.h"
#include "utils/stringutils.h"

inline constexpr char ASS_EXTENSION[]   = "ass";
inline constexpr char SSA_EXTENSION[]   = "ssa";
inline constexpr char JSON_EXTENSION[]  = "json";
inline constexpr char MKV_EXTENSION[]   = "mkv";
inline constexpr char FONTS_OUTPUT[]    = "fonts";

inline constexpr int JSON_INDENT_SPACES = 4;

#define FONTCOLLECTOR_MAIN main

namespace fontcollector {

namespace fonts {
class FontPool;
}

using LogMsg = std::stringstream;

/// @brief The result of reading and resolving one input file, handed to each output processor.
using CommandInputData = MatchResult;

// Function to find the appropriate processor
template <typename Processors>
inline decltype(Processors::value_type::processor) findProcessor(const Processors& processors, const std::string& format)
{
    std::string key = utils::toLowerCase(format);
    if (key.rfind(".", 0) == 0) {
        key = key.substr(1);
    }
    for (const auto& p : processors) {
        if (key == p.format) {
            return p.processor;
        }
    }
    throw std::invalid_argument("Unsupported format: " + key);
}

/// @brief defines log message severity
enum class LogSeverity
{
    Info,       ///< No error. The message is for information.
    Warning,    ///< An event has occurred that may affect the result, but processing of output continues.
    Error,      ///< Processing of the current file has aborted. This level usually occurs in catch blocks.
    Verbose     ///< Only emit if --verbose option specified. The message is for information.
};

class ICommand;
struct FontCollectorContext
{
public:
    FontCollectorContext(const std::string& progName)
        : programName(progName)
    {
    }

    mutable bool errorOccurred{};

    std::string programName;
    bool showVersion{};
    bool showHelp{};
    bool overwriteExisting{};
    bool recursiveSearch{};
    bool noLog{};
    bool verbose{};
    std::optional<std::filesystem::path> excludeFolder;
    std::optional<std::filesystem::path> logFilePath;
    std::shared_ptr<std::ofstream> logFile;
    std::filesystem::path inputFilePath;

    // Specific options for `collect` command
    bool useSystemFonts{ true };
    std::vector<std::filesystem::path> additionalFonts;
    bool deleteFonts{};
    std::optional<std::filesystem::path> mkvpropeditPath;
    std::optional<int> indentSpaces{ JSON_INDENT_SPACES };

    /// The pool every input file is matched against. Built on first use by #getFontPool
    /// unless it has been supplied already.
    mutable std::shared_ptr<const fonts::FontPool> fontPool;

    // Parse general options and return remaining options
    std::vector<const char*> parseOptions(int argc, char* argv[]);

    // validate paths
    bool validatePathsAndOptions(const std::filesystem::path& outputFilePath) const;

    const fonts::FontPool& getFontPool() const;

    // Logging methods
    void startLogging(const std::filesystem::path& defaultLogPath, int argc, char* argv[]); ///< Starts logging if logging was requested

    /**
     * @brief logs a message using the log file or outputs to std::cerr
     * @param msg a utf-8 encoded message.
     * @param severity the message severity
    */
    void logMessage(LogMsg&& msg, LogSeverity severity = LogSeverity::Info) const;

    void endLogging(); ///< Ends logging if logging was requested
};

class ICommand
{
public:
    ICommand() = default;
    virtual ~ICommand() = default;

    virtual int showHelpPage(const std::string_view& programName, const std::string& indentSpaces = {}) const = 0;

    virtual bool canProcess(const std::filesystem::path& inputPath) const = 0;
    virtual CommandInputData processInput(const std::filesystem::path& inputPath, const FontCollectorContext& context) const = 0;
    virtual void processOutput(const CommandInputData& inputData, const std::string& outputFormat, const std::filesystem::path& outputPath,
                               const std::filesystem::path& inputPath, const FontCollectorContext& context) const = 0;
    virtual std::optional<std::string_view> defaultInputFormat() const { return std::nullopt; }
    /// @brief The output path used when an output option is given without a path.
    virtual std::filesystem::path defaultOutputPath(const std::string& outputFormat, const std::filesystem::path& inputPath) const = 0;

    virtual const std::string_view commandName() const = 0;
};

std::string getTimeStamp(const std::string& fmt);

bool createDirectoryIfNeeded(const std::filesystem::path& path);

bool processFile(const std::shared_ptr<ICommand>& currentCommand, const std::filesystem::path& inputFilePath,
                 const std::vector<const char*>& args, FontCollectorContext& context);

} // namespace fontcollector

#ifdef FONTCOLLECTOR_TEST // this is defined on the command line by the test program
#undef FONTCOLLECTOR_MAIN
#define FONTCOLLECTOR_MAIN fontcollectorTestMain
int fontcollectorTestMain(int argc, char* argv[]);
#ifdef FONTCOLLECTOR_VERSION
#undef FONTCOLLECTOR_VERSION
#define FONTCOLLECTOR_VERSION "TEST"
#endif
#endif
