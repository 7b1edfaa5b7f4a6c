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
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <string>
#include <vector>

#include "fontcollector.h"
#include "fonts/fontloader.h"
#include "utils/stringutils.h"

namespace fontcollector {

std::vector<const char*> FontCollectorContext::parseOptions(int argc, char* argv[])
{
    std::vector<const char*> args;
    for (int x = 1; x < argc; x++) {
        auto getNextArg = [&]() -> std::string_view {
                if (x + 1 < argc) {
                    std::string_view arg(argv[x + 1]);
                    if (x < (argc - 1) && arg.rfind("--", 0) != 0) {
                        x++;
                        return arg;
                    }
                }
                return {};
            };
        const std::string_view next(argv[x]);
        if (next == "--version") {
            showVersion = true;
        } else if (next == "--help") {
            showHelp = true;
        } else if (next == "--force") {
            overwriteExisting = true;
        } else if (next == "--log") {
            logFilePath = getNextArg();
        } else if (next == "--no-log") {
            noLog = true;
        } else if (next == "--recursive") {
            recursiveSearch = true;
        } else if (next == "--exclude-folder") {
            auto option = getNextArg();
            if (!option.empty()) {
                excludeFolder = option;
            }
        } else if (next == "--verbose") {
            verbose = true;
        // Specific options for `collect` command
        } else if (next == "--additional-fonts") {
            auto option = getNextArg();
            if (!option.empty()) {
                additionalFonts.emplace_back(option);
            }
        } else if (next == "--no-system-fonts") {
            useSystemFonts = false;
        } else if (next == "--delete-fonts") {
            deleteFonts = true;
        } else if (next == "--mkvpropedit") {
            auto option = getNextArg();
            if (!option.empty()) {
                mkvpropeditPath = option;
            }
        } else if (next == "--pretty-print") {
            auto option = std::string(getNextArg());
            indentSpaces = JSON_INDENT_SPACES;
            if (!option.empty()) {
                try {
                    indentSpaces = std::stoi(option);
                } catch (const std::exception&) {
                    std::cerr << "Invalid value for --pretty-print: " << option << ". Using " << JSON_INDENT_SPACES << "." << std::endl;
                }
            }
        } else if (next == "--no-pretty-print") {
            indentSpaces = std::nullopt;
        } else {
            args.push_back(argv[x]);
        }
    }
    return args;
}

std::string getTimeStamp(const std::string& fmt)
{
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm localTime;
#ifdef _WIN32
    localtime_s(&localTime, &time_t_now); // Windows
#else
    localtime_r(&time_t_now, &localTime); // Linux/Unix
#endif
    std::ostringstream timestamp;
    timestamp << std::put_time(&localTime, fmt.c_str());
    return timestamp.str();
}

void FontCollectorContext::logMessage(LogMsg&& msg, LogSeverity severity) const
{
    auto getSeverityStr = [severity]() -> std::string {
            switch (severity) {
            default:
            case LogSeverity::Info: return "";
            case LogSeverity::Warning: return "[WARNING] ";
            case LogSeverity::Error: return "[***ERROR***] ";
            }
        };
    if (severity == LogSeverity::Verbose && !verbose) {
        return;
    }
    if (severity == LogSeverity::Error) {
        errorOccurred = true;
    }
    msg.flush();
    std::string inputFile = utils::pathToString(inputFilePath.filename());
    if (!inputFile.empty()) {
        inputFile += ' ';
    }
    if (logFile && logFile->is_open()) {
        LogMsg prefix = LogMsg() << "[" << getTimeStamp("%Y-%m-%d %H:%M:%S") << "] " << inputFile;
        prefix.flush();
        *logFile << prefix.str() << getSeverityStr() << msg.str() << std::endl;
        if (severity == LogSeverity::Error) {
            *logFile << prefix.str() << "PROCESSING ABORTED" << std::endl;
        }
        if (severity != LogSeverity::Error) {
            return;
        }
    }
    std::cerr << getSeverityStr() << msg.str() << std::endl;
}

bool FontCollectorContext::validatePathsAndOptions(const std::filesystem::path& outputFilePath) const
{
    if (inputFilePath == outputFilePath) {
        logMessage(LogMsg() << utils::pathToString(outputFilePath) << ": " << "Input and output are the same. No action taken.");
        return false;
    }

    if (std::filesystem::exists(outputFilePath)) {
        if (overwriteExisting) {
            logMessage(LogMsg() << "Overwriting " << utils::pathToString(outputFilePath));
        } else {
            logMessage(LogMsg() << utils::pathToString(outputFilePath) << " exists. Use --force to overwrite it.");
            return false;
        }
    } else {
        logMessage(LogMsg() << "Output: " << utils::pathToString(outputFilePath));
    }

    return true;
}

const fonts::FontPool& FontCollectorContext::getFontPool() const
{
    if (!fontPool) {
        fontPool = fonts::buildFontPool(*this);
    }
    return *fontPool;
}

/** returns true if input path is a directory */
bool createDirectoryIfNeeded(const std::filesystem::path& path)
{
    std::error_code ec;
    const bool exists = std::filesystem::exists(path, ec);
    if (!exists && path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    if (std::filesystem::is_directory(path, ec) || (!exists && !path.has_extension())) {
        std::filesystem::create_directories(path);
        return true;
    }
    return false;
}

void FontCollectorContext::startLogging(const std::filesystem::path& defaultLogPath, int argc, char* argv[])
{
    if (!noLog && logFilePath.has_value() && !logFile) {
        auto& path = logFilePath.value();
        if (path.empty()) {
            path = defaultLogPath / (programName + "-logs");
        } else if (path.is_relative()) {
            path = defaultLogPath / path;
        }
        if (createDirectoryIfNeeded(path)) {
            std::string logFileName = programName + "-" + getTimeStamp("%Y%m%d-%H%M%S") + ".log";
            path /= logFileName;
        }
        bool appending = std::filesystem::is_regular_file(path);
        logFile = std::make_shared<std::ofstream>();
        logFile->exceptions(std::ios::failbit | std::ios::badbit);
        logFile->open(path, std::ios::app);
        if (appending) {
            *logFile << std::endl;
        }
        logMessage(LogMsg() << "======= START =======");
        logMessage(LogMsg() << programName << " executed with the following arguments:");
        LogMsg args;
        args << programName << " ";
        for (int i = 1; i < argc; i++) {
            args << std::string(argv[i]) << " ";
        }
        logMessage(std::move(args));
    }
}

void FontCollectorContext::endLogging()
{
    if (!noLog && logFilePath.has_value() && logFile) {
        inputFilePath = "";
        logMessage(LogMsg());
        logMessage(LogMsg() << programName << " processing complete");
        logMessage(LogMsg() << "======== END ========");
        logFile.reset();
    }
}

bool processFile(const std::shared_ptr<ICommand>& currentCommand, const std::filesystem::path& inputFilePath,
                 const std::vector<const char*>& args, FontCollectorContext& context)
{
    try {
        if (!std::filesystem::is_regular_file(inputFilePath)) {
            throw std::runtime_error("Input file " + utils::pathToString(inputFilePath) + " does not exist or is not a file.");
        }
        constexpr char kProcessingMessage[] = "Processing File: ";
        constexpr size_t kProcessingMessageSize = sizeof(kProcessingMessage) - 1; // account for null terminator.
        std::string delimiter(kProcessingMessageSize + inputFilePath.u32string().size(), '='); // use u32string().size to get actual number of characters displayed
        // log header for each file
        context.logMessage(LogMsg());
        context.logMessage(LogMsg() << delimiter);
        context.logMessage(LogMsg() << kProcessingMessage << utils::pathToString(inputFilePath));
        context.logMessage(LogMsg() << delimiter);
        context.inputFilePath = inputFilePath; // assign after logging the header

        const auto inputData = currentCommand->processInput(inputFilePath, context);

        // Process output options
        for (size_t i = 0; i < args.size(); ++i) {
            std::string option = args[i];
            if (option.rfind("--", 0) == 0) {  // Options start with "--"
                const std::string outputFormat = option.substr(2);
                std::filesystem::path outputPath;
                if (i + 1 < args.size() && std::string(args[i + 1]).rfind("--", 0) != 0) {
                    outputPath = utils::utf8ToPath(args[++i]);
                    if (outputPath.is_relative()) {
                        outputPath = inputFilePath.parent_path() / outputPath;
                    }
                } else {
                    outputPath = currentCommand->defaultOutputPath(outputFormat, inputFilePath);
                }
                currentCommand->processOutput(inputData, outputFormat, outputPath, inputFilePath, context);
            }
        }
        return true;
    } catch (const std::exception& e) {
        context.logMessage(LogMsg() << e.what(), LogSeverity::Error);
    }

    return false;
}

} // namespace fontcollector
