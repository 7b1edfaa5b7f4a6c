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
#include <map>
#include <optional>
#include <memory>
#include <regex>
#include <algorithm>

#include "fontcollector.h"
#include "collect/collect.h"
#include "utils/stringutils.h"

static const auto registeredCommands = []()
    {
        std::map <std::string, std::shared_ptr <fontcollector::ICommand>> retval;
        auto collectCmd = std::make_shared<fontcollector::CollectCommand>();
        retval.emplace(collectCmd->commandName(), collectCmd);
        return retval;
    }();

static int showHelpPage(const std::string_view& programName)
{
    std::cout << "Usage: " << programName << " <command> <input-pattern> [--options]" << std::endl;
    std::cout << std::endl;

    // General options
    std::cout << "General options:" << std::endl;
    std::cout << "  --exclude-folder folder-name    Exclude the specified folder name from recursive searches" << std::endl;
    std::cout << "  --help                          Show this help message and exit" << std::endl;
    std::cout << "  --force                         Overwrite existing file(s)" << std::endl;
    std::cout << "  --recursive                     Recursively search subdirectories of the input directory" << std::endl;
    std::cout << "  --version                       Show program version and exit" << std::endl;
    std::cout << std::endl;
    std::cout << "By default, if the input is a single file, messages are sent to std::cerr." << std::endl;
    std::cout << "If the input is a multiple files, messages are logged in `" << programName << "-logs` in the top-level input directory." << std::endl;
    std::cout << std::endl;
    std::cout << "Logging options:" << std::endl;
    std::cout << "  --log [optional-logfile-path]   Always log messages instead of sending them to std::cerr" << std::endl;
    std::cout << "  --no-log                        Always send messages to std::cerr (overrides any other logging options)" << std::endl;
    std::cout << "  --verbose                       Verbose output" << std::endl;
    std::cout << std::endl;
    std::cout << "Any relative path is relative to the parent path of the input file or (for log files) to the top-level input folder.";
    std::cout << std::endl;

    for (const auto& command : registeredCommands) {
        std::string commandStr = "Command " + command.first;
        std::string sepStr(commandStr.size(), '=');
        std::cout << std::endl;
        std::cout << sepStr << std::endl;
        std::cout << commandStr << std::endl;
        std::cout << sepStr << std::endl;
        std::cout << std::endl;
        command.second->showHelpPage(programName, "    ");
    }
    return 1;
}

using namespace fontcollector;

int FONTCOLLECTOR_MAIN(int argc, char* argv[])
{
    if (argc <= 0) {
        std::cerr << "Error: argv[0] is unavailable" << std::endl;
        return 1;
    }

    FontCollectorContext context(utils::pathToString(std::filesystem::path(*argv).stem()));

    if (argc < 2) {
        return showHelpPage(context.programName);
    }

    std::vector<const char*> args = context.parseOptions(argc, argv);

    if (context.showVersion) {
        std::cout << context.programName << " " << FONTCOLLECTOR_VERSION << std::endl;
        return 0;
    }
    if (context.showHelp) {
        showHelpPage(context.programName);
        return 0;
    }
    if (args.size() < 2) {
        std::cerr << "Not enough arguments passed" << std::endl;
        return showHelpPage(context.programName);
    }

    const auto currentCommand = [args]() -> std::shared_ptr<ICommand> {
            auto it = registeredCommands.find(std::string(args[0]));
            if (it != registeredCommands.end()) {
                return it->second;
            } else {
                std::cerr << "Unknown command: " << args[0] << std::endl;
                return nullptr;
            }
        }();
    if (!currentCommand) {
        return showHelpPage(context.programName);
    }

    try {
        const std::filesystem::path rawInputPattern = utils::utf8ToPath(args[1]);
        std::filesystem::path inputFilePattern = rawInputPattern;

        // collect inputs
        const std::string patternString = utils::pathToString(inputFilePattern);
        const bool isSpecificFileOrDirectory = patternString.find('*') == std::string::npos && patternString.find('?') == std::string::npos;
        if (std::filesystem::is_directory(inputFilePattern)) {
            if (currentCommand->defaultInputFormat().has_value()) {
                inputFilePattern /= "*." + std::string(currentCommand->defaultInputFormat().value());
            } else {
                inputFilePattern /= ""; // assure parent_path returns inputFilePattern
            }
        }
        std::filesystem::path inputDir = inputFilePattern.parent_path();
        if (inputDir.empty()) {
            inputDir = ".";
        }
        if (isSpecificFileOrDirectory && !std::filesystem::exists(rawInputPattern)) {
            throw std::runtime_error("Input path " + utils::pathToString(inputFilePattern) + " does not exist or is not a file or directory.");
        }

        bool inputIsOneFile = std::filesystem::is_regular_file(inputFilePattern);
        if (!inputIsOneFile && !context.logFilePath.has_value()) {
            context.logFilePath = "";
        }
        context.startLogging(inputDir, argc, argv);

        // convert wildcard pattern to regex
        auto wildcardPattern = utils::pathToString(inputFilePattern.filename());
        auto regexPattern = std::regex_replace(wildcardPattern, std::regex(R"(\.)"), R"(\.)");
        regexPattern = std::regex_replace(regexPattern, std::regex(R"(\*)"), R"(.*)");
        regexPattern = std::regex_replace(regexPattern, std::regex(R"(\?)"), R"(.)");
        std::regex regex(regexPattern.empty() ? std::string(".*") : regexPattern);

        // collect files to process first
        std::vector<std::filesystem::path> pathsToProcess;
        auto iterate = [&](auto& iterator) {
            for (auto it = iterator; it != std::filesystem::end(iterator); ++it) {
                const auto& entry = *it;
                if constexpr (std::is_same_v<std::remove_reference_t<decltype(iterator)>, std::filesystem::recursive_directory_iterator>) {
                    if (entry.is_directory()) {
                        if (entry.path().filename() == context.excludeFolder) {
                            it.disable_recursion_pending(); // Skip this folder and its subdirectories
                            continue;
                        }
                    }
                }
                if (!entry.is_directory()) {
                    context.logMessage(LogMsg() << "considered file " << utils::pathToString(entry.path()), LogSeverity::Verbose);
                }
                if (entry.is_regular_file() && std::regex_match(utils::pathToString(entry.path().filename()), regex)) {
                    auto inputFilePath = entry.path();
                    if (currentCommand->canProcess(inputFilePath)) {
                        pathsToProcess.push_back(inputFilePath);
                    }
                }
            }
        };
        if (inputIsOneFile) {
            if (currentCommand->canProcess(inputFilePattern)) {
                pathsToProcess.push_back(inputFilePattern);
            } else {
                context.logMessage(LogMsg() << "Invalid input format.", LogSeverity::Error);
                showHelpPage(context.programName);
            }
        } else if (context.recursiveSearch) {
            std::filesystem::recursive_directory_iterator it(inputDir);
            iterate(it);
        } else {
            std::filesystem::directory_iterator it(inputDir);
            iterate(it);
        }
        std::sort(pathsToProcess.begin(), pathsToProcess.end());
        for (const auto& path : pathsToProcess) {
            context.inputFilePath = "";
            processFile(currentCommand, path, args, context);
        }
    }
    catch (const std::exception& e) {
        context.logMessage(LogMsg() << e.what(), LogSeverity::Error);
    }

    context.endLogging();

    return context.errorOccurred;
}
