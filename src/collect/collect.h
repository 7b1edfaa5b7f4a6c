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

#include "fontcollector.h"

namespace fontcollector {

struct CollectCommand : public ICommand
{
    using ICommand::ICommand;

    int showHelpPage(const std::string_view& programName, const std::string& indentSpaces = {}) const override;

    bool canProcess(const std::filesystem::path& inputPath) const override;
    CommandInputData processInput(const std::filesystem::path& inputPath, const FontCollectorContext& context) const override;
    void processOutput(const CommandInputData& inputData, const std::string& outputFormat, const std::filesystem::path& outputPath,
                       const std::filesystem::path& inputPath, const FontCollectorContext& context) const override;

    std::optional<std::string_view> defaultInputFormat() const override { return ASS_EXTENSION; }
    std::filesystem::path defaultOutputPath(const std::string& outputFormat, const std::filesystem::path& inputPath) const override;

    const std::string_view commandName() const override { return "collect"; }
};

/// @brief Logs the outcome of resolving one script: the missing families as one warning, and
/// a warning for each selected variable font.
void logMatchResult(const MatchResult& result, const FontCollectorContext& context);

} // namespace fontcollector
