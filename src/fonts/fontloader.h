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

#include <vector>
#include <memory>
#include <filesystem>

#include "fonts/fontdescriptor.h"

namespace fontcollector {

struct FontCollectorContext;

namespace fonts {

/// @brief True for the font file types that are read: ttf, otf, ttc, otc, pfa, pfb.
bool hasSupportedExtension(const std::filesystem::path& filePath);

/**
 * @brief Reads the descriptors of every face in a font file.
 *
 * A face yields one descriptor per distinct family name in its name table. Weight and
 * italic come from the OS/2 table. A face without one is logged and treated as regular.
 * @return the descriptors, or an empty vector if FreeType cannot open the file (logged as a warning).
 */
std::vector<FontDescriptor> loadFontFile(const std::filesystem::path& filePath, const FontCollectorContext& context);

/// @brief The font files installed on this system.
std::vector<std::filesystem::path> systemFontFiles(const FontCollectorContext& context);

/// @brief Every supported font file under @p directory, recursively.
std::vector<std::filesystem::path> fontFilesInDirectory(const std::filesystem::path& directory);

/**
 * @brief Builds the pool that scripts are matched against.
 *
 * Faces from the --additional-fonts paths come first, then the system fonts unless they were
 * disabled. For equal metadata the first face found wins.
 */
std::shared_ptr<const FontPool> buildFontPool(const FontCollectorContext& context);

} // namespace fonts
} // namespace fontcollector
