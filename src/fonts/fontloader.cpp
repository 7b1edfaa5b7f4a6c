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
#include "fonts/fontloader.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "fontcollector.h"
#include "utils/stringutils.h"

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_SFNT_NAMES_H
#include FT_TRUETYPE_IDS_H
#include FT_TRUETYPE_TABLES_H

#if defined(FONTCOLLECTOR_USE_FONTCONFIG)
#include <fontconfig/fontconfig.h>
#endif

namespace fontcollector {
namespace fonts {

namespace {

constexpr FT_UShort kFamilyNameId = 1;

class FreeTypeLibrary
{
public:
    FreeTypeLibrary()
    {
        if (FT_Init_FreeType(&m_library) != 0) {
            m_library = nullptr;
            throw std::runtime_error("Unable to initialize the FreeType library.");
        }
    }

    ~FreeTypeLibrary()
    {
        if (m_library) {
            FT_Done_FreeType(m_library);
        }
    }

    FreeTypeLibrary(const FreeTypeLibrary&) = delete;
    FreeTypeLibrary& operator=(const FreeTypeLibrary&) = delete;

    FT_Library get() const { return m_library; }

private:
    FT_Library m_library{};
};

class ScopedFace
{
public:
    ScopedFace(FT_Library library, const std::filesystem::path& filePath, FT_Long faceIndex)
    {
        if (FT_New_Face(library, utils::pathToString(filePath).c_str(), faceIndex, &m_face) != 0) {
            m_face = nullptr;
        }
    }

    ~ScopedFace()
    {
        if (m_face) {
            FT_Done_Face(m_face);
        }
    }

    ScopedFace(const ScopedFace&) = delete;
    ScopedFace& operator=(const ScopedFace&) = delete;

    FT_Face get() const { return m_face; }
    explicit operator bool() const { return m_face != nullptr; }

private:
    FT_Face m_face{};
};

std::optional<std::string> decodeNameRecord(const FT_SfntName& record)
{
    const bool isWindowsUnicode = record.platform_id == TT_PLATFORM_MICROSOFT
        && (record.encoding_id == TT_MS_ID_SYMBOL_CS || record.encoding_id == TT_MS_ID_UNICODE_CS || record.encoding_id == TT_MS_ID_UCS_4);
    if (isWindowsUnicode || record.platform_id == TT_PLATFORM_APPLE_UNICODE) {
        return utils::utf16BEToUtf8(record.string, record.string_len);
    }
    if (record.platform_id == TT_PLATFORM_MACINTOSH && record.encoding_id == TT_MAC_ID_ROMAN) {
        // only the ASCII subset of Mac Roman is taken as is
        const bool isAscii = std::all_of(record.string, record.string + record.string_len, [](FT_Byte c) { return c < 0x80; });
        if (isAscii) {
            return std::string(reinterpret_cast<const char*>(record.string), record.string_len);
        }
    }
    return std::nullopt;
}

std::vector<std::string> familyNames(FT_Face face, const std::filesystem::path& filePath)
{
    std::vector<std::string> result;
    auto append = [&result](const std::string& name) {
        std::string normalized = normalizeFontName(name);
        if (!normalized.empty() && std::find(result.begin(), result.end(), normalized) == result.end()) {
            result.push_back(std::move(normalized));
        }
    };

    if (FT_IS_SFNT(face)) {
        const FT_UInt count = FT_Get_Sfnt_Name_Count(face);
        for (FT_UInt i = 0; i < count; i++) {
            FT_SfntName record{};
            if (FT_Get_Sfnt_Name(face, i, &record) != 0 || record.name_id != kFamilyNameId) {
                continue;
            }
            if (auto name = decodeNameRecord(record)) {
                append(*name);
            }
        }
    }
    if (result.empty()) {
        append(face->family_name ? std::string(face->family_name) : utils::pathToString(filePath.stem()));
    }
    return result;
}

std::vector<FontDescriptor> loadFace(FT_Library library, const std::filesystem::path& filePath, FT_Long faceIndex,
                                     const FontCollectorContext& context)
{
    ScopedFace face(library, filePath, faceIndex);
    if (!face) {
        return {};
    }

    FontDescriptor prototype;
    prototype.path = filePath;
    prototype.isVariable = FT_HAS_MULTIPLE_MASTERS(face.get());

    const auto* os2 = static_cast<const TT_OS2*>(FT_Get_Sfnt_Table(face.get(), FT_SFNT_OS2));
    if (os2 && os2->version != 0xFFFF) {
        prototype.weight = correctWeightClass(os2->usWeightClass);
        prototype.italic = (os2->fsSelection & 0x1) != 0;
    } else if (FT_IS_SFNT(face.get())) {
        context.logMessage(LogMsg() << "The file \"" << utils::pathToString(filePath)
                                    << "\" does not have an OS/2 table. It is treated as regular weight and not italic.",
                           LogSeverity::Warning);
    } else {
        prototype.weight = (face.get()->style_flags & FT_STYLE_FLAG_BOLD) ? FONT_WEIGHT_BOLD : FONT_WEIGHT_REGULAR;
        prototype.italic = (face.get()->style_flags & FT_STYLE_FLAG_ITALIC) != 0;
    }

    std::vector<FontDescriptor> result;
    for (auto& family : familyNames(face.get(), filePath)) {
        FontDescriptor descriptor = prototype;
        descriptor.family = std::move(family);
        result.push_back(std::move(descriptor));
    }
    return result;
}

std::vector<FontDescriptor> loadFontFileWith(FT_Library library, const std::filesystem::path& filePath,
                                             const FontCollectorContext& context, LogSeverity failureSeverity)
{
    long numFaces = 0;
    {
        ScopedFace probeFace(library, filePath, 0);
        if (!probeFace) {
            context.logMessage(LogMsg() << "Unable to read font file \"" << utils::pathToString(filePath) << "\".", failureSeverity);
            return {};
        }
        numFaces = (std::max)(1L, static_cast<long>(probeFace.get()->num_faces));
    }

    std::vector<FontDescriptor> result;
    for (long faceIndex = 0; faceIndex < numFaces; ++faceIndex) {
        auto faces = loadFace(library, filePath, faceIndex, context);
        result.insert(result.end(), std::make_move_iterator(faces.begin()), std::make_move_iterator(faces.end()));
    }
    return result;
}

#if !defined(FONTCOLLECTOR_USE_FONTCONFIG)
std::vector<std::filesystem::path> candidateFontDirectories()
{
    std::vector<std::filesystem::path> dirs;
    auto append = [&](const std::filesystem::path& path) {
        std::error_code ec;
        if (!path.empty() && std::filesystem::is_directory(path, ec)) {
            dirs.push_back(path);
        }
    };

#if defined(__APPLE__)
    append("/System/Library/Fonts");
    append("/Library/Fonts");
    if (const auto home = utils::getEnvironmentValue("HOME")) {
        append(std::filesystem::path(*home) / "Library/Fonts");
    }
#elif defined(_WIN32)
    if (const auto windir = utils::getEnvironmentValue("WINDIR")) {
        append(std::filesystem::path(*windir) / "Fonts");
    }
    if (const auto localAppData = utils::getEnvironmentValue("LOCALAPPDATA")) {
        append(std::filesystem::path(*localAppData) / "Microsoft/Windows/Fonts");
    }
#else
    append("/usr/share/fonts");
    append("/usr/local/share/fonts");
    if (const auto home = utils::getEnvironmentValue("HOME")) {
        append(std::filesystem::path(*home) / ".local/share/fonts");
        append(std::filesystem::path(*home) / ".fonts");
    }
#endif
    return dirs;
}
#endif

} // namespace

bool hasSupportedExtension(const std::filesystem::path& filePath)
{
    for (const char* extension : { "ttf", "otf", "ttc", "otc", "pfa", "pfb" }) {
        if (utils::pathExtensionEquals(filePath, extension)) {
            return true;
        }
    }
    return false;
}

std::vector<FontDescriptor> loadFontFile(const std::filesystem::path& filePath, const FontCollectorContext& context)
{
    FreeTypeLibrary library;
    return loadFontFileWith(library.get(), filePath, context, LogSeverity::Warning);
}

std::vector<std::filesystem::path> fontFilesInDirectory(const std::filesystem::path& directory)
{
    std::vector<std::filesystem::path> result;
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(directory, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        return result;
    }
    for (const auto& entry : it) {
        if (entry.is_regular_file(ec) && hasSupportedExtension(entry.path())) {
            result.push_back(entry.path());
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<std::filesystem::path> systemFontFiles([[maybe_unused]] const FontCollectorContext& context)
{
    std::vector<std::filesystem::path> result;
#if defined(FONTCOLLECTOR_USE_FONTCONFIG)
    if (FcInit() == FcFalse) {
        context.logMessage(LogMsg() << "Unable to initialize fontconfig. System fonts are not searched.", LogSeverity::Warning);
        return result;
    }
    FcPattern* pattern = FcPatternCreate();
    FcObjectSet* objects = FcObjectSetBuild(FC_FILE, static_cast<char*>(nullptr));
    FcFontSet* fontSet = (pattern && objects) ? FcFontList(nullptr, pattern, objects) : nullptr;
    if (fontSet) {
        std::set<std::string> seen;
        for (int i = 0; i < fontSet->nfont; i++) {
            FcChar8* file = nullptr;
            if (FcPatternGetString(fontSet->fonts[i], FC_FILE, 0, &file) != FcResultMatch || !file) {
                continue;
            }
            const std::string fileName(reinterpret_cast<const char*>(file));
            // collections are listed once per face
            if (seen.insert(fileName).second && hasSupportedExtension(utils::utf8ToPath(fileName))) {
                result.push_back(utils::utf8ToPath(fileName));
            }
        }
        FcFontSetDestroy(fontSet);
    }
    if (objects) {
        FcObjectSetDestroy(objects);
    }
    if (pattern) {
        FcPatternDestroy(pattern);
    }
    std::sort(result.begin(), result.end());
#else
    std::set<std::filesystem::path> seen;
    for (const auto& dir : candidateFontDirectories()) {
        for (auto& file : fontFilesInDirectory(dir)) {
            if (seen.insert(file.lexically_normal()).second) {
                result.push_back(std::move(file));
            }
        }
    }
#endif
    return result;
}

std::shared_ptr<const FontPool> buildFontPool(const FontCollectorContext& context)
{
    FreeTypeLibrary library;
    auto pool = std::make_shared<FontPool>();
    std::size_t fileCount = 0;
    auto addFile = [&](const std::filesystem::path& filePath, LogSeverity failureSeverity) {
        fileCount++;
        for (auto& descriptor : loadFontFileWith(library.get(), filePath, context, failureSeverity)) {
            pool->add(std::move(descriptor));
        }
    };

    for (const auto& additional : context.additionalFonts) {
        std::error_code ec;
        if (std::filesystem::is_directory(additional, ec)) {
            for (const auto& filePath : fontFilesInDirectory(additional)) {
                addFile(filePath, LogSeverity::Warning);
            }
        } else if (std::filesystem::is_regular_file(additional, ec)) {
            addFile(additional, LogSeverity::Warning);
        } else {
            context.logMessage(LogMsg() << "Additional font path " << utils::pathToString(additional) << " does not exist.", LogSeverity::Warning);
        }
    }
    if (context.useSystemFonts) {
        for (const auto& filePath : systemFontFiles(context)) {
            addFile(filePath, LogSeverity::Verbose);
        }
    }

    context.logMessage(LogMsg() << "Loaded " << pool->size() << " font faces from " << fileCount << " files.", LogSeverity::Verbose);
    return pool;
}

} // namespace fonts
} // namespace fontcollector
