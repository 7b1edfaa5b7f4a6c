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
#include <vector>
#include <unordered_set>
#include <functional>
#include <filesystem>

#include "ass/style.h"

namespace fontcollector {
namespace fonts {

/**
 * @brief One face of a physical font file.
 *
 * Equality and hashing use (family, weight, italic) only: two files with identical metadata
 * satisfy exactly the same requirements, so only one of them is ever needed.
 */
struct FontDescriptor
{
    std::filesystem::path path;
    std::string family;         ///< normalized with #normalizeFontName
    int weight{ FONT_WEIGHT_REGULAR };
    bool italic{};
    bool isVariable{};

    bool operator==(const FontDescriptor& other) const
    {
        return weight == other.weight && italic == other.italic && family == other.family;
    }

    bool operator!=(const FontDescriptor& other) const { return !(*this == other); }
};

struct FontDescriptorHash
{
    std::size_t operator()(const FontDescriptor& value) const
    {
        std::size_t result = std::hash<std::string>()(value.family);
        result ^= std::hash<int>()(value.weight) << 1;
        result ^= std::hash<bool>()(value.italic) << 2;
        return result;
    }
};

/// @brief OS/2 usWeightClass correction: some designers use 1-9 instead of 100-900.
inline int correctWeightClass(int weightClass)
{
    if (weightClass <= 9) {
        return weightClass * 100;
    }
    return weightClass;
}

/**
 * @brief An insertion-ordered, de-duplicated collection of font descriptors.
 *
 * A descriptor equal to one already present is dropped, so the first file found for a
 * given appearance is the one that is used. Iteration order is insertion order, which is
 * the tie-break order of #match.
 */
class FontPool
{
public:
    using const_iterator = std::vector<FontDescriptor>::const_iterator;

    /// @return true if the descriptor was added, false if an equal one was already present.
    bool add(FontDescriptor descriptor)
    {
        if (!m_seen.insert(descriptor).second) {
            return false;
        }
        m_fonts.push_back(std::move(descriptor));
        return true;
    }

    bool contains(const FontDescriptor& descriptor) const { return m_seen.find(descriptor) != m_seen.end(); }

    std::size_t size() const { return m_fonts.size(); }
    bool empty() const { return m_fonts.empty(); }

    const_iterator begin() const { return m_fonts.begin(); }
    const_iterator end() const { return m_fonts.end(); }

private:
    std::vector<FontDescriptor> m_fonts;
    std::unordered_set<FontDescriptor, FontDescriptorHash> m_seen;
};

} // namespace fonts
} // namespace fontcollector
