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
#include <vector>
#include <algorithm>
#include <cstdlib>

#include "fonts/fontmatcher.h"

namespace fontcollector {
namespace fonts {

namespace {

constexpr int kSyntheticBoldGain = 150;
constexpr int kSyntheticBoldMaxRequest = 850;

struct RankedFace
{
    const FontDescriptor* descriptor;
    bool italicMismatch;
    int weightDistance;
    int weight;
};

} // namespace

int comparisonWeight(const FontDescriptor& candidate, const Style& required)
{
    if (candidate.weight < required.weight - kSyntheticBoldGain && required.weight <= kSyntheticBoldMaxRequest) {
        return candidate.weight + kSyntheticBoldGain;
    }
    return candidate.weight;
}

std::vector<FontDescriptor> match(const Style& required, const FontPool& pool)
{
    std::vector<RankedFace> ranked;
    for (const auto& candidate : pool) {
        if (candidate.family != required.fontFamily) {
            continue;
        }
        const int weight = comparisonWeight(candidate, required);
        ranked.push_back(RankedFace{ &candidate, candidate.italic != required.italic, std::abs(required.weight - weight), weight });
    }

    std::stable_sort(ranked.begin(), ranked.end(), [](const RankedFace& a, const RankedFace& b) {
        if (a.italicMismatch != b.italicMismatch) {
            return !a.italicMismatch;
        }
        if (a.weightDistance != b.weightDistance) {
            return a.weightDistance < b.weightDistance;
        }
        return a.weight < b.weight;
    });

    std::vector<FontDescriptor> result;
    result.reserve(ranked.size());
    for (const auto& face : ranked) {
        result.push_back(*face.descriptor);
    }
    return result;
}

} // namespace fonts
} // namespace fontcollector
