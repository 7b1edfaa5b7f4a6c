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

#include "ass/style.h"
#include "fonts/fontdescriptor.h"

namespace fontcollector {
namespace fonts {

/// @brief The weight a candidate is compared with. A face more than 150 lighter than the
/// requested weight is treated as 150 heavier, as if the renderer emboldened it, unless more
/// than 850 is requested.
///
/// This approximates renderer bold synthesis on a best-effort basis. It is not known to be
/// exactly what libass does.
int comparisonWeight(const FontDescriptor& candidate, const Style& required);

/**
 * @brief Ranks the faces of @p pool that can render @p required, best first.
 *
 * Only faces of the required family qualify. They are ordered by
 *  - faces with the requested italic flag first,
 *  - then smallest distance between comparison weight and requested weight,
 *  - then lightest comparison weight.
 *
 * Faces that compare equal keep their pool order. The descriptors returned are the pool's
 * own; the comparison weight is never written back.
 * @return the ranked faces, or an empty vector if the family is not in the pool.
 */
std::vector<FontDescriptor> match(const Style& required, const FontPool& pool);

} // namespace fonts
} // namespace fontcollector
