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
#include <string>
#include <vector>

#include "collect/resolver.h"
#include "ass/tagscanner.h"
#include "fonts/fontmatcher.h"
#include "fontcollector.h"

namespace fontcollector {

RequiredStyleSet collectRequiredStyles(const StyleRegistry& styles, const std::vector<ass::DialogueEvent>& events,
                                       const FontCollectorContext& context)
{
    RequiredStyleSet result;
    for (const auto& event : events) {
        const auto style = styles.find(event.styleName);
        if (style == styles.end()) {
            throw unknown_style_error(event.styleName, event.lineNumber);
        }
        result.merge(ass::scanLine(event.text, style->second, context, event.lineNumber));
    }
    return result;
}

MatchResult matchStyles(const RequiredStyleSet& requiredStyles, const fonts::FontPool& pool)
{
    MatchResult result;
    for (const auto& style : requiredStyles) {
        auto candidates = fonts::match(style, pool);
        if (candidates.empty()) {
            result.missing.insert(style.fontFamily);
        } else {
            result.found.emplace(style, std::move(candidates.front()));
        }
    }
    return result;
}

MatchResult resolve(const StyleRegistry& styles, const std::vector<ass::DialogueEvent>& events,
                    const fonts::FontPool& pool, const FontCollectorContext& context)
{
    const auto requiredStyles = collectRequiredStyles(styles, events, context);
    context.logMessage(LogMsg() << requiredStyles.size() << " distinct font styles are used.", LogSeverity::Verbose);
    return matchStyles(requiredStyles, pool);
}

} // namespace fontcollector
