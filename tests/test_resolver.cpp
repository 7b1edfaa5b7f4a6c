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

#include "gtest/gtest.h"
#include "collect/resolver.h"
#include "test_utils.h"

using namespace fontcollector;

static fonts::FontDescriptor makeFont(const std::string& fileName, const std::string& family, int weight, bool italic = false)
{
    fonts::FontDescriptor result;
    result.path = fileName;
    result.family = normalizeFontName(family);
    result.weight = weight;
    result.italic = italic;
    return result;
}

TEST(Resolver, SingleLineExample)
{
    FontCollectorContext context(FONTCOLLECTOR_NAME);
    StyleRegistry styles{ { "Default", Style{ "arial", 400, false } } };
    std::vector<ass::DialogueEvent> events{ { "Default", "{\\b1}Hello{\\i1} World", 1 } };

    fonts::FontPool pool;
    pool.add(makeFont("arial.ttf", "Arial", 400));
    pool.add(makeFont("arialbd.ttf", "Arial", 700));

    auto result = resolve(styles, events, pool, context);
    ASSERT_EQ(result.found.size(), 2);
    EXPECT_TRUE(result.missing.empty());
    EXPECT_EQ(utils::pathToString(result.found.at(Style{ "arial", 700, false }).path), "arialbd.ttf");
    EXPECT_EQ(utils::pathToString(result.found.at(Style{ "arial", 700, true }).path), "arialbd.ttf") << "no italic face, closest weight wins";
    EXPECT_EQ(result.found.count(Style{ "arial", 400, false }), 0) << "base style is never visible";

    auto selected = result.selectedFonts();
    ASSERT_EQ(selected.size(), 1);
    EXPECT_EQ(utils::pathToString(selected[0].path), "arialbd.ttf");
}

TEST(Resolver, ItalicFaceBeatsCloserWeight)
{
    FontCollectorContext context(FONTCOLLECTOR_NAME);
    StyleRegistry styles{ { "Default", Style{ "arial", 400, false } } };
    std::vector<ass::DialogueEvent> events{ { "Default", "{\\b1}Hello{\\i1} World", 1 } };

    fonts::FontPool pool;
    pool.add(makeFont("arialbd.ttf", "Arial", 700));
    pool.add(makeFont("ariali.ttf", "Arial", 400, true));

    auto result = resolve(styles, events, pool, context);
    ASSERT_EQ(result.found.size(), 2);
    EXPECT_TRUE(result.missing.empty());
    EXPECT_EQ(utils::pathToString(result.found.at(Style{ "arial", 700, false }).path), "arialbd.ttf");
    EXPECT_EQ(utils::pathToString(result.found.at(Style{ "arial", 700, true }).path), "ariali.ttf");

    auto selected = result.selectedFonts();
    ASSERT_EQ(selected.size(), 2);
    EXPECT_EQ(utils::pathToString(selected[0].path), "arialbd.ttf");
    EXPECT_EQ(utils::pathToString(selected[1].path), "ariali.ttf");
}

TEST(Resolver, FoundAndMissingPartition)
{
    FontCollectorContext context(FONTCOLLECTOR_NAME);
    StyleRegistry styles{
        { "Default", Style{ "arial", 400, false } },
        { "Sign", Style{ "impact", 700, false } },
    };
    std::vector<ass::DialogueEvent> events{
        { "Default", "plain", 1 },
        { "Sign", "sign{\\i1}italic sign", 2 },
        { "Default", "{\\fnComic Sans MS}fun", 3 },
    };

    fonts::FontPool pool;
    pool.add(makeFont("arial.ttf", "Arial", 400));

    auto result = resolve(styles, events, pool, context);
    EXPECT_EQ(result.found.size(), 1);
    EXPECT_EQ(result.missing, (std::set<std::string>{ "comic sans ms", "impact" })) << "one entry per family";

    const auto required = collectRequiredStyles(styles, events, context);
    EXPECT_EQ(required.size(), result.found.size() + 3) << "every required style is found or has its family missing";
}

TEST(Resolver, UnknownStyle)
{
    FontCollectorContext context(FONTCOLLECTOR_NAME);
    StyleRegistry styles{ { "Default", Style{ "arial", 400, false } } };
    std::vector<ass::DialogueEvent> events{
        { "Default", "fine", 4 },
        { "Nope", "broken", 7 },
    };
    fonts::FontPool pool;
    try {
        resolve(styles, events, pool, context);
        FAIL() << "unknown style must throw";
    } catch (const unknown_style_error& ex) {
        EXPECT_EQ(ex.styleName(), "Nope");
        EXPECT_EQ(ex.lineNumber(), 7);
        EXPECT_NE(std::string(ex.what()).find("line 7"), std::string::npos);
    }
}

TEST(Resolver, StyleNamesAreCaseSensitive)
{
    FontCollectorContext context(FONTCOLLECTOR_NAME);
    StyleRegistry styles{ { "Default", Style{ "arial", 400, false } } };
    std::vector<ass::DialogueEvent> events{ { "default", "text", 3 } };
    EXPECT_THROW(collectRequiredStyles(styles, events, context), unknown_style_error);
}

TEST(Resolver, EmptyInputs)
{
    FontCollectorContext context(FONTCOLLECTOR_NAME);
    fonts::FontPool pool;
    auto result = resolve({}, {}, pool, context);
    EXPECT_TRUE(result.found.empty());
    EXPECT_TRUE(result.missing.empty());
    EXPECT_TRUE(result.selectedFonts().empty());
}
