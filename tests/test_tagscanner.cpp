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
#include "fontcollector.h"
#include "ass/tagscanner.h"
#include "test_utils.h"

using namespace fontcollector;
using namespace fontcollector::ass;

static Style makeStyle(const std::string& family, int weight = FONT_WEIGHT_REGULAR, bool italic = false)
{
    return Style{ normalizeFontName(family), weight, italic };
}

TEST(TagScanner, SplitLine)
{
    {
        auto segments = splitLine("no blocks here");
        ASSERT_EQ(segments.size(), 1);
        EXPECT_TRUE(segments[0].overrideBlock.empty());
        EXPECT_EQ(segments[0].text, "no blocks here");
    }
    {
        auto segments = splitLine("a{\\b1}b{\\i1}");
        ASSERT_EQ(segments.size(), 3);
        EXPECT_EQ(segments[0].text, "a");
        EXPECT_EQ(segments[1].overrideBlock, "\\b1");
        EXPECT_EQ(segments[1].text, "b");
        EXPECT_EQ(segments[2].overrideBlock, "\\i1");
        EXPECT_TRUE(segments[2].text.empty());
    }
    {
        auto segments = splitLine("text{\\b1 unterminated");
        ASSERT_EQ(segments.size(), 2);
        EXPECT_EQ(segments[1].overrideBlock, "\\b1 unterminated");
        EXPECT_TRUE(segments[1].text.empty());
    }
}

TEST(TagScanner, ParseTagInteger)
{
    EXPECT_EQ(parseTagInteger("1"), 1);
    EXPECT_EQ(parseTagInteger("-5"), -5);
    EXPECT_EQ(parseTagInteger("+700"), 700);
    EXPECT_EQ(parseTagInteger("12abc"), 12);
    EXPECT_FALSE(parseTagInteger("").has_value());
    EXPECT_FALSE(parseTagInteger("abc").has_value());
    EXPECT_FALSE(parseTagInteger("-").has_value());
}

TEST(TagScanner, WeightFromBoldTag)
{
    EXPECT_EQ(weightFromBoldTag(-1), 400);
    EXPECT_EQ(weightFromBoldTag(0), 400);
    EXPECT_EQ(weightFromBoldTag(1), 700);
    EXPECT_EQ(weightFromBoldTag(2), 100);
    EXPECT_EQ(weightFromBoldTag(150), 100);
    EXPECT_EQ(weightFromBoldTag(151), 200);
    EXPECT_EQ(weightFromBoldTag(250), 200);
    EXPECT_EQ(weightFromBoldTag(251), 300);
    EXPECT_EQ(weightFromBoldTag(400), 400);
    EXPECT_EQ(weightFromBoldTag(701), 800);
    EXPECT_EQ(weightFromBoldTag(850), 800);
    EXPECT_EQ(weightFromBoldTag(851), 900);
    EXPECT_EQ(weightFromBoldTag(5000), 900);
}

TEST(TagScanner, TagStateOverrides)
{
    const Style base = makeStyle("Arial");
    TagState state(base);
    state.applyOverrideBlock("\\b1\\i1");
    EXPECT_EQ(state.current(), makeStyle("Arial", 700, true));
    state.applyOverrideBlock("\\fnTimes New Roman");
    EXPECT_EQ(state.current(), makeStyle("times new roman", 700, true));
    state.applyOverrideBlock("\\i0");
    EXPECT_EQ(state.current(), makeStyle("times new roman", 700, false));
    state.applyOverrideBlock("\\r");
    EXPECT_EQ(state.current(), base);
    EXPECT_EQ(state.base(), base);
}

TEST(TagScanner, ResetIgnoresStyleName)
{
    const Style base = makeStyle("Arial", 700, false);
    TagState state(base);
    state.applyOverrideBlock("\\fnComic Sans MS\\i1");
    state.applyOverrideBlock("\\rAlternate");
    EXPECT_EQ(state.current(), base);
}

TEST(TagScanner, FontNameTag)
{
    const Style base = makeStyle("Arial");
    {
        TagState state(base);
        std::vector<std::string> rejected;
        state.applyOverrideBlock("\\fnBell (MT)", &rejected);
        EXPECT_EQ(state.current(), base) << "font name with parentheses is ignored";
        ASSERT_EQ(rejected.size(), 1);
        EXPECT_EQ(rejected[0], "Bell (MT)");
    }
    {
        TagState state(base);
        state.applyOverrideBlock("\\fn@Vertical Font");
        EXPECT_EQ(state.current().fontFamily, "vertical font");
        state.applyOverrideBlock("\\fn");
        EXPECT_EQ(state.current().fontFamily, "arial") << "empty \\fn restores the base font";
    }
    {
        TagState state(base);
        state.applyOverrideBlock("\\fnFirst\\b1");
        EXPECT_EQ(state.current(), makeStyle("first", 700));
    }
}

TEST(TagScanner, UnknownTagsAreIgnored)
{
    const Style base = makeStyle("Arial");
    TagState state(base);
    state.applyOverrideBlock("\\pos(10,20)\\blur3\\bord2\\c&H0000FF&\\be1");
    EXPECT_EQ(state.current(), base);
}

TEST(TagScanner, ScanLineExample)
{
    FontCollectorContext context(FONTCOLLECTOR_NAME);
    const Style base = makeStyle("Arial");
    auto styles = scanLine("{\\b1}Hello{\\i1} World", base, context);
    EXPECT_EQ(styles.size(), 2);
    EXPECT_EQ(styles.count(makeStyle("Arial", 700, false)), 1);
    EXPECT_EQ(styles.count(makeStyle("Arial", 700, true)), 1);
    EXPECT_EQ(styles.count(base), 0) << "base style is not used by any visible text";
}

TEST(TagScanner, ScanLineEdgeCases)
{
    FontCollectorContext context(FONTCOLLECTOR_NAME);
    const Style base = makeStyle("Arial");
    {
        auto styles = scanLine("plain text", base, context);
        ASSERT_EQ(styles.size(), 1);
        EXPECT_EQ(*styles.begin(), base);
    }
    {
        auto styles = scanLine("{\\b1}{\\i1}", base, context);
        EXPECT_TRUE(styles.empty()) << "blocks without text use no font";
    }
    {
        auto styles = scanLine("", base, context);
        EXPECT_TRUE(styles.empty());
    }
    {
        auto styles = scanLine("{\\b1}bold{\\r}regular", base, context);
        EXPECT_EQ(styles.size(), 2);
        EXPECT_EQ(styles.count(base), 1);
    }
}

TEST(TagScanner, ScanLineWarnsOnRejectedFontName)
{
    FontCollectorContext context(FONTCOLLECTOR_NAME);
    const Style base = makeStyle("Arial");
    RequiredStyleSet styles;
    checkStderr({ "[WARNING]", "Line 12", "Bell (MT)" }, [&]() {
        styles = scanLine("{\\fnBell (MT)}text", base, context, 12);
    });
    ASSERT_EQ(styles.size(), 1);
    EXPECT_EQ(*styles.begin(), base);
    EXPECT_FALSE(context.errorOccurred) << "a rejected font name is only a warning";
}
