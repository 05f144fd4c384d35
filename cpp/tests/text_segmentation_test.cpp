#include <gtest/gtest.h>
#include "richedit/text/text_segmentation.h"

using namespace richedit;
using namespace richedit::text;

// =============================================================================
// Classification
// =============================================================================

TEST(CharClassTest, ClassifiesCommonCharacters) {
    EXPECT_EQ(classifyCodePoint(U'a'), CharClass::Word);
    EXPECT_EQ(classifyCodePoint(U'7'), CharClass::Word);
    EXPECT_EQ(classifyCodePoint(U'_'), CharClass::Word);
    EXPECT_EQ(classifyCodePoint(U' '), CharClass::Whitespace);
    EXPECT_EQ(classifyCodePoint(U'\t'), CharClass::Whitespace);
    EXPECT_EQ(classifyCodePoint(U'\n'), CharClass::Newline);
    EXPECT_EQ(classifyCodePoint(U'\''), CharClass::MidLetter);
    EXPECT_EQ(classifyCodePoint(U'-'), CharClass::Hyphen);
    EXPECT_EQ(classifyCodePoint(U','), CharClass::Other);
    EXPECT_EQ(classifyCodePoint(0x4E2D), CharClass::Ideograph);
    EXPECT_EQ(classifyCodePoint(0xE000), CharClass::InlineObject);
}

TEST(CharClassTest, BidiClasses) {
    EXPECT_EQ(bidiClassOf(U'a'), BidiClass::StrongLTR);
    EXPECT_EQ(bidiClassOf(0x05D0), BidiClass::StrongRTL);
    EXPECT_EQ(bidiClassOf(0x0627), BidiClass::StrongRTL);
    EXPECT_EQ(bidiClassOf(U' '), BidiClass::Neutral);
    EXPECT_EQ(bidiClassOf(U'.'), BidiClass::Neutral);
}

TEST(CharClassTest, DirectionMarksAreStrong) {
    EXPECT_EQ(bidiClassOf(0x200E), BidiClass::StrongLTR);
    EXPECT_EQ(bidiClassOf(0x200F), BidiClass::StrongRTL);
    EXPECT_EQ(bidiClassOf(0x061C), BidiClass::StrongRTL);
}

TEST(CharClassTest, ArabicIndicDigitsClassifyLikeAsciiDigits) {
    EXPECT_EQ(bidiClassOf(U'1'), BidiClass::StrongLTR);
    EXPECT_EQ(bidiClassOf(0x0661), bidiClassOf(U'1'));
    EXPECT_EQ(bidiClassOf(0x06F5), bidiClassOf(U'1'));
    // Letters either side of the digit blocks stay right-to-left
    EXPECT_EQ(bidiClassOf(0x065F), BidiClass::StrongRTL);
    EXPECT_EQ(bidiClassOf(0x066E), BidiClass::StrongRTL);
}

// =============================================================================
// Graphemes
// =============================================================================

TEST(GraphemeTest, AsciiBoundariesEveryUnit) {
    const std::vector<std::uint32_t> expected = {0, 1, 2, 3};
    EXPECT_EQ(graphemeBoundaries(u"abc"), expected);
    EXPECT_EQ(graphemeBoundaries(u""), std::vector<std::uint32_t>{0});
}

TEST(GraphemeTest, CombiningMarkJoinsBase) {
    const std::u16string text = u"e\u0301x";
    EXPECT_FALSE(isGraphemeBoundary(text, 1));
    EXPECT_EQ(nextGraphemeBoundary(text, 0), 2u);
    EXPECT_EQ(previousGraphemeBoundary(text, 2), 0u);
    EXPECT_EQ(previousGraphemeBoundary(text, 3), 2u);
}

TEST(GraphemeTest, SurrogatePairIsOneGrapheme) {
    const std::u16string text = u"a\U0001F600b";
    EXPECT_FALSE(isGraphemeBoundary(text, 2));
    EXPECT_EQ(nextGraphemeBoundary(text, 1), 3u);
    EXPECT_EQ(previousGraphemeBoundary(text, 3), 1u);
}

TEST(GraphemeTest, CrLfStaysTogether) {
    const std::u16string text = u"a\r\nb";
    EXPECT_FALSE(isGraphemeBoundary(text, 2));
    EXPECT_EQ(nextGraphemeBoundary(text, 1), 3u);
    EXPECT_TRUE(isGraphemeBoundary(text, 1));
    EXPECT_TRUE(isGraphemeBoundary(text, 3));
}

TEST(GraphemeTest, ZwjSequenceIsOneGrapheme) {
    const std::u16string text = u"\U0001F468\u200D\U0001F469";
    EXPECT_EQ(nextGraphemeBoundary(text, 0), static_cast<std::uint32_t>(text.size()));
    EXPECT_EQ(previousGraphemeBoundary(text, static_cast<std::uint32_t>(text.size())), 0u);
}

TEST(GraphemeTest, RegionalIndicatorsPairUp) {
    // Two flags: four regional indicators, two units each
    const std::u16string text = u"\U0001F1FA\U0001F1F8\U0001F1EC\U0001F1E7";
    const std::vector<std::uint32_t> expected = {0, 4, 8};
    EXPECT_EQ(graphemeBoundaries(text), expected);
}

TEST(GraphemeTest, HangulJamoJoin) {
    EXPECT_FALSE(isGraphemeBoundary(u"\u1100\u1161", 1));
    EXPECT_FALSE(isGraphemeBoundary(u"\uAC00\u11A8", 1));
    EXPECT_TRUE(isGraphemeBoundary(u"\uAC00\uAC00", 1));
}

TEST(GraphemeTest, InlineObjectNeverJoins) {
    EXPECT_TRUE(isGraphemeBoundary(u"\uE000\u0301", 1));
}

TEST(GraphemeTest, EndsClampToText) {
    EXPECT_EQ(nextGraphemeBoundary(u"ab", 2), 2u);
    EXPECT_EQ(nextGraphemeBoundary(u"ab", 9), 2u);
    EXPECT_EQ(previousGraphemeBoundary(u"ab", 0), 0u);
}

// =============================================================================
// Words
// =============================================================================

TEST(WordBoundaryTest, WordAroundOffset) {
    EXPECT_EQ(wordBoundaryAt(u"hello world", 2), (TextRange{0, 5}));
    EXPECT_EQ(wordBoundaryAt(u"hello world", 8), (TextRange{6, 11}));
}

TEST(WordBoundaryTest, MidLetterJoinsWords) {
    EXPECT_EQ(wordBoundaryAt(u"don't stop", 1), (TextRange{0, 5}));
    EXPECT_EQ(wordBoundaryAt(u"don't stop", 3), (TextRange{0, 5}));
    EXPECT_EQ(wordBoundaryAt(u"a.b c", 0), (TextRange{0, 3}));
}

TEST(WordBoundaryTest, TrailingMidLetterStandsAlone) {
    EXPECT_EQ(wordBoundaryAt(u"end.", 0), (TextRange{0, 3}));
    EXPECT_EQ(wordBoundaryAt(u"end.", 3), (TextRange{3, 4}));
}

TEST(WordBoundaryTest, WhitespaceRunIsOneRange) {
    EXPECT_EQ(wordBoundaryAt(u"ab   cd", 3), (TextRange{2, 5}));
}

TEST(WordBoundaryTest, SingleCharacterRanges) {
    EXPECT_EQ(wordBoundaryAt(u"hello,world", 5), (TextRange{5, 6}));
    EXPECT_EQ(wordBoundaryAt(u"well-known", 4), (TextRange{4, 5}));
    EXPECT_EQ(wordBoundaryAt(u"ab\ncd", 2), (TextRange{2, 3}));
    EXPECT_EQ(wordBoundaryAt(u"\u4E2D\u6587", 1), (TextRange{1, 2}));
    EXPECT_EQ(wordBoundaryAt(u"a\uE000b", 1), (TextRange{1, 2}));
    EXPECT_EQ(wordBoundaryAt(u"a\uE000b", 0), (TextRange{0, 1}));
}

TEST(WordBoundaryTest, MarksStayInWord) {
    EXPECT_EQ(wordBoundaryAt(u"e\u0301te x", 0), (TextRange{0, 4}));
}

TEST(WordBoundaryTest, PastEndIsCollapsedAtLength) {
    EXPECT_EQ(wordBoundaryAt(u"abc", 3), TextRange::collapsed(3));
    EXPECT_EQ(wordBoundaryAt(u"abc", 10), TextRange::collapsed(3));
    EXPECT_EQ(wordBoundaryAt(u"", 0), TextRange::collapsed(0));
}

TEST(WordBoundaryTest, WhitespaceOnly) {
    EXPECT_TRUE(isWhitespaceOnly(u"ab  cd", TextRange{2, 4}));
    EXPECT_FALSE(isWhitespaceOnly(u"ab  cd", TextRange{1, 3}));
    EXPECT_FALSE(isWhitespaceOnly(u"ab  cd", TextRange{2, 2}));
    EXPECT_FALSE(isWhitespaceOnly(u"ab  cd", TextRange::empty()));
}
