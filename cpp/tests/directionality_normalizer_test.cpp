#include <gtest/gtest.h>
#include "richedit/editing/directionality_normalizer.h"

#include <vector>

using namespace richedit;
using namespace richedit::editing;

namespace {

EditingValue valueOf(std::u16string text, TextSelection selection = TextSelection::invalid(),
                     TextRange composing = TextRange::empty()) {
    EditingValue value;
    value.text = std::move(text);
    value.selection = selection;
    value.composing = composing;
    return value;
}

} // namespace

class DirectionalityNormalizerTest : public ::testing::Test {
protected:
    EditingValue run(const EditingValue& value) { return ltr.formatEditUpdate(EditingValue{}, value); }

    DirectionalityNormalizer ltr{TextDirection::LTR};
};

TEST_F(DirectionalityNormalizerTest, InactiveUntilOpposingTextSeen) {
    const EditingValue plain = valueOf(u"abc def", TextSelection::collapsed(7));
    EXPECT_EQ(run(plain), plain);
    EXPECT_FALSE(ltr.hasOpposingDirection());
}

TEST_F(DirectionalityNormalizerTest, MarkAfterLtrRunBeforeRtl) {
    const EditingValue out = run(valueOf(u"abc \u05E9\u05DC\u05D5\u05DD", TextSelection::collapsed(8)));
    EXPECT_TRUE(ltr.hasOpposingDirection());
    EXPECT_EQ(out.text, u"abc \u200E\u05E9\u05DC\u05D5\u05DD");
    EXPECT_EQ(out.selection, TextSelection::collapsed(9));
}

TEST_F(DirectionalityNormalizerTest, MarkAfterRtlRunBeforeLtr) {
    const EditingValue out = run(valueOf(u"\u05E9\u05DC\u05D5\u05DD abc"));
    EXPECT_EQ(out.text, u"\u05E9\u05DC\u05D5\u05DD \u200Fabc");
}

TEST_F(DirectionalityNormalizerTest, SameDirectionDropsMarkOnceActive) {
    run(valueOf(u"\u05E9"));
    ASSERT_TRUE(ltr.hasOpposingDirection());

    const EditingValue plain = valueOf(u"abc def", TextSelection::collapsed(7));
    EXPECT_EQ(run(plain), plain);
}

TEST_F(DirectionalityNormalizerTest, MarkFollowsWhitespaceRun) {
    const EditingValue out = run(valueOf(u"\u05E9  a"));
    EXPECT_EQ(out.text, u"\u05E9  \u200Fa");
}

TEST_F(DirectionalityNormalizerTest, ExistingMarkIsKeptNotDoubled) {
    const std::u16string marked = u"abc \u200E\u05E9";
    EXPECT_EQ(run(valueOf(marked)).text, marked);
    EXPECT_EQ(run(valueOf(marked)).text, marked);
}

TEST_F(DirectionalityNormalizerTest, OffsetsBeforeMarkStay) {
    const EditingValue out = run(valueOf(u"abc \u05E9", TextSelection{1, 5}, TextRange{0, 3}));
    EXPECT_EQ(out.selection.baseOffset, 1);
    EXPECT_EQ(out.selection.extentOffset, 6);
    EXPECT_EQ(out.composing, (TextRange{0, 3}));
}

TEST_F(DirectionalityNormalizerTest, SentinelsAreUntouched) {
    const EditingValue out = run(valueOf(u"abc \u05E9"));
    EXPECT_FALSE(out.selection.isValid());
    EXPECT_FALSE(out.composing.isValid());
}

TEST_F(DirectionalityNormalizerTest, RtlBaseActivatesOnLatin) {
    DirectionalityNormalizer rtl(TextDirection::RTL);
    EXPECT_EQ(rtl.formatEditUpdate(EditingValue{}, valueOf(u"\u05E9 \u05DC")).text, u"\u05E9 \u05DC");
    EXPECT_FALSE(rtl.hasOpposingDirection());

    EXPECT_EQ(rtl.formatEditUpdate(EditingValue{}, valueOf(u"\u05E9 a")).text, u"\u05E9 \u200Fa");
    EXPECT_TRUE(rtl.hasOpposingDirection());
}

TEST(DirectionalityClassesTest, CharacterClasses) {
    EXPECT_TRUE(DirectionalityNormalizer::isLtrCodePoint(U'a'));
    EXPECT_TRUE(DirectionalityNormalizer::isLtrCodePoint(0x4E2D));
    EXPECT_FALSE(DirectionalityNormalizer::isLtrCodePoint(U'1'));
    EXPECT_FALSE(DirectionalityNormalizer::isRtlCodePoint(U'1'));
    EXPECT_TRUE(DirectionalityNormalizer::isRtlCodePoint(0x05D0));
    EXPECT_TRUE(DirectionalityNormalizer::isRtlCodePoint(0x0627));
    EXPECT_TRUE(DirectionalityNormalizer::isDirectionalityMarker(0x200E));
    EXPECT_FALSE(DirectionalityNormalizer::isDirectionalityMarker(U' '));
}

TEST_F(DirectionalityNormalizerTest, MixedSentenceGetsMarksAroundHebrew) {
    const EditingValue out = run(valueOf(u"hello \u05E9\u05DC\u05D5\u05DD world", TextSelection{6, 10},
                                         TextRange{11, 16}));
    EXPECT_EQ(out.text, u"hello \u200E\u05E9\u05DC\u05D5\u05DD \u200Fworld");
    // Still covers the Hebrew word and "world"
    EXPECT_EQ(out.selection, (TextSelection{7, 11}));
    EXPECT_EQ(out.composing, (TextRange{13, 18}));

    const EditingValue caretAtEnd = run(valueOf(u"hello \u05E9\u05DC\u05D5\u05DD world", TextSelection::collapsed(16)));
    EXPECT_EQ(caretAtEnd.selection, TextSelection::collapsed(18));
}

TEST_F(DirectionalityNormalizerTest, OffsetOnDroppedMarkStaysPut) {
    run(valueOf(u"\u05E9"));
    ASSERT_TRUE(ltr.hasOpposingDirection());

    // The mark added after the space is dropped before "d"; the caret there keeps its offset
    const EditingValue sameDirection = run(valueOf(u"abc def", TextSelection::collapsed(4), TextRange{3, 5}));
    EXPECT_EQ(sameDirection.text, u"abc def");
    EXPECT_EQ(sameDirection.selection, TextSelection::collapsed(4));
    EXPECT_EQ(sameDirection.composing, (TextRange{3, 5}));

    // The mark after the first space moves behind the second one
    const EditingValue betweenSpaces = run(valueOf(u"\u05E9  a", TextSelection{2, 3}));
    EXPECT_EQ(betweenSpaces.text, u"\u05E9  \u200Fa");
    EXPECT_EQ(betweenSpaces.selection.baseOffset, 2);
    EXPECT_EQ(betweenSpaces.selection.extentOffset, 4);
}

TEST_F(DirectionalityNormalizerTest, NormalizingTwiceChangesNothing) {
    const std::vector<EditingValue> samples{
        valueOf(u"hello \u05E9\u05DC\u05D5\u05DD world", TextSelection{6, 10}, TextRange{11, 16}),
        valueOf(u"\u05E9\u05DC\u05D5\u05DD abc", TextSelection::collapsed(5)),
        valueOf(u"\u05E9  a", TextSelection{1, 4}),
        valueOf(u"abc \u05E9\u05DC def", TextSelection::collapsed(7), TextRange{4, 6}),
        valueOf(u"\u05E9 \u200E\u05DC", TextSelection::collapsed(3)),
        valueOf(u"ab \u200E\u200Fcd", TextSelection{3, 5}),
        // Same-direction text once active: the added mark is dropped again
        valueOf(u"a b  c", TextSelection{2, 5}),
    };
    for (const EditingValue& sample : samples) {
        const EditingValue once = run(sample);
        const EditingValue twice = run(once);
        EXPECT_EQ(twice, once);
        EXPECT_EQ(validateValue(once), EditError::Ok);
    }
}
