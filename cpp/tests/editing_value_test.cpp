#include <gtest/gtest.h>
#include "richedit/editing/editing_value.h"

using namespace richedit;
using namespace richedit::editing;

// =============================================================================
// TextSelection
// =============================================================================

TEST(TextSelectionTest, DefaultIsInvalid) {
    const TextSelection selection;
    EXPECT_FALSE(selection.isValid());
    EXPECT_EQ(selection, TextSelection::invalid());
}

TEST(TextSelectionTest, StartEndAreOrdered) {
    const TextSelection backwards{7, 2};
    EXPECT_EQ(backwards.start(), 2);
    EXPECT_EQ(backwards.end(), 7);
    EXPECT_FALSE(backwards.isCollapsed());
    EXPECT_EQ(backwards.range(), (TextRange{2, 7}));
}

TEST(TextSelectionTest, BaseAffinityFacesExtent) {
    EXPECT_EQ((TextSelection{2, 7}).base().affinity, TextAffinity::Downstream);
    EXPECT_EQ((TextSelection{7, 2}).base().affinity, TextAffinity::Upstream);

    const TextSelection caret = TextSelection::collapsed(3, TextAffinity::Upstream);
    EXPECT_EQ(caret.base().affinity, TextAffinity::Upstream);
    EXPECT_EQ(caret.extent(), (TextPosition{3, TextAffinity::Upstream}));
}

TEST(TextSelectionTest, ExpandToGrowsFromFarEdge) {
    const TextSelection selection{3, 5};
    EXPECT_EQ(selection.expandTo(TextPosition{4}), selection);

    const TextSelection before = selection.expandTo(TextPosition{1});
    EXPECT_EQ(before.baseOffset, 5);
    EXPECT_EQ(before.extentOffset, 1);

    const TextSelection after = selection.expandTo(TextPosition{8});
    EXPECT_EQ(after.baseOffset, 3);
    EXPECT_EQ(after.extentOffset, 8);
}

TEST(TextSelectionTest, ExtendToKeepsBase) {
    const TextSelection selection{3, 5};
    const TextSelection extended = selection.extendTo(TextPosition{1, TextAffinity::Upstream});
    EXPECT_EQ(extended.baseOffset, 3);
    EXPECT_EQ(extended.extentOffset, 1);
    EXPECT_EQ(extended.affinity, TextAffinity::Upstream);
}

// =============================================================================
// EditingValue
// =============================================================================

TEST(EditingValueTest, ReplacedCollapsesAfterInsertion) {
    EditingValue value;
    value.text = u"hello world";
    value.composing = TextRange{0, 5};

    const EditingValue next = value.replaced(TextRange{6, 11}, u"there");
    EXPECT_EQ(next.text, u"hello there");
    EXPECT_EQ(next.selection, TextSelection::collapsed(11));
    EXPECT_FALSE(next.composing.isValid());
}

TEST(EditingValueTest, ComposingValidity) {
    EditingValue value;
    value.text = u"abc";
    value.composing = TextRange{1, 3};
    EXPECT_TRUE(value.isComposingRangeValid());
    value.composing = TextRange{1, 4};
    EXPECT_FALSE(value.isComposingRangeValid());
    value.composing = TextRange{2, 1};
    EXPECT_FALSE(value.isComposingRangeValid());
}

TEST(EditingValueTest, ValidateAcceptsSentinelsAndBounds) {
    EditingValue value;
    value.text = u"abc";
    EXPECT_EQ(validateValue(value), EditError::Ok);

    value.selection = TextSelection{0, 3};
    value.composing = TextRange{3, 3};
    EXPECT_EQ(validateValue(value), EditError::Ok);
}

TEST(EditingValueTest, ValidateRejectsOutOfRange) {
    EditingValue value;
    value.text = u"abc";
    value.selection = TextSelection::collapsed(4);
    EXPECT_EQ(validateValue(value), EditError::ValidationError);

    value.selection = TextSelection{-1, 2};
    EXPECT_EQ(validateValue(value), EditError::ValidationError);

    value.selection = TextSelection::collapsed(1);
    value.composing = TextRange{0, 5};
    EXPECT_EQ(validateValue(value), EditError::ValidationError);
}
