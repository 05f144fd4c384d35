#include <gtest/gtest.h>
#include "richedit/text/text_layout.h"
#include "test_support.h"

using namespace richedit;
using namespace richedit::text;
using richedit::test_support::FakeInlineContent;
using richedit::test_support::FixedAdvanceShaper;

// Every glyph is 10px wide and every line 10px high (baseline at 8).
class TextLayoutTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine.setStyle(test_support::testStyle());
    }

    void setPlain(const std::u16string& text) {
        engine.setText(text, buildSpans(text, test_support::testStyle(), InlineContentResolver{}));
    }

    void setWithObject(const std::u16string& text, PlaceholderDimensions dims) {
        const InlineContentResolver resolver = [this](char32_t cp) -> InlineContent* {
            return cp == 0xE000 ? &object : nullptr;
        };
        engine.setText(text, buildSpans(text, test_support::testStyle(), resolver));
        engine.setPlaceholderDimensions({dims});
    }

    static PlaceholderDimensions dimensions(Size size, PlaceholderAlignment alignment) {
        PlaceholderDimensions dims;
        dims.size = size;
        dims.alignment = alignment;
        return dims;
    }

    FixedAdvanceShaper shaper;
    TextLayoutEngine engine{&shaper};
    FakeInlineContent object{Size{20.0f, 20.0f}};
    const Rect zeroCaret = Rect::fromLTWH(0.0f, 0.0f, 0.0f, 10.0f);
};

// =============================================================================
// Layout
// =============================================================================

TEST_F(TextLayoutTest, EmptyTextHasOneLine) {
    setPlain(u"");
    engine.layout();
    EXPECT_EQ(engine.lineCount(), 1u);
    EXPECT_FLOAT_EQ(engine.width(), 0.0f);
    EXPECT_FLOAT_EQ(engine.height(), 10.0f);
    EXPECT_FLOAT_EQ(engine.preferredLineHeight(), 10.0f);
    EXPECT_EQ(engine.getOffsetForCaret(TextPosition{0}, zeroCaret), (Point2{0.0f, 0.0f}));
    EXPECT_FALSE(engine.getFullHeightForCaret(TextPosition{0}, zeroCaret).has_value());
}

TEST_F(TextLayoutTest, SingleLineSize) {
    setPlain(u"hello");
    engine.layout();
    EXPECT_EQ(engine.lineCount(), 1u);
    EXPECT_FLOAT_EQ(engine.width(), 50.0f);
    EXPECT_FLOAT_EQ(engine.height(), 10.0f);
    EXPECT_FLOAT_EQ(engine.minIntrinsicWidth(), 50.0f);
    EXPECT_FLOAT_EQ(engine.maxIntrinsicWidth(), 50.0f);
}

TEST_F(TextLayoutTest, WidthIsClampedToConstraints) {
    setPlain(u"hello");
    engine.layout(80.0f, 200.0f);
    EXPECT_FLOAT_EQ(engine.width(), 80.0f);
}

TEST_F(TextLayoutTest, WrapsAtWhitespace) {
    setPlain(u"aaaa bbbb");
    engine.layout(0.0f, 50.0f);
    ASSERT_EQ(engine.lineCount(), 2u);
    EXPECT_FLOAT_EQ(engine.height(), 20.0f);
    // The space hangs at the end of the first line
    EXPECT_FLOAT_EQ(engine.width(), 50.0f);

    const auto metrics = engine.computeLineMetrics();
    ASSERT_EQ(metrics.size(), 2u);
    EXPECT_FLOAT_EQ(metrics[0].width, 40.0f);
    EXPECT_FALSE(metrics[0].hardBreak);
    EXPECT_FLOAT_EQ(metrics[0].baseline, 8.0f);
    EXPECT_FLOAT_EQ(metrics[1].baseline, 18.0f);
    EXPECT_EQ(metrics[1].lineNumber, 1u);

    EXPECT_FLOAT_EQ(engine.minIntrinsicWidth(), 40.0f);
    EXPECT_FLOAT_EQ(engine.maxIntrinsicWidth(), 90.0f);
}

TEST_F(TextLayoutTest, LongWordBreaksBetweenClusters) {
    setPlain(u"hello");
    engine.layout(0.0f, 30.0f);
    ASSERT_EQ(engine.lineCount(), 2u);
    EXPECT_FLOAT_EQ(engine.width(), 30.0f);
    EXPECT_EQ(engine.getLineBoundary(TextPosition{4}), (TextRange{3, 5}));
}

TEST_F(TextLayoutTest, WrapsAfterHyphen) {
    setPlain(u"well-known");
    engine.layout(0.0f, 60.0f);
    ASSERT_EQ(engine.lineCount(), 2u);
    EXPECT_EQ(engine.getLineBoundary(TextPosition{0}), (TextRange{0, 5}));
    EXPECT_EQ(engine.getLineBoundary(TextPosition{6}), (TextRange{5, 10}));
}

TEST_F(TextLayoutTest, IdeographsBreakAnywhere) {
    setPlain(u"\u4E2D\u6587\u5B57");
    engine.layout(0.0f, 20.0f);
    EXPECT_EQ(engine.lineCount(), 2u);
    EXPECT_FLOAT_EQ(engine.minIntrinsicWidth(), 10.0f);
}

TEST_F(TextLayoutTest, HardBreaks) {
    setPlain(u"ab\ncd");
    engine.layout();
    ASSERT_EQ(engine.lineCount(), 2u);
    EXPECT_FLOAT_EQ(engine.width(), 20.0f);
    EXPECT_TRUE(engine.computeLineMetrics()[0].hardBreak);
    EXPECT_EQ(engine.getLineBoundary(TextPosition{1}), (TextRange{0, 2}));
    EXPECT_EQ(engine.getLineBoundary(TextPosition{3}), (TextRange{3, 5}));
}

TEST_F(TextLayoutTest, TrailingNewlineAddsEmptyLine) {
    setPlain(u"ab\n");
    engine.layout();
    EXPECT_EQ(engine.lineCount(), 2u);
    EXPECT_FLOAT_EQ(engine.height(), 20.0f);
    EXPECT_EQ(engine.getOffsetForCaret(TextPosition{3}, zeroCaret), (Point2{0.0f, 10.0f}));
}

TEST_F(TextLayoutTest, RelayoutSkipsReshaping) {
    setPlain(u"aaaa bbbb");
    engine.layout();
    const int calls = shaper.shapeCalls;
    EXPECT_FALSE(engine.needsLayout());

    engine.layout();
    engine.layout(0.0f, 50.0f);
    EXPECT_EQ(shaper.shapeCalls, calls);
    EXPECT_EQ(engine.lineCount(), 2u);

    engine.setStyle(test_support::testStyle(20.0f));
    EXPECT_TRUE(engine.needsLayout());
    engine.layout();
    EXPECT_GT(shaper.shapeCalls, calls);
}

TEST_F(TextLayoutTest, ShapingFailureUsesFallbackAdvance) {
    shaper.failShaping = true;
    setPlain(u"abc");
    engine.layout();
    EXPECT_FLOAT_EQ(engine.width(), 15.0f);
}

TEST_F(TextLayoutTest, DistanceToBaseline) {
    setPlain(u"abc");
    engine.layout();
    EXPECT_FLOAT_EQ(engine.computeDistanceToActualBaseline(TextBaseline::Alphabetic), 8.0f);
    EXPECT_FLOAT_EQ(engine.computeDistanceToActualBaseline(TextBaseline::Ideographic), 10.0f);
}

// =============================================================================
// Caret and hit testing
// =============================================================================

TEST_F(TextLayoutTest, CaretOffsets) {
    setPlain(u"hello");
    engine.layout();
    EXPECT_EQ(engine.getOffsetForCaret(TextPosition{0}, zeroCaret), (Point2{0.0f, 0.0f}));
    EXPECT_EQ(engine.getOffsetForCaret(TextPosition{2}, zeroCaret), (Point2{20.0f, 0.0f}));
    EXPECT_EQ(engine.getOffsetForCaret(TextPosition{5}, zeroCaret), (Point2{50.0f, 0.0f}));
    EXPECT_EQ(engine.getOffsetForCaret(TextPosition{2, TextAffinity::Upstream}, zeroCaret), (Point2{20.0f, 0.0f}));
    EXPECT_EQ(engine.getFullHeightForCaret(TextPosition{2}, zeroCaret), std::optional<float>(10.0f));
}

TEST_F(TextLayoutTest, CaretAtSoftWrapDependsOnAffinity) {
    setPlain(u"aaaa bbbb");
    engine.layout(0.0f, 50.0f);
    EXPECT_EQ(engine.getOffsetForCaret(TextPosition{5, TextAffinity::Downstream}, zeroCaret), (Point2{0.0f, 10.0f}));
    EXPECT_EQ(engine.getOffsetForCaret(TextPosition{5, TextAffinity::Upstream}, zeroCaret), (Point2{50.0f, 0.0f}));
    EXPECT_EQ(engine.getLineBoundary(TextPosition{5, TextAffinity::Upstream}), (TextRange{0, 5}));
    EXPECT_EQ(engine.getLineBoundary(TextPosition{5, TextAffinity::Downstream}), (TextRange{5, 9}));
}

TEST_F(TextLayoutTest, CaretBeforeNewlineEndsLine) {
    setPlain(u"ab\ncd");
    engine.layout();
    EXPECT_EQ(engine.getOffsetForCaret(TextPosition{2}, zeroCaret), (Point2{20.0f, 0.0f}));
    EXPECT_EQ(engine.getOffsetForCaret(TextPosition{3}, zeroCaret), (Point2{0.0f, 10.0f}));
}

TEST_F(TextLayoutTest, HitTestPicksClusterHalf) {
    setPlain(u"hello");
    engine.layout();
    EXPECT_EQ(engine.getPositionForOffset(Point2{12.0f, 5.0f}), (TextPosition{1, TextAffinity::Downstream}));
    EXPECT_EQ(engine.getPositionForOffset(Point2{17.0f, 5.0f}), (TextPosition{2, TextAffinity::Upstream}));
    EXPECT_EQ(engine.getPositionForOffset(Point2{-5.0f, 5.0f}), (TextPosition{0, TextAffinity::Downstream}));
    EXPECT_EQ(engine.getPositionForOffset(Point2{200.0f, 5.0f}), (TextPosition{5, TextAffinity::Upstream}));
}

TEST_F(TextLayoutTest, HitTestUsesLineAtY) {
    setPlain(u"aaaa bbbb");
    engine.layout(0.0f, 50.0f);
    EXPECT_EQ(engine.getPositionForOffset(Point2{12.0f, 15.0f}), (TextPosition{6, TextAffinity::Downstream}));
    // Below the last line
    EXPECT_EQ(engine.getPositionForOffset(Point2{12.0f, 500.0f}), (TextPosition{6, TextAffinity::Downstream}));
}

TEST_F(TextLayoutTest, HitTestNeverSplitsGrapheme) {
    setPlain(u"e\u0301x");
    engine.layout();
    EXPECT_FLOAT_EQ(engine.width(), 20.0f);
    EXPECT_EQ(engine.getPositionForOffset(Point2{7.0f, 5.0f}), (TextPosition{2, TextAffinity::Upstream}));
}

TEST_F(TextLayoutTest, OffsetAfterAndBeforeStepCodePoints) {
    setPlain(u"a\U0001F600b");
    EXPECT_EQ(engine.getOffsetAfter(1), std::optional<int>(3));
    EXPECT_EQ(engine.getOffsetBefore(3), std::optional<int>(1));
    EXPECT_EQ(engine.getOffsetAfter(3), std::optional<int>(4));
    EXPECT_FALSE(engine.getOffsetAfter(4).has_value());
    EXPECT_FALSE(engine.getOffsetBefore(0).has_value());
}

TEST_F(TextLayoutTest, WordBoundary) {
    setPlain(u"hello world");
    EXPECT_EQ(engine.getWordBoundary(TextPosition{8}), (TextRange{6, 11}));
    EXPECT_EQ(engine.getWordBoundary(TextPosition{11}), TextRange::collapsed(11));
}

// =============================================================================
// Bidi
// =============================================================================

TEST_F(TextLayoutTest, RtlRunIsPlacedRightToLeft) {
    setPlain(u"\u05D0\u05D1\u05D2");
    engine.layout();
    EXPECT_FLOAT_EQ(engine.width(), 30.0f);
    // Logical start sits at the right edge
    EXPECT_EQ(engine.getOffsetForCaret(TextPosition{0}, zeroCaret), (Point2{30.0f, 0.0f}));
    EXPECT_EQ(engine.getOffsetForCaret(TextPosition{0}, Rect::fromLTWH(0.0f, 0.0f, 1.0f, 10.0f)),
              (Point2{29.0f, 0.0f}));
    EXPECT_EQ(engine.getPositionForOffset(Point2{27.0f, 5.0f}), (TextPosition{0, TextAffinity::Downstream}));
    EXPECT_EQ(engine.getPositionForOffset(Point2{22.0f, 5.0f}), (TextPosition{1, TextAffinity::Upstream}));
}

TEST_F(TextLayoutTest, MixedDirectionSelectionBoxes) {
    setPlain(u"ab \u05D0\u05D1");
    engine.layout();
    EXPECT_EQ(engine.getOffsetForCaret(TextPosition{3}, zeroCaret), (Point2{50.0f, 0.0f}));

    const auto rtlBoxes = engine.getBoxesForSelection(TextRange{3, 5});
    ASSERT_EQ(rtlBoxes.size(), 1u);
    EXPECT_EQ(rtlBoxes[0], (TextBox{30.0f, 0.0f, 50.0f, 10.0f, TextDirection::RTL}));

    const auto mixed = engine.getBoxesForSelection(TextRange{1, 4});
    ASSERT_EQ(mixed.size(), 2u);
    EXPECT_EQ(mixed[0], (TextBox{10.0f, 0.0f, 30.0f, 10.0f, TextDirection::LTR}));
    EXPECT_EQ(mixed[1], (TextBox{40.0f, 0.0f, 50.0f, 10.0f, TextDirection::RTL}));
}

TEST_F(TextLayoutTest, DirectionMarkResolvesNeighbouringSpace) {
    // Between Hebrew and Latin the space falls back to the paragraph direction
    setPlain(u"\u05E9\u05DC ab");
    engine.layout();
    const auto plain = engine.getBoxesForSelection(TextRange{2, 3});
    ASSERT_EQ(plain.size(), 1u);
    EXPECT_EQ(plain[0].direction, TextDirection::LTR);

    // An RLM after it makes both neighbours right-to-left
    setPlain(u"\u05E9\u05DC \u200Fab");
    engine.layout();
    const auto marked = engine.getBoxesForSelection(TextRange{2, 3});
    ASSERT_EQ(marked.size(), 1u);
    EXPECT_EQ(marked[0].direction, TextDirection::RTL);
}

TEST_F(TextLayoutTest, RtlParagraphAlignsStartRight) {
    engine.setTextDirection(TextDirection::RTL);
    setPlain(u"abc");
    engine.layout(100.0f, 100.0f);
    EXPECT_EQ(engine.getOffsetForCaret(TextPosition{0}, zeroCaret), (Point2{70.0f, 0.0f}));

    setPlain(u"");
    engine.layout(100.0f, 100.0f);
    EXPECT_EQ(engine.getOffsetForCaret(TextPosition{0}, zeroCaret), (Point2{100.0f, 0.0f}));
}

// =============================================================================
// Alignment
// =============================================================================

TEST_F(TextLayoutTest, CenterAndRightAlignment) {
    setPlain(u"ab");
    engine.setTextAlign(TextAlign::Center);
    engine.layout(100.0f, 100.0f);
    EXPECT_EQ(engine.getOffsetForCaret(TextPosition{0}, zeroCaret), (Point2{40.0f, 0.0f}));
    EXPECT_FLOAT_EQ(engine.computeLineMetrics()[0].left, 40.0f);

    engine.setTextAlign(TextAlign::Right);
    engine.layout(100.0f, 100.0f);
    EXPECT_EQ(engine.getOffsetForCaret(TextPosition{0}, zeroCaret), (Point2{80.0f, 0.0f}));
    EXPECT_EQ(engine.getPositionForOffset(Point2{83.0f, 5.0f}), (TextPosition{0, TextAffinity::Downstream}));
}

// =============================================================================
// Selection boxes
// =============================================================================

TEST_F(TextLayoutTest, BoxesMergePerLine) {
    setPlain(u"hello");
    engine.layout();
    const auto boxes = engine.getBoxesForSelection(TextRange{1, 3});
    ASSERT_EQ(boxes.size(), 1u);
    EXPECT_EQ(boxes[0], (TextBox{10.0f, 0.0f, 30.0f, 10.0f, TextDirection::LTR}));

    EXPECT_TRUE(engine.getBoxesForSelection(TextRange{2, 2}).empty());
    EXPECT_TRUE(engine.getBoxesForSelection(TextRange::empty()).empty());
}

TEST_F(TextLayoutTest, MaxWidthStyleExtendsToParagraphEdge) {
    setPlain(u"aaaa bbbb");
    engine.layout(80.0f, 80.0f);
    ASSERT_EQ(engine.lineCount(), 2u);

    const auto tight = engine.getBoxesForSelection(TextRange{2, 7});
    ASSERT_EQ(tight.size(), 2u);
    EXPECT_EQ(tight[0], (TextBox{20.0f, 0.0f, 50.0f, 10.0f, TextDirection::LTR}));
    EXPECT_EQ(tight[1], (TextBox{0.0f, 10.0f, 20.0f, 20.0f, TextDirection::LTR}));

    const auto wide = engine.getBoxesForSelection(TextRange{2, 7}, BoxHeightStyle::Tight, BoxWidthStyle::Max);
    ASSERT_EQ(wide.size(), 3u);
    EXPECT_EQ(wide[1], (TextBox{50.0f, 0.0f, 80.0f, 10.0f, TextDirection::LTR}));
}

TEST_F(TextLayoutTest, MaxHeightStyleUsesLineHeight) {
    setWithObject(u"a\uE000", dimensions(Size{20.0f, 20.0f}, PlaceholderAlignment::Bottom));
    engine.layout();
    const auto tight = engine.getBoxesForSelection(TextRange{0, 1});
    ASSERT_EQ(tight.size(), 1u);
    EXPECT_FLOAT_EQ(tight[0].top, 10.0f);
    EXPECT_FLOAT_EQ(tight[0].bottom, 20.0f);

    const auto full = engine.getBoxesForSelection(TextRange{0, 1}, BoxHeightStyle::Max);
    ASSERT_EQ(full.size(), 1u);
    EXPECT_FLOAT_EQ(full[0].top, 0.0f);
    EXPECT_FLOAT_EQ(full[0].bottom, 20.0f);
}

// =============================================================================
// Placeholders
// =============================================================================

TEST_F(TextLayoutTest, BottomAlignedPlaceholder) {
    setWithObject(u"a\uE000b", dimensions(Size{20.0f, 20.0f}, PlaceholderAlignment::Bottom));
    engine.layout();
    EXPECT_FLOAT_EQ(engine.width(), 40.0f);
    EXPECT_FLOAT_EQ(engine.height(), 20.0f);

    const auto boxes = engine.inlinePlaceholderBoxes();
    ASSERT_EQ(boxes.size(), 1u);
    EXPECT_EQ(boxes[0], (TextBox{10.0f, 0.0f, 30.0f, 20.0f, TextDirection::LTR}));
}

TEST_F(TextLayoutTest, PlaceholderAlignmentsSetLineHeight) {
    struct Case {
        PlaceholderAlignment alignment;
        float lineHeight;
        float boxTop;
    };
    // Font ascent 8, descent 2; placeholder 20 high
    const Case cases[] = {
        {PlaceholderAlignment::Top, 20.0f, 0.0f},
        {PlaceholderAlignment::Middle, 20.0f, 0.0f},
        {PlaceholderAlignment::AboveBaseline, 22.0f, 0.0f},
        {PlaceholderAlignment::BelowBaseline, 28.0f, 8.0f},
    };
    for (const Case& c : cases) {
        setWithObject(u"a\uE000", dimensions(Size{20.0f, 20.0f}, c.alignment));
        engine.layout();
        EXPECT_FLOAT_EQ(engine.height(), c.lineHeight) << static_cast<int>(c.alignment);
        ASSERT_EQ(engine.inlinePlaceholderBoxes().size(), 1u);
        EXPECT_FLOAT_EQ(engine.inlinePlaceholderBoxes()[0].top, c.boxTop) << static_cast<int>(c.alignment);
    }
}

TEST_F(TextLayoutTest, BaselinePlaceholderUsesOffset) {
    PlaceholderDimensions dims = dimensions(Size{20.0f, 20.0f}, PlaceholderAlignment::Baseline);
    dims.baseline = TextBaseline::Alphabetic;
    dims.baselineOffset = 15.0f;
    setWithObject(u"a\uE000", dims);
    engine.layout();
    // Ascent 15, descent 5
    EXPECT_FLOAT_EQ(engine.height(), 20.0f);
    EXPECT_FLOAT_EQ(engine.computeDistanceToActualBaseline(TextBaseline::Alphabetic), 15.0f);
}

TEST_F(TextLayoutTest, ScaleFactorScalesTextAndPlaceholders) {
    engine.setTextScaleFactor(2.0f);
    setWithObject(u"a\uE000", dimensions(Size{10.0f, 10.0f}, PlaceholderAlignment::Bottom));
    engine.layout();
    EXPECT_FLOAT_EQ(engine.width(), 40.0f);
    EXPECT_FLOAT_EQ(engine.height(), 20.0f);
    EXPECT_FLOAT_EQ(engine.preferredLineHeight(), 20.0f);
}

TEST_F(TextLayoutTest, PlaceholdersAreBreakOpportunities) {
    setWithObject(u"aa\uE000bb", dimensions(Size{20.0f, 10.0f}, PlaceholderAlignment::Bottom));
    engine.layout();
    EXPECT_FLOAT_EQ(engine.minIntrinsicWidth(), 20.0f);
    EXPECT_FLOAT_EQ(engine.maxIntrinsicWidth(), 60.0f);
}

TEST_F(TextLayoutTest, CaretNeverInsidePlaceholder) {
    setWithObject(u"a\uE000b", dimensions(Size{20.0f, 20.0f}, PlaceholderAlignment::Bottom));
    engine.layout();
    EXPECT_EQ(engine.getPositionForOffset(Point2{15.0f, 10.0f}), (TextPosition{1, TextAffinity::Downstream}));
    EXPECT_EQ(engine.getPositionForOffset(Point2{25.0f, 10.0f}), (TextPosition{2, TextAffinity::Upstream}));
}
