#ifndef RICHEDIT_TESTS_TEST_SUPPORT_H
#define RICHEDIT_TESTS_TEST_SUPPORT_H

#include "richedit/core/string_utils.h"
#include "richedit/editing/editing_value.h"
#include "richedit/interaction/input_collaborators.h"
#include "richedit/render/editable_painters.h"
#include "richedit/text/inline_content.h"
#include "richedit/text/text_shaper.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace richedit::test_support {

// =============================================================================
// FixedAdvanceShaper
// =============================================================================

/**
 * Deterministic shaper: every code point advances by one em (fontSize), except
 * combining marks and direction/joiner marks, which advance by 0.
 * Ascender 0.8 em, descender -0.2 em, no line gap: a 10px font gives 10px lines
 * with the baseline 8px below the top.
 */
class FixedAdvanceShaper : public text::TextShaper {
public:
    bool failShaping = false;
    int shapeCalls = 0;

    bool shapeRun(
        std::u16string_view text,
        std::uint32_t start,
        std::uint32_t end,
        const text::TextStyle& style,
        bool rtl,
        std::vector<text::ShapedGlyph>& outGlyphs
    ) override {
        ++shapeCalls;
        if (failShaping) {
            return false;
        }
        std::vector<text::ShapedGlyph> run;
        std::uint32_t pos = start;
        while (pos < end) {
            std::uint32_t unitLen = 0;
            const char32_t cp = decodeUtf16At(text, pos, unitLen);
            const float advance = isZeroWidth(cp) ? 0.0f : style.fontSize;
            run.push_back(text::ShapedGlyph{static_cast<std::uint32_t>(cp), pos, advance, 0.0f, 0.0f, 0.0f, rtl ? 1u : 0u});
            pos += unitLen;
        }
        if (rtl) {
            outGlyphs.insert(outGlyphs.end(), run.rbegin(), run.rend());
        } else {
            outGlyphs.insert(outGlyphs.end(), run.begin(), run.end());
        }
        return true;
    }

    text::FontMetrics getScaledMetrics(const text::TextStyle& style) const override {
        return text::FontMetrics{1000.0f, style.fontSize * 0.8f, -style.fontSize * 0.2f, 0.0f, -0.1f, 0.05f};
    }

private:
    static bool isZeroWidth(char32_t cp) {
        return (cp >= 0x0300 && cp <= 0x036F) || cp == 0x200D || cp == 0x200E || cp == 0x200F;
    }
};

inline text::TextStyle testStyle(float fontSize = 10.0f) {
    text::TextStyle style;
    style.fontSize = fontSize;
    return style;
}

// =============================================================================
// FakeInlineContent
// =============================================================================

class FakeInlineContent : public text::InlineContent {
public:
    explicit FakeInlineContent(Size size, std::optional<float> baseline = std::nullopt)
        : size_(size), baseline_(baseline) {}

    Size layout(float maxWidth) override {
        ++layoutCalls;
        lastMaxWidth = maxWidth;
        return size_;
    }
    Size dryLayout(float maxWidth) const override {
        (void)maxWidth;
        return size_;
    }
    std::optional<float> distanceToBaseline(text::TextBaseline baseline) const override {
        (void)baseline;
        return baseline_;
    }
    bool hitTest(Point2 local) const override {
        lastHit = local;
        return acceptsHits;
    }

    int layoutCalls = 0;
    float lastMaxWidth = 0.0f;
    bool acceptsHits = true;
    mutable std::optional<Point2> lastHit;

private:
    Size size_;
    std::optional<float> baseline_;
};

// =============================================================================
// RecordingCanvas
// =============================================================================

class RecordingCanvas : public render::Canvas {
public:
    struct DrawnRect {
        Rect rect;
        Color color;
        std::optional<float> radius;
    };

    void drawRect(const Rect& rect, const Color& color) override {
        rects.push_back(DrawnRect{rect, color, std::nullopt});
    }
    void drawRoundedRect(const Rect& rect, float radius, const Color& color) override {
        rects.push_back(DrawnRect{rect, color, radius});
    }
    void pushClipRect(const Rect& rect) override { clips.push_back(rect); }
    void popClip() override { ++pops; }
    void drawParagraph(const text::TextLayoutEngine& paragraph, Point2 offset) override {
        (void)paragraph;
        paragraphOffsets.push_back(offset);
    }
    void drawInlineContent(text::InlineContent* content, Point2 offset, float scale) override {
        (void)scale;
        inlineContent.push_back(content);
        inlineOffsets.push_back(offset);
    }

    std::vector<DrawnRect> rects;
    std::vector<Rect> clips;
    int pops = 0;
    std::vector<Point2> paragraphOffsets;
    std::vector<text::InlineContent*> inlineContent;
    std::vector<Point2> inlineOffsets;
};

// =============================================================================
// Input collaborators
// =============================================================================

// Holds read callbacks until the test delivers them.
class FakeClipboard : public interaction::Clipboard {
public:
    void write(std::u16string text) override { contents = std::move(text); }
    void read(ReadCallback callback) override { pending.push_back(std::move(callback)); }

    void deliver() {
        std::vector<ReadCallback> callbacks;
        callbacks.swap(pending);
        for (auto& callback : callbacks) {
            callback(contents);
        }
    }

    std::optional<std::u16string> contents;
    std::vector<ReadCallback> pending;
};

// Plain value holder acting as the selection delegate.
class ValueDelegate : public interaction::TextSelectionDelegate {
public:
    const editing::EditingValue& textEditingValue() const override { return value; }
    void setTextEditingValue(const editing::EditingValue& next) override {
        value = next;
        ++sets;
    }

    editing::EditingValue value;
    int sets = 0;
};

struct FakeInputState {
    bool attached = false;
    int opens = 0;
    int shows = 0;
    int closes = 0;
    std::vector<editing::EditingValue> sentStates;
};

class FakeInputConnection : public interaction::TextInputConnection {
public:
    explicit FakeInputConnection(FakeInputState& state) : state_(state) { state_.attached = true; }

    bool attached() const override { return state_.attached; }
    void setEditingState(const editing::EditingValue& value) override { state_.sentStates.push_back(value); }
    void show() override { ++state_.shows; }
    void close() override {
        ++state_.closes;
        state_.attached = false;
    }

private:
    FakeInputState& state_;
};

class FakeInputService : public interaction::TextInputService {
public:
    std::unique_ptr<interaction::TextInputConnection> open() override {
        ++state.opens;
        return std::make_unique<FakeInputConnection>(state);
    }

    FakeInputState state;
};

} // namespace richedit::test_support

#endif // RICHEDIT_TESTS_TEST_SUPPORT_H
