#include "richedit/text/text_layout.h"

#include "richedit/core/util.h"

#include <algorithm>
#include <cmath>

namespace richedit::text {

// =============================================================================
// Lookup helpers
// =============================================================================

std::size_t TextLayoutEngine::lineIndexForOffset(int offset, TextAffinity affinity) const {
    const auto& lines = layout_.lines;
    if (lines.empty()) {
        return 0;
    }
    std::size_t index = 0;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (static_cast<int>(lines[i].startOffset) <= offset) {
            index = i;
        } else {
            break;
        }
    }
    // Upstream at a soft wrap belongs to the end of the previous line
    if (affinity == TextAffinity::Upstream && index > 0 &&
        static_cast<int>(lines[index].startOffset) == offset && !lines[index - 1].hardBreak) {
        --index;
    }
    return index;
}

std::size_t TextLayoutEngine::lineIndexForY(float y) const {
    const auto& lines = layout_.lines;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (y < lines[i].top + lines[i].lineHeight) {
            return i;
        }
    }
    return lines.empty() ? 0 : lines.size() - 1;
}

const LayoutCluster* TextLayoutEngine::clusterAt(int offset) const {
    const auto& clusters = layout_.clusters;
    if (offset < 0 || clusters.empty()) {
        return nullptr;
    }
    const std::uint32_t target = static_cast<std::uint32_t>(offset);
    auto it = std::upper_bound(clusters.begin(), clusters.end(), target,
        [](std::uint32_t value, const LayoutCluster& c) { return value < c.start; });
    if (it == clusters.begin()) {
        return nullptr;
    }
    --it;
    return target < it->start + it->length ? &*it : nullptr;
}

std::size_t TextLayoutEngine::lineIndexOfCluster(std::uint32_t clusterIndex) const {
    const auto& lines = layout_.lines;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (clusterIndex >= lines[i].startCluster && clusterIndex < lines[i].startCluster + lines[i].clusterCount) {
            return i;
        }
    }
    return lines.empty() ? 0 : lines.size() - 1;
}

Point2 TextLayoutEngine::emptyOffset() const {
    const bool rtl = direction_ == TextDirection::RTL;
    switch (align_) {
        case TextAlign::Left:
            return Point2{0.0f, 0.0f};
        case TextAlign::Right:
            return Point2{layout_.width, 0.0f};
        case TextAlign::Center:
            return Point2{layout_.width * 0.5f, 0.0f};
        case TextAlign::Start:
            return Point2{rtl ? layout_.width : 0.0f, 0.0f};
        case TextAlign::End:
            return Point2{rtl ? 0.0f : layout_.width, 0.0f};
    }
    return Point2{};
}

// =============================================================================
// Caret
// =============================================================================

std::optional<Rect> TextLayoutEngine::rectFromUpstream(int offset, const Rect& caretPrototype) const {
    if (offset <= 0) {
        return std::nullopt;
    }
    const LayoutCluster* c = clusterAt(offset - 1);
    if (!c) {
        return std::nullopt;
    }
    const std::uint32_t clusterIndex = static_cast<std::uint32_t>(c - layout_.clusters.data());
    const std::size_t lineIndex = lineIndexOfCluster(clusterIndex);
    const LayoutLine& line = layout_.lines[lineIndex];

    if (c->newline) {
        // After a newline the caret starts the next line
        if (lineIndex + 1 >= layout_.lines.size()) {
            return std::nullopt;
        }
        const LayoutLine& next = layout_.lines[lineIndex + 1];
        const float dx = emptyOffset().x;
        return Rect{dx, next.top, dx, next.top + next.lineHeight};
    }

    const TextBox box = clusterBox(line, *c);
    float caretEnd = box.end();
    const std::uint32_t clusterEnd = c->start + c->length;
    if (static_cast<std::uint32_t>(offset) < clusterEnd) {
        // Inside a multi-unit cluster (ligature)
        const float fraction = static_cast<float>(offset - static_cast<int>(c->start)) / static_cast<float>(c->length);
        const float width = box.right - box.left;
        caretEnd = c->rtl ? box.right - fraction * width : box.left + fraction * width;
    }
    const float dx = c->rtl ? caretEnd - caretPrototype.width() : caretEnd;
    return Rect{dx, box.top, dx + caretPrototype.width(), box.bottom};
}

std::optional<Rect> TextLayoutEngine::rectFromDownstream(int offset, const Rect& caretPrototype) const {
    const LayoutCluster* c = clusterAt(offset);
    if (!c) {
        return std::nullopt;
    }
    const std::uint32_t clusterIndex = static_cast<std::uint32_t>(c - layout_.clusters.data());
    const LayoutLine& line = layout_.lines[lineIndexOfCluster(clusterIndex)];

    const TextBox box = clusterBox(line, *c);
    float caretStart = box.start();
    if (static_cast<std::uint32_t>(offset) > c->start) {
        const float fraction = static_cast<float>(offset - static_cast<int>(c->start)) / static_cast<float>(c->length);
        const float width = box.right - box.left;
        caretStart = c->rtl ? box.right - fraction * width : box.left + fraction * width;
    }
    const float dx = c->rtl ? caretStart - caretPrototype.width() : caretStart;
    return Rect{dx, box.top, dx + caretPrototype.width(), box.bottom};
}

Point2 TextLayoutEngine::getOffsetForCaret(TextPosition position, const Rect& caretPrototype) const {
    if (text_.empty() || layout_.clusters.empty()) {
        return emptyOffset();
    }
    std::optional<Rect> rect;
    if (position.affinity == TextAffinity::Upstream) {
        rect = rectFromUpstream(position.offset, caretPrototype);
        if (!rect) rect = rectFromDownstream(position.offset, caretPrototype);
    } else {
        rect = rectFromDownstream(position.offset, caretPrototype);
        if (!rect) rect = rectFromUpstream(position.offset, caretPrototype);
    }
    if (!rect) {
        return emptyOffset();
    }
    return Point2{clampF(rect->left, 0.0f, std::max(0.0f, layout_.width)), rect->top};
}

std::optional<float> TextLayoutEngine::getFullHeightForCaret(TextPosition position, const Rect& caretPrototype) const {
    if (text_.empty() || layout_.clusters.empty()) {
        return std::nullopt;
    }
    std::optional<Rect> rect;
    if (position.affinity == TextAffinity::Upstream) {
        rect = rectFromUpstream(position.offset, caretPrototype);
        if (!rect) rect = rectFromDownstream(position.offset, caretPrototype);
    } else {
        rect = rectFromDownstream(position.offset, caretPrototype);
        if (!rect) rect = rectFromUpstream(position.offset, caretPrototype);
    }
    if (!rect) {
        return std::nullopt;
    }
    return rect->height();
}

// =============================================================================
// Hit Testing
// =============================================================================

TextPosition TextLayoutEngine::getPositionForOffset(Point2 offset) const {
    if (layout_.lines.empty()) {
        return TextPosition{0, TextAffinity::Downstream};
    }
    const LayoutLine& line = layout_.lines[lineIndexForY(offset.y)];
    const float x = offset.x - line.xOffset;

    const LayoutCluster* best = nullptr;
    float bestDistance = 0.0f;
    const std::uint32_t end = line.startCluster + line.clusterCount;
    for (std::uint32_t i = line.startCluster; i < end; ++i) {
        const LayoutCluster& c = layout_.clusters[i];
        if (c.newline) continue;
        float distance = 0.0f;
        if (x < c.x) {
            distance = c.x - x;
        } else if (x >= c.x + c.advance) {
            distance = x - (c.x + c.advance);
        }
        // Zero-width clusters (direction marks) only win when nothing else exists
        if (c.advance <= 0.0f) distance += 1e6f;
        if (!best || distance < bestDistance) {
            best = &c;
            bestDistance = distance;
        }
    }
    if (!best) {
        return TextPosition{static_cast<int>(line.startOffset), TextAffinity::Downstream};
    }

    const int start = static_cast<int>(best->start);
    const int finish = static_cast<int>(best->start + best->length);
    const bool leftHalf = x < best->x + best->advance * 0.5f;
    if (best->rtl) {
        return leftHalf ? TextPosition{finish, TextAffinity::Upstream}
                        : TextPosition{start, TextAffinity::Downstream};
    }
    return leftHalf ? TextPosition{start, TextAffinity::Downstream}
                    : TextPosition{finish, TextAffinity::Upstream};
}

} // namespace richedit::text
