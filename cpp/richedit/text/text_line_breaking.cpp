#include "richedit/text/text_layout.h"

#include <algorithm>

namespace richedit::text {

namespace {

// Absorbs float accumulation error when a line fits exactly
constexpr float kWidthEpsilon = 1e-3f;

} // namespace

void TextLayoutEngine::breakLines(float maxWidth) {
    layout_.lines.clear();
    const auto& clusters = layout_.clusters;
    const std::uint32_t count = static_cast<std::uint32_t>(clusters.size());
    if (count == 0) {
        addEmptyLine(0, false);
        return;
    }

    std::uint32_t first = 0;
    float width = 0.0f;
    int lastBreak = -1;

    for (std::uint32_t i = 0; i < count; ++i) {
        const LayoutCluster& c = clusters[i];
        if (c.newline) {
            finishLine(first, i, true);
            first = i + 1;
            width = 0.0f;
            lastBreak = -1;
            continue;
        }

        if (!c.whitespace) {
            while (i > first && width + c.advance > maxWidth + kWidthEpsilon) {
                if (lastBreak >= static_cast<int>(first)) {
                    // Wrap at the last opportunity
                    const std::uint32_t breakAt = static_cast<std::uint32_t>(lastBreak);
                    finishLine(first, breakAt, false);
                    first = breakAt + 1;
                    lastBreak = -1;
                    width = 0.0f;
                    for (std::uint32_t k = first; k < i; ++k) width += clusters[k].advance;
                } else {
                    // No opportunity on this line: break between clusters
                    finishLine(first, i - 1, false);
                    first = i;
                    width = 0.0f;
                }
            }
        }

        width += c.advance;
        if (c.breakAfter) {
            lastBreak = static_cast<int>(i);
        }
    }

    if (first < count) {
        finishLine(first, count - 1, false);
    } else {
        // Text ends with a newline: the caret needs a line after it
        addEmptyLine(static_cast<std::uint32_t>(text_.size()), false);
    }
}

void TextLayoutEngine::finishLine(std::uint32_t first, std::uint32_t last, bool hardBreak) {
    const auto& clusters = layout_.clusters;
    const LayoutCluster& tail = clusters[last];

    LayoutLine line{};
    line.startCluster = first;
    line.clusterCount = last - first + 1;
    line.startOffset = clusters[first].start;
    line.endIncludingNewline = tail.start + tail.length;
    line.endOffset = tail.newline ? tail.start : line.endIncludingNewline;
    line.hardBreak = hardBreak;

    float full = 0.0f;
    float trailingWhitespace = 0.0f;
    for (std::uint32_t i = first; i <= last; ++i) {
        const LayoutCluster& c = clusters[i];
        line.ascent = std::max(line.ascent, c.ascent);
        line.descent = std::max(line.descent, c.descent);
        if (c.newline) continue;
        full += c.advance;
        trailingWhitespace = c.whitespace ? trailingWhitespace + c.advance : 0.0f;
    }
    line.fullWidth = full;
    line.width = full - trailingWhitespace;
    line.lineHeight = line.ascent + line.descent;
    line.top = layout_.lines.empty() ? 0.0f : layout_.lines.back().top + layout_.lines.back().lineHeight;
    line.baseline = line.top + line.ascent;

    positionLine(line);
    layout_.lines.push_back(line);
}

void TextLayoutEngine::addEmptyLine(std::uint32_t offset, bool hardBreak) {
    const FontMetrics m = baseMetrics();
    LayoutLine line{};
    line.startCluster = static_cast<std::uint32_t>(layout_.clusters.size());
    line.clusterCount = 0;
    line.startOffset = offset;
    line.endOffset = offset;
    line.endIncludingNewline = offset;
    line.ascent = m.ascender + m.lineGap * 0.5f;
    line.descent = -m.descender + m.lineGap * 0.5f;
    line.lineHeight = line.ascent + line.descent;
    line.top = layout_.lines.empty() ? 0.0f : layout_.lines.back().top + layout_.lines.back().lineHeight;
    line.baseline = line.top + line.ascent;
    line.hardBreak = hardBreak;
    layout_.lines.push_back(line);
}

/**
 * Assign line-relative x positions in visual order.
 *
 * Runs of equal direction are laid out left to right; RTL runs place their
 * clusters right to left, and an RTL paragraph reverses the run order.
 */
void TextLayoutEngine::positionLine(LayoutLine& line) {
    auto& clusters = layout_.clusters;
    const bool baseRtl = direction_ == TextDirection::RTL;

    struct Run {
        std::uint32_t first;
        std::uint32_t last;
        bool rtl;
    };
    std::vector<Run> runs;
    const std::uint32_t end = line.startCluster + line.clusterCount;
    for (std::uint32_t i = line.startCluster; i < end; ++i) {
        if (clusters[i].newline) continue;
        if (!runs.empty() && runs.back().rtl == clusters[i].rtl && runs.back().last + 1 == i) {
            runs.back().last = i;
        } else {
            runs.push_back(Run{i, i, clusters[i].rtl});
        }
    }
    if (baseRtl) {
        std::reverse(runs.begin(), runs.end());
    }

    float x = 0.0f;
    for (const Run& run : runs) {
        if (!run.rtl) {
            for (std::uint32_t i = run.first; i <= run.last; ++i) {
                clusters[i].x = x;
                x += clusters[i].advance;
            }
        } else {
            for (std::uint32_t i = run.last + 1; i-- > run.first;) {
                clusters[i].x = x;
                x += clusters[i].advance;
            }
        }
    }

    // Newline sits at the logical end of the line
    for (std::uint32_t i = line.startCluster; i < end; ++i) {
        if (clusters[i].newline) {
            clusters[i].x = baseRtl ? 0.0f : line.fullWidth;
        }
    }
}

void TextLayoutEngine::alignLines() {
    const bool baseRtl = direction_ == TextDirection::RTL;
    TextAlign align = align_;
    if (align == TextAlign::Start) align = baseRtl ? TextAlign::Right : TextAlign::Left;
    if (align == TextAlign::End) align = baseRtl ? TextAlign::Left : TextAlign::Right;

    for (LayoutLine& line : layout_.lines) {
        // Trailing whitespace hangs past the aligned edge
        const float visibleLeft = baseRtl ? line.fullWidth - line.width : 0.0f;
        float targetLeft = 0.0f;
        switch (align) {
            case TextAlign::Right:
                targetLeft = layout_.width - line.width;
                break;
            case TextAlign::Center:
                targetLeft = (layout_.width - line.width) * 0.5f;
                break;
            default:
                break;
        }
        line.xOffset = targetLeft - visibleLeft;
    }
}

} // namespace richedit::text
