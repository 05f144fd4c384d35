#include "richedit/text/text_layout.h"

#include <algorithm>
#include <cmath>

namespace richedit::text {

TextBox TextLayoutEngine::clusterBox(const LayoutLine& line, const LayoutCluster& cluster) const {
    const float left = line.xOffset + cluster.x;
    return TextBox{
        left,
        line.baseline - cluster.ascent,
        left + cluster.advance,
        line.baseline + cluster.descent,
        cluster.rtl ? TextDirection::RTL : TextDirection::LTR
    };
}

std::vector<TextBox> TextLayoutEngine::getBoxesForSelection(
    TextRange range,
    BoxHeightStyle heightStyle,
    BoxWidthStyle widthStyle
) const {
    std::vector<TextBox> boxes;
    if (!range.isValid() || range.isCollapsed()) {
        return boxes;
    }
    const int length = static_cast<int>(text_.size());
    const std::uint32_t s = static_cast<std::uint32_t>(std::min(std::min(range.start, range.end), length));
    const std::uint32_t e = static_cast<std::uint32_t>(std::min(std::max(range.start, range.end), length));
    if (s >= e) {
        return boxes;
    }
    const bool baseRtl = direction_ == TextDirection::RTL;

    const auto& lines = layout_.lines;
    for (std::size_t li = 0; li < lines.size(); ++li) {
        const LayoutLine& line = lines[li];
        if (line.endIncludingNewline <= s || line.startOffset >= e) {
            continue;
        }
        const float lineTop = line.top;
        const float lineBottom = line.top + line.lineHeight;

        std::vector<TextBox> lineBoxes;
        const std::uint32_t end = line.startCluster + line.clusterCount;
        for (std::uint32_t i = line.startCluster; i < end; ++i) {
            const LayoutCluster& c = layout_.clusters[i];
            if (c.newline) continue;
            const std::uint32_t cs = c.start;
            const std::uint32_t ce = c.start + c.length;
            const std::uint32_t o0 = std::max(s, cs);
            const std::uint32_t o1 = std::min(e, ce);
            if (o0 >= o1) continue;

            TextBox box = clusterBox(line, c);
            if (o0 != cs || o1 != ce) {
                const float width = box.right - box.left;
                const float f0 = static_cast<float>(o0 - cs) / static_cast<float>(c.length);
                const float f1 = static_cast<float>(o1 - cs) / static_cast<float>(c.length);
                if (c.rtl) {
                    const float right = box.right;
                    box.right = right - f0 * width;
                    box.left = right - f1 * width;
                } else {
                    const float left = box.left;
                    box.left = left + f0 * width;
                    box.right = left + f1 * width;
                }
            }
            if (heightStyle == BoxHeightStyle::Max) {
                box.top = lineTop;
                box.bottom = lineBottom;
            }
            if (box.right > box.left) {
                lineBoxes.push_back(box);
            }
        }

        std::sort(lineBoxes.begin(), lineBoxes.end(),
            [](const TextBox& a, const TextBox& b) { return a.left < b.left; });

        // Merge visually adjacent boxes of one direction
        std::vector<TextBox> merged;
        for (const TextBox& box : lineBoxes) {
            if (!merged.empty() && merged.back().direction == box.direction &&
                std::fabs(merged.back().right - box.left) < 0.01f) {
                TextBox& prev = merged.back();
                prev.right = box.right;
                prev.top = std::min(prev.top, box.top);
                prev.bottom = std::max(prev.bottom, box.bottom);
            } else {
                merged.push_back(box);
            }
        }

        if (widthStyle == BoxWidthStyle::Max && !merged.empty()) {
            const bool continuesAfter = li + 1 < lines.size() && lines[li + 1].startOffset < e;
            const bool startedBefore = s < line.startOffset;
            const bool extendRight = baseRtl ? startedBefore : continuesAfter;
            const bool extendLeft = baseRtl ? continuesAfter : startedBefore;
            const TextDirection dir = direction_;
            float minLeft = merged.front().left;
            float maxRight = merged.back().right;
            for (const TextBox& b : merged) {
                minLeft = std::min(minLeft, b.left);
                maxRight = std::max(maxRight, b.right);
            }
            if (extendLeft && minLeft > 0.0f) {
                merged.insert(merged.begin(), TextBox{0.0f, lineTop, minLeft, lineBottom, dir});
            }
            if (extendRight && maxRight < layout_.width) {
                merged.push_back(TextBox{maxRight, lineTop, layout_.width, lineBottom, dir});
            }
        }

        boxes.insert(boxes.end(), merged.begin(), merged.end());
    }
    return boxes;
}

std::vector<TextBox> TextLayoutEngine::inlinePlaceholderBoxes() const {
    std::vector<TextBox> boxes;
    const auto& clusters = layout_.clusters;
    for (std::uint32_t i = 0; i < clusters.size(); ++i) {
        if (clusters[i].placeholderIndex < 0) continue;
        boxes.push_back(clusterBox(layout_.lines[lineIndexOfCluster(i)], clusters[i]));
    }
    return boxes;
}

} // namespace richedit::text
