#ifndef RICHEDIT_TEXT_INLINE_CONTENT_H
#define RICHEDIT_TEXT_INLINE_CONTENT_H

#include "richedit/core/types.h"
#include "richedit/text/text_types.h"
#include <limits>
#include <optional>

namespace richedit::text {

/**
 * InlineContent: externally rendered visual content that stands in for one
 * reserved code point (an emoji image, a chip, ...).
 *
 * Owned by the caller. The core only holds non-owning pointers for the
 * duration of a layout pass and never paints it; it sizes it, positions it
 * and forwards hit tests to it.
 */
class InlineContent {
public:
    virtual ~InlineContent() = default;

    /**
     * Full layout under a width constraint (height unconstrained).
     * @return Laid out size
     */
    virtual Size layout(float maxWidth) = 0;

    /**
     * Size the content would take without committing a layout.
     */
    virtual Size dryLayout(float maxWidth) const = 0;

    /**
     * Distance from the top of the content to the given baseline, valid after layout().
     * std::nullopt when the content has no baseline of that kind.
     */
    virtual std::optional<float> distanceToBaseline(TextBaseline baseline) const {
        (void)baseline;
        return std::nullopt;
    }

    virtual float minIntrinsicWidth() const { return dryLayout(0.0f).width; }
    virtual float maxIntrinsicWidth() const { return dryLayout(kUnboundedWidth).width; }

    /**
     * Hit test in the content's own coordinate space (unscaled).
     */
    virtual bool hitTest(Point2 local) const {
        (void)local;
        return false;
    }

    static constexpr float kUnboundedWidth = std::numeric_limits<float>::infinity();
};

} // namespace richedit::text

#endif // RICHEDIT_TEXT_INLINE_CONTENT_H
