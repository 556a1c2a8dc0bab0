/**
 * @file    text_renderer.hpp
 * @brief   Text watermark rendering
 * @license MIT
 */

#pragma once

#include "core/font_provider.hpp"
#include "core/watermark_spec.hpp"

#include <opencv2/core.hpp>

namespace pwm {

/**
 * Shadow offset for a font size: max(1, size / 24)
 */
[[nodiscard]] constexpr int shadow_offset(int font_size_px) noexcept {
    return (font_size_px / 24 > 1) ? font_size_px / 24 : 1;
}

/**
 * Render a text watermark onto a copy of `base`
 *
 * The text is measured with the resolved face, placed with the rule and
 * drawn with alpha 255 * opacity / 100; an enabled shadow is drawn first in
 * black at (x + s, y + s) with alpha 160 * opacity / 100. The result keeps
 * the channel layout of `base`.
 *
 * Invalid colors fall back to white and unresolvable fonts leave the image
 * unchanged; neither throws.
 *
 * @param base       Source raster (1, 3 or 4 channels, left unmodified)
 * @param spec       Text watermark description
 * @param placement  Placement rule
 * @param fonts      Font resolution chain
 * @return           Composited raster
 */
[[nodiscard]] cv::Mat render_text_watermark(
    const cv::Mat& base,
    const TextWatermark& spec,
    const PlacementRule& placement,
    const FontResolver& fonts
);

}  // namespace pwm
