/**
 * @file    placement.hpp
 * @brief   Placement rule resolution
 * @license MIT
 */

#pragma once

#include "core/watermark_spec.hpp"

#include <opencv2/core.hpp>

namespace pwm {

/**
 * Top-left position of a preset anchor
 *
 *   TopLeft     = (m, m)
 *   TopRight    = (W - w - m, m)
 *   BottomLeft  = (m, H - h - m)
 *   BottomRight = (W - w - m, H - h - m)
 *   Center      = ((W - w) / 2, (H - h) / 2)   floor division
 */
[[nodiscard]] cv::Point anchor_position(
    Anchor anchor,
    const cv::Size& image_size,
    const cv::Size& watermark_size,
    int margin
);

/**
 * Resolve a placement rule into top-left pixel coordinates
 *
 * Custom rules are mapped from preview space and clamped into
 * [0, W - w] x [0, H - h] (0 when the watermark is larger than the image).
 * A custom rule whose transform fails falls back to BottomRight with the
 * rule's fallback margin. Never throws.
 *
 * @param rule            Placement rule
 * @param image_size      Full-resolution raster size
 * @param watermark_size  Measured watermark size
 * @return                Top-left corner of the watermark
 */
[[nodiscard]] cv::Point resolve_placement(
    const PlacementRule& rule,
    const cv::Size& image_size,
    const cv::Size& watermark_size
);

}  // namespace pwm
