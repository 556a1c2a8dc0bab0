/**
 * @file    blend_modes.hpp
 * @brief   Alpha compositing primitives
 * @license MIT
 *
 * @details
 * Source-over compositing on 8-bit BGRA rasters, with straight
 * (non-premultiplied) alpha:
 *
 *   out_a = sa + da * (1 - sa)
 *   out_c = (sc * sa + dc * da * (1 - sa)) / out_a
 *
 * Source pixels with zero alpha leave the destination untouched and fully
 * opaque source pixels replace it exactly.
 */

#pragma once

#include <opencv2/core.hpp>

namespace pwm {

/**
 * Convert any 8-bit raster to BGRA (CV_8UC4)
 * Gray and BGR inputs receive an opaque alpha channel.
 */
[[nodiscard]] cv::Mat to_bgra(const cv::Mat& image);

/**
 * Convert a BGRA working raster back to the channel layout of `reference`
 * (1, 3 or 4 channels).
 */
[[nodiscard]] cv::Mat restore_color_mode(const cv::Mat& bgra, const cv::Mat& reference);

/**
 * Multiply every alpha sample of a BGRA raster by percent / 100 (truncating)
 * Color channels are left untouched.
 */
void scale_alpha(cv::Mat& bgra, int opacity_percent);

/**
 * Composite a BGRA overlay onto a BGRA destination at `pos` (source-over)
 * The overlay is clipped to the destination bounds.
 */
void alpha_blend_over(cv::Mat& dst_bgra, const cv::Mat& src_bgra, const cv::Point& pos);

/**
 * Composite a solid color through an 8-bit coverage mask (glyph raster)
 *
 * Effective source alpha per pixel = coverage * alpha / 255.
 *
 * @param dst_bgra  Destination raster (CV_8UC4)
 * @param coverage  Coverage mask (CV_8UC1)
 * @param bgr       Fill color (B, G, R)
 * @param alpha     Fill alpha (0-255)
 * @param pos       Top-left corner of the mask in destination coordinates
 */
void blend_coverage(
    cv::Mat& dst_bgra,
    const cv::Mat& coverage,
    const cv::Scalar& bgr,
    int alpha,
    const cv::Point& pos
);

}  // namespace pwm
