/**
 * @file    image_renderer.hpp
 * @brief   Image overlay watermark rendering
 * @license MIT
 */

#pragma once

#include "core/watermark_spec.hpp"

#include <opencv2/core.hpp>

#include <filesystem>
#include <optional>

namespace pwm {

/**
 * Load an overlay image as BGRA
 *
 * @return  CV_8UC4 overlay, or std::nullopt if the file is missing or unreadable
 */
[[nodiscard]] std::optional<cv::Mat> load_overlay(const std::filesystem::path& path);

/**
 * Scale an overlay uniformly by percent / 100 (clamped to 10..100)
 * Both dimensions stay at least one pixel.
 */
[[nodiscard]] cv::Mat scale_overlay(const cv::Mat& overlay, int scale_percent);

/**
 * Composite an already loaded overlay onto a copy of `base`
 *
 * The overlay is scaled, its alpha multiplied by opacity / 100, placed with
 * the rule and blended source-over. Pixels outside the overlay footprint
 * are untouched and `base` itself is never modified.
 *
 * @return  Composite in the channel layout of `base`
 */
[[nodiscard]] cv::Mat composite_overlay(
    const cv::Mat& base,
    const cv::Mat& overlay,
    int scale_percent,
    int opacity_percent,
    const PlacementRule& placement
);

/**
 * Render an image watermark onto a copy of `base`
 *
 * A missing or unreadable overlay asset returns the base image unchanged.
 */
[[nodiscard]] cv::Mat render_image_watermark(
    const cv::Mat& base,
    const ImageWatermark& spec,
    const PlacementRule& placement
);

}  // namespace pwm
