/**
 * @file    coordinate_transform.hpp
 * @brief   Preview-space to full-resolution coordinate mapping
 * @license MIT
 */

#pragma once

#include <opencv2/core.hpp>

namespace pwm {

/**
 * Map a point picked on a scaled preview back to full-resolution space
 *
 * Horizontal and vertical scale factors are independent:
 *   x' = round(x * full.width  / preview.width)
 *   y' = round(y * full.height / preview.height)
 *
 * @param point           Point in preview coordinates
 * @param preview_canvas  Size of the preview the point was captured on
 * @param full_size       Size of the full-resolution raster
 * @return                Point in full-resolution coordinates
 * @throws WatermarkError (InvalidTransform) if a preview dimension is not positive
 */
[[nodiscard]] cv::Point to_full_res(
    const cv::Point& point,
    const cv::Size& preview_canvas,
    const cv::Size& full_size
);

}  // namespace pwm
