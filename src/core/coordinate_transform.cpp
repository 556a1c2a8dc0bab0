/**
 * @file    coordinate_transform.cpp
 * @brief   Preview-space to full-resolution coordinate mapping
 * @license MIT
 */

#include "core/coordinate_transform.hpp"
#include "core/types.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <climits>
#include <cmath>

namespace pwm {

cv::Point to_full_res(
    const cv::Point& point,
    const cv::Size& preview_canvas,
    const cv::Size& full_size)
{
    if (preview_canvas.width <= 0 || preview_canvas.height <= 0) {
        throw WatermarkError(
            ErrorCode::InvalidTransform,
            fmt::format("Preview canvas {}x{} cannot be mapped to {}x{}",
                        preview_canvas.width, preview_canvas.height,
                        full_size.width, full_size.height));
    }

    // Multiply before dividing so integer ratios stay exact
    double x = static_cast<double>(point.x) * full_size.width / preview_canvas.width;
    double y = static_cast<double>(point.y) * full_size.height / preview_canvas.height;

    // Saturate far-off points so the caller's clamp still sees the right side
    x = std::clamp(x, static_cast<double>(INT_MIN), static_cast<double>(INT_MAX));
    y = std::clamp(y, static_cast<double>(INT_MIN), static_cast<double>(INT_MAX));

    return cv::Point(static_cast<int>(std::lround(x)), static_cast<int>(std::lround(y)));
}

}  // namespace pwm
