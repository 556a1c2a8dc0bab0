/**
 * @file    color.hpp
 * @brief   Color string parsing
 * @license MIT
 */

#pragma once

#include <opencv2/core.hpp>

#include <optional>
#include <string_view>

namespace pwm {

/**
 * Parse a color string into a BGR scalar
 *
 * Accepted forms (case-insensitive, surrounding spaces ignored):
 *   "#RGB", "#RRGGBB", "rgb(r, g, b)", CSS color names ("white", "red", ...)
 *
 * @return  BGR scalar, or std::nullopt if the string is not a color
 */
[[nodiscard]] std::optional<cv::Scalar> parse_color(std::string_view text);

/**
 * Parse a color string, substituting opaque white when it is invalid
 * (logs a warning).
 */
[[nodiscard]] cv::Scalar parse_color_or_white(std::string_view text);

}  // namespace pwm
