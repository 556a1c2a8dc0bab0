/**
 * @file    cli_app.hpp
 * @brief   photo-watermark command-line application
 * @license MIT
 */

#pragma once

#include <opencv2/core.hpp>

#include <optional>
#include <string_view>

namespace pwm::cli {

/**
 * Run the batch watermark CLI
 *
 * @param argc  Argument count
 * @param argv  Argument values
 * @return      Exit code (0 = every file succeeded)
 */
int run(int argc, char** argv);

/**
 * Parse a preview point "X,Y" (non-negative integers)
 */
[[nodiscard]] std::optional<cv::Point> parse_point(std::string_view text);

/**
 * Parse a preview canvas "WxH" (positive integers, 'x' or 'X')
 */
[[nodiscard]] std::optional<cv::Size> parse_canvas(std::string_view text);

}  // namespace pwm::cli
