/**
 * @file    ascii_logo.hpp
 * @brief   ASCII art banner for the command-line tools
 * @license MIT
 */

#pragma once

namespace pwm {

inline constexpr const char* ASCII_BANNER = R"(
  +-------------------------------------------+
  |   P H O T O   W A T E R M A R K           |
  |   text & image watermarks for photo sets  |
  +-------------------------------------------+
)";

}  // namespace pwm
