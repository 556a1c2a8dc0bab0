/**
 * @file    date_cli.hpp
 * @brief   exif-date-watermark command-line application
 * @license MIT
 *
 * @details
 * Stamps each photo with its EXIF capture date ("YYYY-MM-DD"):
 *
 *   exif-date-watermark ~/photos/trip --font-size 48 --position bl
 *
 * Results go to the sibling directory "<source-dir-name>_watermark"
 * under their original file names.
 */

#pragma once

#include "core/watermark_spec.hpp"

#include <filesystem>

namespace pwm::cli {

/**
 * Run the EXIF date watermark CLI
 *
 * @return  1 if the input path does not exist or holds no supported
 *          images, 0 once per-file processing has run
 */
int run_date_tool(int argc, char** argv);

/**
 * Output directory for an input file or directory:
 *   /a/trip          -> /a/trip_watermark
 *   /a/trip/img.jpg  -> /a/trip_watermark
 */
[[nodiscard]] std::filesystem::path date_output_dir(const std::filesystem::path& input);

/**
 * Export options of the date tool: source format, JPEG quality 95 at
 * 4:2:0, original file names, automatic worker count.
 */
[[nodiscard]] ExportOptions date_export_options(const std::filesystem::path& output_dir);

}  // namespace pwm::cli
