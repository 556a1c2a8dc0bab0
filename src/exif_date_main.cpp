/**
 * @file    exif_date_main.cpp
 * @brief   EXIF Date Watermark - CLI Entry Point
 * @license MIT
 *
 * @details
 * Usage:
 *   exif-date-watermark <file-or-directory> [--font-size 36] [--color #FFFFFF]
 *                       [--position br] [--margin 12] [--font file.ttf]
 */

#include "cli/date_cli.hpp"

int main(int argc, char** argv) {
    return pwm::cli::run_date_tool(argc, argv);
}
