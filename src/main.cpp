/**
 * @file    main.cpp
 * @brief   Photo Watermark - CLI Entry Point
 * @license MIT
 *
 * @details
 * Adds a text or image watermark to a batch of photos.
 *
 * Compositing:
 *   result = alpha * watermark + (1 - alpha) * original
 *
 * Usage:
 *   photo-watermark photos/ -o out/ --text "(c) 2025"
 *   photo-watermark a.jpg -o out/ --image logo.png --position tl --scale 25
 */

#include "cli/cli_app.hpp"

int main(int argc, char** argv) {
    return pwm::cli::run(argc, argv);
}
