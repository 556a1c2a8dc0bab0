/**
 * @file    text_renderer.cpp
 * @brief   Text watermark rendering
 * @license MIT
 */

#include "core/text_renderer.hpp"
#include "core/blend_modes.hpp"
#include "core/color.hpp"
#include "core/placement.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace pwm {

cv::Mat render_text_watermark(
    const cv::Mat& base,
    const TextWatermark& spec,
    const PlacementRule& placement,
    const FontResolver& fonts)
{
    if (base.empty()) {
        throw std::runtime_error("Empty image provided");
    }

    if (spec.content.empty()) {
        spdlog::debug("Empty watermark text, nothing to draw");
        return base.clone();
    }

    const FontRequest request{
        .family = spec.font_family,
        .file = spec.font_file,
        .size_px = std::max(1, spec.font_size_px),
        .bold = spec.bold,
        .italic = spec.italic,
    };

    const auto face = fonts.resolve(request, spec.content);
    if (!face) {
        return base.clone();
    }

    const cv::Mat glyphs = face->rasterize(spec.content);
    if (glyphs.empty()) {
        spdlog::debug("Text '{}' has no visible glyphs", spec.content);
        return base.clone();
    }

    // Promote to BGRA so the watermark can carry its own opacity
    cv::Mat canvas = to_bgra(base);

    const cv::Point pos = resolve_placement(placement, canvas.size(), glyphs.size());
    const int opacity = std::clamp(spec.opacity_percent, 0, 100);
    const cv::Scalar color = parse_color_or_white(spec.color);

    spdlog::debug("Text watermark '{}' {}x{} at ({}, {}) opacity {}%",
                  spec.content, glyphs.cols, glyphs.rows, pos.x, pos.y, opacity);

    if (spec.shadow) {
        const int s = shadow_offset(request.size_px);
        blend_coverage(canvas, glyphs, cv::Scalar(0, 0, 0), 160 * opacity / 100,
                       cv::Point(pos.x + s, pos.y + s));
    }

    blend_coverage(canvas, glyphs, color, 255 * opacity / 100, pos);

    return restore_color_mode(canvas, base);
}

}  // namespace pwm
