/**
 * @file    image_renderer.cpp
 * @brief   Image overlay watermark rendering
 * @license MIT
 */

#include "core/image_renderer.hpp"
#include "core/blend_modes.hpp"
#include "core/placement.hpp"
#include "core/types.hpp"
#include "utils/path_formatter.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <system_error>

namespace pwm {

std::optional<cv::Mat> load_overlay(const std::filesystem::path& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::is_regular_file(path, ec)) {
        spdlog::warn("{}: {}", to_string(ErrorCode::MissingOverlayAsset), path);
        return std::nullopt;
    }

    cv::Mat raw = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
    if (raw.empty()) {
        spdlog::warn("{}: cannot decode {}", to_string(ErrorCode::MissingOverlayAsset), path);
        return std::nullopt;
    }

    return to_bgra(raw);
}

cv::Mat scale_overlay(const cv::Mat& overlay, int scale_percent) {
    const int percent = std::clamp(scale_percent, 10, 100);
    if (percent == 100) {
        return overlay.clone();
    }

    const cv::Size target(
        std::max(1, overlay.cols * percent / 100),
        std::max(1, overlay.rows * percent / 100)
    );

    // Overlays are only ever shrunk here
    cv::Mat scaled;
    cv::resize(overlay, scaled, target, 0, 0, cv::INTER_AREA);

    spdlog::debug("Overlay scaled {}x{} -> {}x{} ({}%)",
                  overlay.cols, overlay.rows, scaled.cols, scaled.rows, percent);
    return scaled;
}

cv::Mat composite_overlay(
    const cv::Mat& base,
    const cv::Mat& overlay,
    int scale_percent,
    int opacity_percent,
    const PlacementRule& placement)
{
    if (base.empty()) {
        throw std::runtime_error("Empty image provided");
    }

    cv::Mat mark = scale_overlay(to_bgra(overlay), scale_percent);
    scale_alpha(mark, opacity_percent);

    cv::Mat canvas = to_bgra(base);
    const cv::Point pos = resolve_placement(placement, canvas.size(), mark.size());

    spdlog::debug("Image watermark {}x{} at ({}, {}) opacity {}%",
                  mark.cols, mark.rows, pos.x, pos.y, std::clamp(opacity_percent, 0, 100));

    alpha_blend_over(canvas, mark, pos);
    return restore_color_mode(canvas, base);
}

cv::Mat render_image_watermark(
    const cv::Mat& base,
    const ImageWatermark& spec,
    const PlacementRule& placement)
{
    auto overlay = load_overlay(spec.source_path);
    if (!overlay) {
        return base.clone();
    }
    return composite_overlay(base, *overlay, spec.scale_percent, spec.opacity_percent, placement);
}

}  // namespace pwm
