/**
 * @file    placement.cpp
 * @brief   Placement rule resolution
 * @license MIT
 */

#include "core/placement.hpp"
#include "core/coordinate_transform.hpp"
#include "core/types.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace pwm {

namespace {

// Floor division, (W - w) can be negative for oversized watermarks
int floor_div2(int value) {
    return (value >= 0) ? value / 2 : -((-value + 1) / 2);
}

}  // anonymous namespace

std::optional<Anchor> parse_anchor(std::string_view text) {
    std::string key(text);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(key.begin(), key.end(), '_', '-');

    if (key == "tl" || key == "top-left")     return Anchor::TopLeft;
    if (key == "tr" || key == "top-right")    return Anchor::TopRight;
    if (key == "bl" || key == "bottom-left")  return Anchor::BottomLeft;
    if (key == "br" || key == "bottom-right") return Anchor::BottomRight;
    if (key == "center" || key == "c")        return Anchor::Center;
    return std::nullopt;
}

cv::Point anchor_position(
    Anchor anchor,
    const cv::Size& image_size,
    const cv::Size& watermark_size,
    int margin)
{
    const int W = image_size.width;
    const int H = image_size.height;
    const int w = watermark_size.width;
    const int h = watermark_size.height;

    switch (anchor) {
        case Anchor::TopLeft:     return {margin, margin};
        case Anchor::TopRight:    return {W - w - margin, margin};
        case Anchor::BottomLeft:  return {margin, H - h - margin};
        case Anchor::BottomRight: return {W - w - margin, H - h - margin};
        case Anchor::Center:      return {floor_div2(W - w), floor_div2(H - h)};
    }
    return {W - w - margin, H - h - margin};
}

cv::Point resolve_placement(
    const PlacementRule& rule,
    const cv::Size& image_size,
    const cv::Size& watermark_size)
{
    if (const auto* preset = std::get_if<PresetPlacement>(&rule)) {
        return anchor_position(preset->anchor, image_size, watermark_size, preset->margin_px);
    }

    const auto& custom = std::get<CustomPlacement>(rule);

    cv::Point pos;
    try {
        pos = to_full_res(custom.preview_point, custom.preview_canvas, image_size);
    } catch (const WatermarkError& e) {
        // Saved templates rely on this recovery; a stricter mode could reject them instead
        spdlog::warn("Custom placement unusable ({}), falling back to bottom-right", e.what());
        return anchor_position(Anchor::BottomRight, image_size, watermark_size,
                               custom.fallback_margin_px);
    }

    const int max_x = std::max(0, image_size.width - watermark_size.width);
    const int max_y = std::max(0, image_size.height - watermark_size.height);

    cv::Point clamped(std::clamp(pos.x, 0, max_x), std::clamp(pos.y, 0, max_y));
    if (clamped != pos) {
        spdlog::debug("Custom placement ({}, {}) clamped to ({}, {})",
                      pos.x, pos.y, clamped.x, clamped.y);
    }
    return clamped;
}

}  // namespace pwm
