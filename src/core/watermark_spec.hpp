/**
 * @file    watermark_spec.hpp
 * @brief   Value records describing what to draw, where, and how to export
 * @license MIT
 *
 * @details
 * All records are plain values built by the caller for one operation.
 * Exclusive choices are modelled as std::variant so the engine never has
 * to parse or reconcile flags:
 *
 *   WatermarkSpec = TextWatermark | ImageWatermark
 *   PlacementRule = PresetPlacement | CustomPlacement
 *   NamingPolicy  = KeepOriginal | AddPrefix | AddSuffix
 */

#pragma once

#include <opencv2/core.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace pwm {

// =============================================================================
// Watermark content
// =============================================================================

struct TextWatermark {
    std::string content;
    std::string font_family;                        // Family name or font file path
    std::optional<std::filesystem::path> font_file; // Explicit .ttf/.otf/.ttc
    int font_size_px{36};
    bool bold{false};
    bool italic{false};
    std::string color{"#FFFFFF"};                   // CSS name, #RGB, #RRGGBB, rgb()
    int opacity_percent{100};                       // 0..100
    bool shadow{false};
};

struct ImageWatermark {
    std::filesystem::path source_path;
    int scale_percent{100};                         // 10..100
    int opacity_percent{100};                       // 0..100
};

using WatermarkSpec = std::variant<TextWatermark, ImageWatermark>;

// =============================================================================
// Placement
// =============================================================================

enum class Anchor {
    TopLeft,
    TopRight,
    BottomLeft,
    BottomRight,
    Center
};

inline constexpr int kDefaultMargin = 12;

struct PresetPlacement {
    Anchor anchor{Anchor::BottomRight};
    int margin_px{kDefaultMargin};
};

/**
 * Free-form position picked on a scaled preview.
 * The preview canvas size is part of the rule so the point can be mapped
 * onto a raster of any size; a zero canvas makes the rule invalid and the
 * resolver falls back to BottomRight with fallback_margin_px.
 */
struct CustomPlacement {
    cv::Point preview_point{0, 0};
    cv::Size preview_canvas{0, 0};
    int fallback_margin_px{kDefaultMargin};
};

using PlacementRule = std::variant<PresetPlacement, CustomPlacement>;

[[nodiscard]] constexpr std::string_view to_string(Anchor anchor) noexcept {
    switch (anchor) {
        case Anchor::TopLeft:     return "tl";
        case Anchor::TopRight:    return "tr";
        case Anchor::BottomLeft:  return "bl";
        case Anchor::BottomRight: return "br";
        case Anchor::Center:      return "center";
        default:                  return "unknown";
    }
}

/**
 * Parse "tl", "tr", "bl", "br", "center" (also the long names,
 * e.g. "bottom-right"), case-insensitive.
 */
[[nodiscard]] std::optional<Anchor> parse_anchor(std::string_view text);

// =============================================================================
// Export options
// =============================================================================

enum class OutputFormat {
    Jpeg,
    Png,
    Source      // Keep the source file's extension and codec
};

enum class ChromaSubsampling {
    S420,
    S422,
    S444
};

struct KeepOriginal {};

struct AddPrefix {
    std::string prefix{"wm_"};
};

struct AddSuffix {
    std::string suffix{"_watermarked"};
};

using NamingPolicy = std::variant<KeepOriginal, AddPrefix, AddSuffix>;

struct ExportOptions {
    std::filesystem::path output_dir;
    OutputFormat format{OutputFormat::Jpeg};
    int jpeg_quality{95};                               // 0..100
    std::optional<ChromaSubsampling> chroma_subsampling;
    NamingPolicy naming{KeepOriginal{}};
    unsigned worker_count{1};                           // 0 = auto
};

}  // namespace pwm
