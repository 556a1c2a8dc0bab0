/**
 * @file    blend_modes.cpp
 * @brief   Alpha compositing primitives
 * @license MIT
 */

#include "core/blend_modes.hpp"

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <stdexcept>

namespace pwm {

namespace {

// Blend one straight-alpha source sample onto a BGRA destination pixel
inline void blend_pixel(uint8_t* dst, uint8_t sb, uint8_t sg, uint8_t sr, uint32_t sa) {
    if (sa == 0) return;

    if (sa == 255) {
        dst[0] = sb;
        dst[1] = sg;
        dst[2] = sr;
        dst[3] = 255;
        return;
    }

    const uint32_t da = dst[3];
    const uint32_t keep = da * (255 - sa);          // scaled by 255
    const uint32_t out_a255 = sa * 255 + keep;      // out_a * 255
    if (out_a255 == 0) return;

    const uint32_t half = out_a255 / 2;
    dst[0] = static_cast<uint8_t>((sb * sa * 255 + dst[0] * keep + half) / out_a255);
    dst[1] = static_cast<uint8_t>((sg * sa * 255 + dst[1] * keep + half) / out_a255);
    dst[2] = static_cast<uint8_t>((sr * sa * 255 + dst[2] * keep + half) / out_a255);
    dst[3] = static_cast<uint8_t>((out_a255 + 127) / 255);
}

// Intersection of a w x h patch at pos with the destination
cv::Rect clip_to(const cv::Mat& dst, const cv::Point& pos, const cv::Size& size) {
    return cv::Rect(pos, size) & cv::Rect(0, 0, dst.cols, dst.rows);
}

}  // anonymous namespace

cv::Mat to_bgra(const cv::Mat& image) {
    if (image.empty()) {
        throw std::runtime_error("Empty image provided");
    }

    cv::Mat src = image;
    if (src.depth() != CV_8U) {
        // 16-bit and float sources are reduced to 8-bit
        const double scale = (src.depth() == CV_16U) ? 1.0 / 257.0
                           : (src.depth() == CV_32F || src.depth() == CV_64F) ? 255.0
                           : 1.0;
        src.convertTo(src, CV_MAKETYPE(CV_8U, src.channels()), scale);
    }

    cv::Mat bgra;
    switch (src.channels()) {
        case 1: cv::cvtColor(src, bgra, cv::COLOR_GRAY2BGRA); break;
        case 3: cv::cvtColor(src, bgra, cv::COLOR_BGR2BGRA);  break;
        case 4: bgra = src.clone();                           break;
        default:
            throw std::runtime_error("Unsupported channel count: " + std::to_string(src.channels()));
    }
    return bgra;
}

cv::Mat restore_color_mode(const cv::Mat& bgra, const cv::Mat& reference) {
    CV_Assert(bgra.type() == CV_8UC4);

    cv::Mat out;
    switch (reference.channels()) {
        case 1: cv::cvtColor(bgra, out, cv::COLOR_BGRA2GRAY); break;
        case 3: cv::cvtColor(bgra, out, cv::COLOR_BGRA2BGR);  break;
        default: out = bgra;                                  break;
    }
    return out;
}

void scale_alpha(cv::Mat& bgra, int opacity_percent) {
    CV_Assert(bgra.type() == CV_8UC4);

    const int opacity = std::clamp(opacity_percent, 0, 100);
    if (opacity == 100) return;

    for (int y = 0; y < bgra.rows; ++y) {
        auto* row = bgra.ptr<uint8_t>(y);
        for (int x = 0; x < bgra.cols; ++x) {
            uint8_t& a = row[x * 4 + 3];
            a = static_cast<uint8_t>(a * opacity / 100);
        }
    }
}

void alpha_blend_over(cv::Mat& dst_bgra, const cv::Mat& src_bgra, const cv::Point& pos) {
    CV_Assert(dst_bgra.type() == CV_8UC4 && src_bgra.type() == CV_8UC4);

    const cv::Rect roi = clip_to(dst_bgra, pos, src_bgra.size());
    if (roi.empty()) {
        spdlog::debug("Overlay at ({}, {}) lies outside {}x{} raster",
                      pos.x, pos.y, dst_bgra.cols, dst_bgra.rows);
        return;
    }

    for (int y = roi.y; y < roi.y + roi.height; ++y) {
        auto* d = dst_bgra.ptr<uint8_t>(y);
        const auto* s = src_bgra.ptr<uint8_t>(y - pos.y);
        for (int x = roi.x; x < roi.x + roi.width; ++x) {
            const uint8_t* sp = s + (x - pos.x) * 4;
            blend_pixel(d + x * 4, sp[0], sp[1], sp[2], sp[3]);
        }
    }
}

void blend_coverage(
    cv::Mat& dst_bgra,
    const cv::Mat& coverage,
    const cv::Scalar& bgr,
    int alpha,
    const cv::Point& pos)
{
    CV_Assert(dst_bgra.type() == CV_8UC4 && coverage.type() == CV_8UC1);

    alpha = std::clamp(alpha, 0, 255);
    if (alpha == 0) return;

    const cv::Rect roi = clip_to(dst_bgra, pos, coverage.size());
    if (roi.empty()) return;

    const auto b = cv::saturate_cast<uint8_t>(bgr[0]);
    const auto g = cv::saturate_cast<uint8_t>(bgr[1]);
    const auto r = cv::saturate_cast<uint8_t>(bgr[2]);

    for (int y = roi.y; y < roi.y + roi.height; ++y) {
        auto* d = dst_bgra.ptr<uint8_t>(y);
        const auto* c = coverage.ptr<uint8_t>(y - pos.y);
        for (int x = roi.x; x < roi.x + roi.width; ++x) {
            const uint32_t sa = (static_cast<uint32_t>(c[x - pos.x]) * alpha + 127) / 255;
            blend_pixel(d + x * 4, b, g, r, sa);
        }
    }
}

}  // namespace pwm
