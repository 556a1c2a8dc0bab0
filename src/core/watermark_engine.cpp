/**
 * @file    watermark_engine.cpp
 * @brief   Photo Watermark - Watermark Engine
 * @license MIT
 *
 * @details
 * Watermark Engine Implementation
 */

#include "core/watermark_engine.hpp"
#include "core/blend_modes.hpp"
#include "core/image_renderer.hpp"
#include "core/text_renderer.hpp"
#include "utils/path_formatter.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace pwm {

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // anonymous namespace

cv::Size fit_preview_size(const cv::Size& image_size, const cv::Size& max_canvas) {
    if (image_size.width <= 0 || image_size.height <= 0) {
        return {0, 0};
    }

    const double scale = std::min({
        static_cast<double>(max_canvas.width) / image_size.width,
        static_cast<double>(max_canvas.height) / image_size.height,
        1.0
    });

    return cv::Size(
        std::max(1, static_cast<int>(image_size.width * scale)),
        std::max(1, static_cast<int>(image_size.height * scale))
    );
}

WatermarkEngine::WatermarkEngine()
    : fonts_(std::make_unique<FontResolver>()) {}

WatermarkEngine::WatermarkEngine(std::unique_ptr<FontResolver> fonts)
    : fonts_(std::move(fonts)) {
    if (!fonts_) {
        throw std::invalid_argument("WatermarkEngine requires a font resolver");
    }
}

cv::Mat WatermarkEngine::apply(
    const cv::Mat& base,
    const WatermarkSpec& spec,
    const PlacementRule& placement) const
{
    if (base.empty()) {
        throw std::runtime_error("Empty image provided");
    }

    return std::visit(overloaded{
        [&](const TextWatermark& text) {
            return render_text_watermark(base, text, placement, *fonts_);
        },
        [&](const ImageWatermark& image) {
            return render_image_watermark(base, image, placement);
        },
    }, spec);
}

PreviewResult WatermarkEngine::render_preview(
    const cv::Mat& base,
    const WatermarkSpec& spec,
    const PlacementRule& placement,
    const cv::Size& max_canvas) const
{
    cv::Mat composite = apply(base, spec, placement);

    const cv::Size canvas = fit_preview_size(composite.size(), max_canvas);
    if (canvas == composite.size()) {
        return PreviewResult{composite, 1.0};
    }

    cv::Mat preview;
    cv::resize(composite, preview, canvas, 0, 0, cv::INTER_AREA);

    spdlog::debug("Preview {}x{} -> {}x{}", composite.cols, composite.rows, canvas.width, canvas.height);
    return PreviewResult{preview, static_cast<double>(canvas.width) / composite.cols};
}

cv::Mat decode_image(const std::filesystem::path& path) {
    cv::Mat raw = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
    if (raw.empty()) {
        throw WatermarkError(ErrorCode::DecodeFailure,
                             fmt::format("Failed to load image: {}", path));
    }

    if (raw.depth() == CV_8U && (raw.channels() == 3 || raw.channels() == 4)) {
        return raw;
    }

    // Gray, gray+alpha and high bit depth sources
    cv::Mat src = raw;
    if (raw.channels() == 2) {
        std::vector<cv::Mat> planes;
        cv::split(raw, planes);
        cv::merge(std::vector<cv::Mat>{planes[0], planes[0], planes[0], planes[1]}, src);
    }

    cv::Mat bgra = to_bgra(src);
    if (src.channels() == 4) {
        return bgra;
    }

    cv::Mat bgr;
    cv::cvtColor(bgra, bgr, cv::COLOR_BGRA2BGR);
    return bgr;
}

std::vector<int> encode_params(const std::string& extension, const ExportOptions& options) {
    std::vector<int> params;

    if (extension == ".jpg" || extension == ".jpeg") {
        params = {cv::IMWRITE_JPEG_QUALITY, std::clamp(options.jpeg_quality, 0, 100)};
        if (options.chroma_subsampling) {
            int factor = cv::IMWRITE_JPEG_SAMPLING_FACTOR_420;
            switch (*options.chroma_subsampling) {
                case ChromaSubsampling::S420: factor = cv::IMWRITE_JPEG_SAMPLING_FACTOR_420; break;
                case ChromaSubsampling::S422: factor = cv::IMWRITE_JPEG_SAMPLING_FACTOR_422; break;
                case ChromaSubsampling::S444: factor = cv::IMWRITE_JPEG_SAMPLING_FACTOR_444; break;
            }
            params.push_back(cv::IMWRITE_JPEG_SAMPLING_FACTOR);
            params.push_back(factor);
        }
    } else if (extension == ".png") {
        params = {cv::IMWRITE_PNG_COMPRESSION, 6};
    } else if (extension == ".webp") {
        params = {cv::IMWRITE_WEBP_QUALITY, std::clamp(options.jpeg_quality, 1, 100)};
    }

    return params;
}

void write_image(
    const std::filesystem::path& output_path,
    const cv::Mat& image,
    const ExportOptions& options)
{
    const std::string ext = lower_extension(output_path);

    cv::Mat encodable = image;
    if ((ext == ".jpg" || ext == ".jpeg") && image.channels() == 4) {
        cv::cvtColor(image, encodable, cv::COLOR_BGRA2BGR);
    }

    std::vector<uchar> buffer;
    bool encoded = false;
    try {
        encoded = cv::imencode(ext, encodable, buffer, encode_params(ext, options));
    } catch (const cv::Exception& e) {
        throw WatermarkError(ErrorCode::EncodeFailure,
                             fmt::format("Failed to encode {}: {}", output_path, e.what()));
    }
    if (!encoded) {
        throw WatermarkError(ErrorCode::EncodeFailure,
                             fmt::format("Failed to encode {}", output_path));
    }

    // Create output directory if needed
    std::error_code ec;
    const auto output_dir = output_path.parent_path();
    if (!output_dir.empty() && !std::filesystem::exists(output_dir, ec)) {
        std::filesystem::create_directories(output_dir, ec);
        if (ec) {
            throw WatermarkError(ErrorCode::WriteFailure,
                                 fmt::format("Cannot create {}: {}", output_dir, ec.message()));
        }
    }

    std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw WatermarkError(ErrorCode::WriteFailure,
                             fmt::format("Failed to write image: {}", output_path));
    }
    out.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    out.close();
    if (!out) {
        throw WatermarkError(ErrorCode::WriteFailure,
                             fmt::format("Failed to write image: {}", output_path));
    }
}

ProcessResult process_image(
    const std::filesystem::path& input_path,
    const std::filesystem::path& output_path,
    const WatermarkEngine& engine,
    const WatermarkSpec& spec,
    const PlacementRule& placement,
    const ExportOptions& options)
{
    ProcessResult result{};
    result.success = false;
    result.code = ErrorCode::Success;

    try {
        cv::Mat image = decode_image(input_path);

        spdlog::info("Processing: {} ({}x{})",
                     input_path.filename(),
                     image.cols, image.rows);

        cv::Mat watermarked = engine.apply(image, spec, placement);
        write_image(output_path, watermarked, options);

        result.success = true;
        result.message = "Watermark added";
        spdlog::info("Saved: {}", output_path.filename());
        return result;

    } catch (const WatermarkError& e) {
        result.code = e.code();
        result.message = e.what();
        spdlog::error("{}: {}", to_string(e.code()), e.what());
        return result;
    } catch (const std::exception& e) {
        // Renderer exceptions (cv::Exception included)
        result.code = ErrorCode::RenderFailure;
        result.message = std::string("Error: ") + e.what();
        spdlog::error("Error processing {}: {}", input_path, e.what());
        return result;
    }
}

} // namespace pwm
