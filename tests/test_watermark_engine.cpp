/**
 * @file    test_watermark_engine.cpp
 * @brief   Engine dispatch, preview, decode and encode
 * @license MIT
 */

#include "core/watermark_engine.hpp"
#include "test_helpers.hpp"

#include <opencv2/imgcodecs.hpp>
#include <gtest/gtest.h>

#include <fstream>

using namespace pwm;
using pwm::test::changed_pixels;
using pwm::test::solid_bgr;
using pwm::test::solid_bgra;

namespace {

std::unique_ptr<FontResolver> bundled_fonts() {
    std::vector<std::unique_ptr<FontProvider>> providers;
    providers.push_back(std::make_unique<BundledFontProvider>());
    return std::make_unique<FontResolver>(std::move(providers));
}

TextWatermark text(const std::string& content) {
    TextWatermark spec;
    spec.content = content;
    spec.font_size_px = 48;
    return spec;
}

}  // namespace

TEST(WatermarkEngine, FitPreviewSize) {
    EXPECT_EQ(fit_preview_size({4000, 3000}, {800, 600}), cv::Size(800, 600));
    EXPECT_EQ(fit_preview_size({1600, 600}, {800, 600}), cv::Size(800, 300));
    EXPECT_EQ(fit_preview_size({600, 1200}, {800, 600}), cv::Size(300, 600));
    EXPECT_EQ(fit_preview_size({640, 480}, {800, 600}), cv::Size(640, 480));   // never upscaled
}

TEST(WatermarkEngine, RejectsNullFontResolver) {
    EXPECT_THROW(WatermarkEngine engine{std::unique_ptr<FontResolver>{}}, std::invalid_argument);
}

TEST(WatermarkEngine, DispatchesTextWatermark) {
    const WatermarkEngine engine(bundled_fonts());
    const cv::Mat base = solid_bgr(320, 240, {0, 0, 0});

    const cv::Mat out = engine.apply(base, text("Sample"), PresetPlacement{});
    EXPECT_EQ(out.size(), base.size());
    EXPECT_GT(changed_pixels(out, base), 0);
}

TEST(WatermarkEngine, DispatchesImageWatermark) {
    test::TempDir dir("engine_logo");
    const auto logo = dir / "logo.png";
    ASSERT_TRUE(cv::imwrite(logo.string(), solid_bgra(10, 10, {255, 255, 255, 255})));

    const WatermarkEngine engine(bundled_fonts());
    const cv::Mat base = solid_bgr(100, 100, {0, 0, 0});

    ImageWatermark spec;
    spec.source_path = logo;
    const cv::Mat out = engine.apply(base, spec, PresetPlacement{Anchor::Center, 0});
    EXPECT_EQ(changed_pixels(out, base), 100);
}

TEST(WatermarkEngine, EmptyBaseThrows) {
    const WatermarkEngine engine(bundled_fonts());
    EXPECT_THROW((void)engine.apply(cv::Mat(), text("x"), PresetPlacement{}), std::runtime_error);
}

TEST(WatermarkEngine, PreviewMatchesDownscaledExport) {
    const WatermarkEngine engine(bundled_fonts());
    const cv::Mat base = solid_bgr(1600, 1200, {30, 30, 30});
    const WatermarkSpec spec = text("Preview");

    const PreviewResult preview = engine.render_preview(base, spec, PresetPlacement{});
    EXPECT_EQ(preview.image.size(), cv::Size(800, 600));
    EXPECT_DOUBLE_EQ(preview.scale, 0.5);

    cv::Mat expected;
    cv::resize(engine.apply(base, spec, PresetPlacement{}), expected, {800, 600}, 0, 0, cv::INTER_AREA);
    EXPECT_EQ(changed_pixels(preview.image, expected), 0);
}

TEST(WatermarkEngine, SmallImagePreviewIsFullSize) {
    const WatermarkEngine engine(bundled_fonts());
    const PreviewResult preview = engine.render_preview(solid_bgr(400, 300, {0, 0, 0}), text("x"), PresetPlacement{});
    EXPECT_EQ(preview.image.size(), cv::Size(400, 300));
    EXPECT_DOUBLE_EQ(preview.scale, 1.0);
}

TEST(DecodeImage, NormalizesGrayAndDeepImages) {
    test::TempDir dir("decode");

    const auto gray = dir / "gray.png";
    ASSERT_TRUE(cv::imwrite(gray.string(), cv::Mat(8, 8, CV_8UC1, cv::Scalar(90))));
    const cv::Mat g = decode_image(gray);
    EXPECT_EQ(g.type(), CV_8UC3);
    EXPECT_EQ(g.at<cv::Vec3b>(0, 0), cv::Vec3b(90, 90, 90));

    const auto deep = dir / "deep.png";
    ASSERT_TRUE(cv::imwrite(deep.string(), cv::Mat(8, 8, CV_16UC3, cv::Scalar(65535, 0, 0))));
    const cv::Mat d = decode_image(deep);
    EXPECT_EQ(d.type(), CV_8UC3);
    EXPECT_EQ(d.at<cv::Vec3b>(0, 0), cv::Vec3b(255, 0, 0));

    const auto alpha = dir / "alpha.png";
    ASSERT_TRUE(cv::imwrite(alpha.string(), solid_bgra(8, 8, {1, 2, 3, 128})));
    EXPECT_EQ(decode_image(alpha).type(), CV_8UC4);
}

TEST(DecodeImage, CorruptFileIsDecodeFailure) {
    test::TempDir dir("decode_bad");
    const auto bad = dir / "bad.jpg";
    std::ofstream(bad) << "definitely not a jpeg";

    try {
        (void)decode_image(bad);
        FAIL() << "expected WatermarkError";
    } catch (const WatermarkError& e) {
        EXPECT_EQ(e.code(), ErrorCode::DecodeFailure);
    }
}

TEST(EncodeParams, FollowExtension) {
    ExportOptions options;
    options.jpeg_quality = 80;

    EXPECT_EQ(encode_params(".jpg", options), (std::vector<int>{cv::IMWRITE_JPEG_QUALITY, 80}));
    EXPECT_EQ(encode_params(".png", options), (std::vector<int>{cv::IMWRITE_PNG_COMPRESSION, 6}));
    EXPECT_TRUE(encode_params(".bmp", options).empty());

    options.chroma_subsampling = ChromaSubsampling::S420;
    EXPECT_EQ(encode_params(".jpeg", options),
              (std::vector<int>{cv::IMWRITE_JPEG_QUALITY, 80,
                                cv::IMWRITE_JPEG_SAMPLING_FACTOR, cv::IMWRITE_JPEG_SAMPLING_FACTOR_420}));
}

TEST(WriteImage, CreatesDirectoriesAndDropsAlphaForJpeg) {
    test::TempDir dir("write");
    const auto out = dir.path() / "nested" / "deeper" / "result.jpg";

    write_image(out, solid_bgra(16, 16, {0, 0, 255, 255}), ExportOptions{});
    ASSERT_TRUE(std::filesystem::exists(out));

    const cv::Mat back = cv::imread(out.string(), cv::IMREAD_UNCHANGED);
    EXPECT_EQ(back.channels(), 3);
}

TEST(WriteImage, PngKeepsPixelsExactly) {
    test::TempDir dir("write_png");
    const auto out = dir / "exact.png";
    const cv::Mat img = solid_bgr(10, 10, {12, 34, 56});

    write_image(out, img, ExportOptions{});
    EXPECT_EQ(changed_pixels(cv::imread(out.string()), img), 0);
}

TEST(ProcessImage, ReportsDecodeFailureWithoutThrowing) {
    test::TempDir dir("process");
    const auto bad = dir / "broken.png";
    std::ofstream(bad) << "garbage";

    const WatermarkEngine engine(bundled_fonts());
    ProcessResult r = process_image(bad, dir / "out.png", engine, text("x"), PresetPlacement{}, ExportOptions{});
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.code, ErrorCode::DecodeFailure);
    EXPECT_FALSE(std::filesystem::exists(dir / "out.png"));
}

TEST(ProcessImage, WritesWatermarkedFile) {
    test::TempDir dir("process_ok");
    const auto in = dir / "in.png";
    ASSERT_TRUE(cv::imwrite(in.string(), solid_bgr(200, 100, {0, 0, 0})));

    const WatermarkEngine engine(bundled_fonts());
    ProcessResult r = process_image(in, dir / "out.png", engine, text("OK"), PresetPlacement{}, ExportOptions{});
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.code, ErrorCode::Success);

    const cv::Mat written = cv::imread((dir / "out.png").string());
    ASSERT_FALSE(written.empty());
    EXPECT_GT(cv::countNonZero(written.reshape(1)), 0);
}
