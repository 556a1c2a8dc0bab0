/**
 * @file    test_batch_export.cpp
 * @brief   Naming, file discovery and the batch export pipeline
 * @license MIT
 */

#include "core/batch_export.hpp"
#include "test_helpers.hpp"

#include <opencv2/imgcodecs.hpp>
#include <gtest/gtest.h>

#include <fstream>

namespace fs = std::filesystem;
using namespace pwm;

namespace {

std::unique_ptr<FontResolver> bundled_fonts() {
    std::vector<std::unique_ptr<FontProvider>> providers;
    providers.push_back(std::make_unique<BundledFontProvider>());
    return std::make_unique<FontResolver>(std::move(providers));
}

WatermarkSpec stamp() {
    TextWatermark spec;
    spec.content = "(c) test";
    spec.font_size_px = 20;
    return spec;
}

void write_sample(const fs::path& path) {
    ASSERT_TRUE(cv::imwrite(path.string(), test::solid_bgr(120, 80, {60, 90, 120})));
}

void write_garbage(const fs::path& path) {
    std::ofstream(path) << "corrupt";
}

class BatchExportTest : public ::testing::TestWithParam<unsigned> {
protected:
    BatchExportTest() : engine_(bundled_fonts()) {}

    ExportOptions options(unsigned workers) const {
        ExportOptions opt;
        opt.output_dir = out_.path();
        opt.format = OutputFormat::Png;
        opt.worker_count = workers;
        return opt;
    }

    test::TempDir in_{"batch_in"};
    test::TempDir out_{"batch_out"};
    WatermarkEngine engine_;
};

}  // namespace

// =============================================================================
// Naming
// =============================================================================

TEST(OutputNaming, PrefixSuffixAndKeep) {
    EXPECT_EQ(output_filename("photo.png", AddPrefix{"wm_"}, OutputFormat::Jpeg), "wm_photo.jpg");
    EXPECT_EQ(output_filename("dir/photo.tiff", AddPrefix{"wm_"}, OutputFormat::Jpeg), "wm_photo.jpg");
    EXPECT_EQ(output_filename("photo.jpg", AddSuffix{"_watermarked"}, OutputFormat::Png),
              "photo_watermarked.png");
    EXPECT_EQ(output_filename("photo.JPG", KeepOriginal{}, OutputFormat::Png), "photo.png");
    EXPECT_EQ(output_filename("photo.JPG", KeepOriginal{}, OutputFormat::Source), "photo.JPG");
}

TEST(OutputNaming, PathJoinsOutputDirectory) {
    ExportOptions opt;
    opt.output_dir = "exports";
    opt.naming = AddSuffix{"_wm"};
    EXPECT_EQ(output_path_for("in/a.png", opt), fs::path("exports") / "a_wm.jpg");
}

// =============================================================================
// Discovery
// =============================================================================

TEST(CollectImages, ExpandsDirectoryInSortedOrder) {
    test::TempDir dir("collect");
    for (const char* name : {"c.png", "a.JPG", "b.webp", "notes.txt", "d.bmp"}) {
        std::ofstream(dir / name) << "x";
    }
    fs::create_directories(dir / "sub");
    std::ofstream(dir.path() / "sub" / "e.jpg") << "x";

    const auto files = collect_images(dir.path(), kExportExtensions);
    ASSERT_EQ(files.size(), 4u);
    EXPECT_EQ(files[0].filename(), "a.JPG");
    EXPECT_EQ(files[1].filename(), "b.webp");
    EXPECT_EQ(files[2].filename(), "c.png");
    EXPECT_EQ(files[3].filename(), "d.bmp");

    // The date tool does not take BMP
    EXPECT_EQ(collect_images(dir.path(), kDateToolExtensions).size(), 3u);
}

TEST(CollectImages, SingleFileAndMissingPath) {
    test::TempDir dir("collect_file");
    std::ofstream(dir / "one.tif") << "x";
    std::ofstream(dir / "one.gif") << "x";

    EXPECT_EQ(collect_images(dir / "one.tif", kExportExtensions).size(), 1u);
    EXPECT_TRUE(collect_images(dir / "one.gif", kExportExtensions).empty());
    EXPECT_TRUE(collect_images(dir / "nope", kExportExtensions).empty());
}

// =============================================================================
// Pipeline
// =============================================================================

TEST_P(BatchExportTest, CorruptFileFailsOthersSucceed) {
    write_sample(in_ / "a.png");
    write_sample(in_ / "b.png");
    write_garbage(in_ / "c.png");
    write_sample(in_ / "d.png");

    const auto files = collect_images(in_.path(), kExportExtensions);
    BatchResult result;
    EXPECT_NO_THROW(result = run_batch_export(files, engine_, stamp(), PresetPlacement{}, options(GetParam())));

    ASSERT_EQ(result.succeeded.size(), 3u);
    ASSERT_EQ(result.failed.size(), 1u);
    EXPECT_TRUE(result.skipped.empty());
    EXPECT_FALSE(result.cancelled);

    EXPECT_EQ(result.failed[0].path.filename(), "c.png");
    EXPECT_EQ(result.failed[0].code, ErrorCode::DecodeFailure);

    // Input order is preserved
    EXPECT_EQ(result.succeeded[0].source.filename(), "a.png");
    EXPECT_EQ(result.succeeded[2].source.filename(), "d.png");
    for (const auto& ok : result.succeeded) {
        EXPECT_TRUE(fs::exists(ok.output)) << ok.output;
        EXPECT_EQ(ok.output.parent_path(), out_.path());
    }
}

TEST_P(BatchExportTest, DuplicateDestinationsFail) {
    write_sample(in_ / "a.png");
    write_sample(in_ / "a.jpg");

    const auto files = collect_images(in_.path(), kExportExtensions);
    ASSERT_EQ(files.size(), 2u);

    const BatchResult result = run_batch_export(files, engine_, stamp(), PresetPlacement{}, options(GetParam()));
    ASSERT_EQ(result.succeeded.size(), 1u);
    ASSERT_EQ(result.failed.size(), 1u);
    EXPECT_EQ(result.succeeded[0].source.filename(), "a.jpg");
    EXPECT_EQ(result.failed[0].path.filename(), "a.png");
    EXPECT_EQ(result.failed[0].code, ErrorCode::DuplicateOutput);
}

TEST_P(BatchExportTest, ProgressReportsEveryFile) {
    for (const char* name : {"1.png", "2.png", "3.png", "4.png", "5.png"}) {
        write_sample(in_ / name);
    }
    const auto files = collect_images(in_.path(), kExportExtensions);

    std::vector<size_t> seen;
    BatchControl control;
    control.on_progress = [&seen](size_t completed, size_t total) {
        EXPECT_EQ(total, 5u);
        seen.push_back(completed);
    };

    const BatchResult result = run_batch_export(files, engine_, stamp(), PresetPlacement{},
                                                options(GetParam()), control);
    EXPECT_EQ(result.succeeded.size(), 5u);
    EXPECT_EQ(seen, (std::vector<size_t>{1, 2, 3, 4, 5}));
}

TEST_P(BatchExportTest, CancelledBeforeStartProcessesNothing) {
    write_sample(in_ / "a.png");
    write_sample(in_ / "b.png");
    const auto files = collect_images(in_.path(), kExportExtensions);

    std::atomic<bool> cancel{true};
    BatchControl control;
    control.cancel_flag = &cancel;

    const BatchResult result = run_batch_export(files, engine_, stamp(), PresetPlacement{},
                                                options(GetParam()), control);
    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.processed(), 0u);
    EXPECT_TRUE(fs::is_empty(out_.path()));
}

TEST_P(BatchExportTest, ProviderCanSkipFiles) {
    write_sample(in_ / "keep.png");
    write_sample(in_ / "skip.png");
    const auto files = collect_images(in_.path(), kExportExtensions);

    const SpecProvider provider = [](const fs::path& file) -> SpecDecision {
        if (file.stem() == "skip") {
            return SkipFile{ErrorCode::MissingMetadataDate, "No date"};
        }
        return stamp();
    };

    const BatchResult result = run_batch_export(files, engine_, provider, PresetPlacement{}, options(GetParam()));
    ASSERT_EQ(result.succeeded.size(), 1u);
    ASSERT_EQ(result.skipped.size(), 1u);
    EXPECT_TRUE(result.failed.empty());
    EXPECT_EQ(result.skipped[0].code, ErrorCode::MissingMetadataDate);
    EXPECT_FALSE(fs::exists(out_ / "skip.png"));
}

TEST_P(BatchExportTest, ThrowingProviderFailsOnlyThatFile) {
    write_sample(in_ / "a.png");
    write_sample(in_ / "b.png");
    const auto files = collect_images(in_.path(), kExportExtensions);

    const SpecProvider provider = [](const fs::path& file) -> SpecDecision {
        if (file.stem() == "a") {
            throw std::runtime_error("boom");
        }
        return stamp();
    };

    const BatchResult result = run_batch_export(files, engine_, provider, PresetPlacement{}, options(GetParam()));
    ASSERT_EQ(result.failed.size(), 1u);
    EXPECT_EQ(result.failed[0].path.filename(), "a.png");
    EXPECT_EQ(result.succeeded.size(), 1u);
}

INSTANTIATE_TEST_SUITE_P(Workers, BatchExportTest, ::testing::Values(1u, 3u));

TEST(BatchExport, CancelBetweenFilesKeepsPartialResult) {
    test::TempDir in("cancel_in");
    test::TempDir out("cancel_out");
    for (const char* name : {"a.png", "b.png", "c.png"}) {
        write_sample(in / name);
    }
    const auto files = collect_images(in.path(), kExportExtensions);

    std::atomic<bool> cancel{false};
    BatchControl control;
    control.cancel_flag = &cancel;
    control.on_progress = [&cancel](size_t, size_t) { cancel.store(true); };

    ExportOptions opt;
    opt.output_dir = out.path();
    opt.format = OutputFormat::Png;
    opt.worker_count = 1;

    const WatermarkEngine engine(bundled_fonts());
    const BatchResult result = run_batch_export(files, engine, stamp(), PresetPlacement{}, opt, control);
    EXPECT_TRUE(result.cancelled);
    ASSERT_EQ(result.succeeded.size(), 1u);
    EXPECT_EQ(result.succeeded[0].source.filename(), "a.png");
}

TEST(BatchExport, EmptyInputIsEmptyResult) {
    const WatermarkEngine engine(bundled_fonts());
    ExportOptions opt;
    opt.output_dir = fs::temp_directory_path();
    const BatchResult result = run_batch_export(std::vector<fs::path>{}, engine, stamp(), PresetPlacement{}, opt);
    EXPECT_EQ(result.processed(), 0u);
    EXPECT_FALSE(result.cancelled);
}
