/**
 * @file    test_cli.cpp
 * @brief   Command-line front ends
 * @license MIT
 */

#include "cli/cli_app.hpp"
#include "cli/console.hpp"
#include "cli/date_cli.hpp"
#include "test_helpers.hpp"

#include <exiv2/exiv2.hpp>
#include <opencv2/imgcodecs.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <csignal>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace pwm;

namespace {

// argv-style wrapper around a list of arguments
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& s : storage_) {
            pointers_.push_back(s.data());
        }
        pointers_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

void write_sample(const fs::path& path) {
    ASSERT_TRUE(cv::imwrite(path.string(), test::solid_bgr(160, 120, {20, 40, 60})));
}

void set_capture_date(const fs::path& path, const std::string& value) {
    auto image = Exiv2::ImageFactory::open(path.string());
    image->readMetadata();
    Exiv2::ExifData exif;
    exif["Exif.Photo.DateTimeOriginal"] = value;
    image->setExifData(exif);
    image->writeMetadata();
}

}  // namespace

// =============================================================================
// Argument parsing helpers
// =============================================================================

TEST(CliParse, Point) {
    EXPECT_EQ(cli::parse_point("400,300"), cv::Point(400, 300));
    EXPECT_EQ(cli::parse_point("0,0"), cv::Point(0, 0));
    EXPECT_FALSE(cli::parse_point("400").has_value());
    EXPECT_FALSE(cli::parse_point("a,b").has_value());
    EXPECT_FALSE(cli::parse_point("-1,5").has_value());
    EXPECT_FALSE(cli::parse_point("1,2,3").has_value());
}

TEST(CliParse, Canvas) {
    EXPECT_EQ(cli::parse_canvas("800x600"), cv::Size(800, 600));
    EXPECT_EQ(cli::parse_canvas("1024X768"), cv::Size(1024, 768));
    EXPECT_FALSE(cli::parse_canvas("0x600").has_value());
    EXPECT_FALSE(cli::parse_canvas("800").has_value());
    EXPECT_FALSE(cli::parse_canvas("800x").has_value());
}

// =============================================================================
// SIGINT routing
// =============================================================================

TEST(CliInterrupt, RoutesSigintToFlagAndRestoresOnUnwind) {
    std::signal(SIGINT, SIG_IGN);

    std::atomic<bool> cancel{true};
    try {
        const cli::InterruptScope interrupt(cancel);
        EXPECT_FALSE(cancel.load());
        std::raise(SIGINT);
        EXPECT_TRUE(cancel.load());
        throw std::runtime_error("batch aborted");
    } catch (const std::runtime_error&) {
    }

    // The handler in place before the scope is back
    EXPECT_EQ(std::signal(SIGINT, SIG_DFL), SIG_IGN);

    // A stray interrupt after the scope no longer touches the flag
    cancel.store(false);
    std::signal(SIGINT, SIG_IGN);
    std::raise(SIGINT);
    EXPECT_FALSE(cancel.load());
    std::signal(SIGINT, SIG_DFL);
}

// =============================================================================
// photo-watermark
// =============================================================================

TEST(PhotoWatermarkCli, ExportsDirectory) {
    test::TempDir in("cli_in");
    test::TempDir out("cli_out");
    write_sample(in / "one.png");
    write_sample(in / "two.jpg");

    Args args{"photo-watermark", in.path().string(), "-o", out.path().string(),
              "--text", "(c) 2025", "--font-size", "20", "--prefix", "wm_", "-q"};
    EXPECT_EQ(cli::run(args.argc(), args.argv()), 0);

    EXPECT_TRUE(fs::exists(out / "wm_one.jpg"));
    EXPECT_TRUE(fs::exists(out / "wm_two.jpg"));
}

TEST(PhotoWatermarkCli, CustomPositionAndPngOutput) {
    test::TempDir in("cli_custom_in");
    test::TempDir out("cli_custom_out");
    write_sample(in / "shot.png");

    Args args{"photo-watermark", (in / "shot.png").string(), "-o", out.path().string(),
              "--text", "X", "--at", "10,10", "--canvas", "80x60", "--format", "png", "-q"};
    EXPECT_EQ(cli::run(args.argc(), args.argv()), 0);
    EXPECT_TRUE(fs::exists(out / "shot.png"));
}

TEST(PhotoWatermarkCli, MissingInputFails) {
    test::TempDir out("cli_missing");
    Args args{"photo-watermark", (out / "nope.jpg").string(), "-o", out.path().string(),
              "--text", "x", "-q"};
    EXPECT_EQ(cli::run(args.argc(), args.argv()), 1);
}

TEST(PhotoWatermarkCli, RequiresWatermark) {
    test::TempDir in("cli_nowm");
    test::TempDir out("cli_nowm_out");
    write_sample(in / "a.png");

    Args args{"photo-watermark", in.path().string(), "-o", out.path().string(), "-q"};
    EXPECT_EQ(cli::run(args.argc(), args.argv()), 1);
}

TEST(PhotoWatermarkCli, RefusesSourceDirectoryWithoutForce) {
    test::TempDir in("cli_guard");
    write_sample(in / "a.png");

    Args refused{"photo-watermark", in.path().string(), "-o", in.path().string(),
                 "--text", "x", "--suffix", "_wm", "-q"};
    EXPECT_EQ(cli::run(refused.argc(), refused.argv()), 1);
    EXPECT_FALSE(fs::exists(in / "a_wm.jpg"));

    Args forced{"photo-watermark", in.path().string(), "-o", in.path().string(),
                "--text", "x", "--suffix", "_wm", "--force", "-q"};
    EXPECT_EQ(cli::run(forced.argc(), forced.argv()), 0);
    EXPECT_TRUE(fs::exists(in / "a_wm.jpg"));
}

TEST(PhotoWatermarkCli, FailedFileGivesExitOne) {
    test::TempDir in("cli_fail");
    test::TempDir out("cli_fail_out");
    write_sample(in / "good.png");
    std::ofstream(in / "bad.png") << "corrupt";

    Args args{"photo-watermark", in.path().string(), "-o", out.path().string(), "--text", "x", "-q"};
    EXPECT_EQ(cli::run(args.argc(), args.argv()), 1);
    EXPECT_TRUE(fs::exists(out / "good.jpg"));
}

// =============================================================================
// exif-date-watermark
// =============================================================================

TEST(DateCli, OutputDirectoryIsSibling) {
    test::TempDir dir("trip");
    write_sample(dir / "img.jpg");

    const fs::path parent = fs::weakly_canonical(dir.path()).parent_path();
    const std::string name = dir.path().filename().string() + "_watermark";

    EXPECT_EQ(fs::weakly_canonical(cli::date_output_dir(dir.path())), parent / name);
    EXPECT_EQ(fs::weakly_canonical(cli::date_output_dir(dir / "img.jpg")), parent / name);
}

TEST(DateCli, ExportOptions) {
    const ExportOptions opt = cli::date_export_options("out");
    EXPECT_EQ(opt.format, OutputFormat::Source);
    EXPECT_EQ(opt.jpeg_quality, 95);
    ASSERT_TRUE(opt.chroma_subsampling.has_value());
    EXPECT_EQ(*opt.chroma_subsampling, ChromaSubsampling::S420);
    EXPECT_TRUE(std::holds_alternative<KeepOriginal>(opt.naming));
}

TEST(DateCli, StampsDatedFilesAndSkipsOthers) {
    test::TempDir dir("date_run");
    write_sample(dir / "dated.jpg");
    write_sample(dir / "undated.jpg");
    set_capture_date(dir / "dated.jpg", "2023:11:05 14:22:10");

    const fs::path out_dir = cli::date_output_dir(dir.path());
    struct Cleanup {
        fs::path path;
        ~Cleanup() { std::error_code ec; fs::remove_all(path, ec); }
    } cleanup{out_dir};

    Args args{"exif-date-watermark", dir.path().string(), "--font-size", "18", "-q"};
    EXPECT_EQ(cli::run_date_tool(args.argc(), args.argv()), 0);

    EXPECT_TRUE(fs::exists(out_dir / "dated.jpg"));
    EXPECT_FALSE(fs::exists(out_dir / "undated.jpg"));
}

TEST(DateCli, MissingPathOrNoImagesFails) {
    test::TempDir dir("date_empty");

    Args missing{"exif-date-watermark", (dir / "nowhere").string(), "-q"};
    EXPECT_EQ(cli::run_date_tool(missing.argc(), missing.argv()), 1);

    Args empty{"exif-date-watermark", dir.path().string(), "-q"};
    EXPECT_EQ(cli::run_date_tool(empty.argc(), empty.argv()), 1);
}
