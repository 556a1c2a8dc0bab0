/**
 * @file    date_cli.cpp
 * @brief   exif-date-watermark command-line application
 * @license MIT
 */

#include "cli/date_cli.hpp"
#include "cli/console.hpp"
#include "core/batch_export.hpp"
#include "core/color.hpp"
#include "core/exif_date.hpp"
#include "core/watermark_engine.hpp"
#include "utils/path_formatter.hpp"

#include <CLI/CLI.hpp>
#include <exiv2/exiv2.hpp>
#include <spdlog/spdlog.h>

#include <string>

namespace fs = std::filesystem;

namespace pwm::cli {

namespace {

// Exiv2's XMP toolkit must be initialised once before metadata is read
// from several threads.
class ExivSession {
public:
    ExivSession() { Exiv2::XmpParser::initialize(); }
    ~ExivSession() { Exiv2::XmpParser::terminate(); }

    ExivSession(const ExivSession&) = delete;
    ExivSession& operator=(const ExivSession&) = delete;
};

}  // anonymous namespace

fs::path date_output_dir(const fs::path& input) {
    std::error_code ec;
    fs::path absolute = fs::absolute(input, ec);
    if (ec) {
        absolute = input;
    }
    absolute = absolute.lexically_normal();
    if (absolute.filename().empty()) {
        absolute = absolute.parent_path();
    }

    const fs::path source_dir = fs::is_directory(absolute, ec) ? absolute : absolute.parent_path();
    fs::path name = source_dir.filename();
    name += "_watermark";
    return source_dir.parent_path() / name;
}

ExportOptions date_export_options(const fs::path& output_dir) {
    return ExportOptions{
        .output_dir = output_dir,
        .format = OutputFormat::Source,
        .jpeg_quality = 95,
        .chroma_subsampling = ChromaSubsampling::S420,
        .naming = KeepOriginal{},
        .worker_count = 0,
    };
}

int run_date_tool(int argc, char** argv) {
    setup_console();

    CLI::App app{"EXIF Date Watermark - Stamp photos with their capture date"};
    app.set_version_flag("-V,--version", APP_VERSION);

    std::string input_path;
    int font_size = 36;
    std::string color = "#FFFFFF";
    std::string position = "br";
    int margin = kDefaultMargin;
    std::string font_file;
    bool verbose = false;
    bool quiet = false;

    app.add_option("input_path", input_path, "Image file or directory")->required();
    app.add_option("--font-size", font_size, "Font size in pixels")
        ->capture_default_str()
        ->check(CLI::PositiveNumber);
    app.add_option("--color", color, "Text color")->capture_default_str();
    app.add_option("--position", position, "Position (tl|tr|bl|br|center)")
        ->capture_default_str()
        ->check(CLI::IsMember({"tl", "tr", "bl", "br", "center"}, CLI::ignore_case));
    app.add_option("--margin", margin, "Margin in pixels")
        ->capture_default_str()
        ->check(CLI::NonNegativeNumber);
    app.add_option("--font", font_file, "Font file path");
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_flag("-q,--quiet", quiet, "Suppress all output except errors");

    CLI11_PARSE(app, argc, argv);

    if (!quiet) {
        print_banner("EXIF Date Edition");
    }
    init_logging(verbose, quiet);

    const fs::path input(input_path);
    std::error_code ec;
    if (!fs::exists(input, ec)) {
        spdlog::error("Path does not exist: {}", input);
        return 1;
    }

    const std::vector<fs::path> files = collect_images(input, kDateToolExtensions);
    if (files.empty()) {
        spdlog::error("No supported image files found in {}", input);
        return 1;
    }

    const fs::path output_dir = date_output_dir(input);
    fs::create_directories(output_dir, ec);
    if (ec) {
        spdlog::error("{}: cannot create {}: {}", to_string(ErrorCode::WriteFailure),
                      output_dir, ec.message());
        return 1;
    }
    spdlog::info("Found {} images, writing to {}", files.size(), output_dir);

    if (!parse_color(color)) {
        spdlog::warn("{}: '{}', using white", to_string(ErrorCode::InvalidColor), color);
    }

    TextWatermark stamp{
        .content = {},
        .font_family = {},
        .font_file = std::nullopt,
        .font_size_px = font_size,
        .bold = false,
        .italic = false,
        .color = color,
        .opacity_percent = 100,
        .shadow = true,
    };
    if (!font_file.empty()) {
        stamp.font_file = fs::path(font_file);
    }

    const PlacementRule placement = PresetPlacement{
        .anchor = parse_anchor(position).value_or(Anchor::BottomRight),
        .margin_px = margin,
    };

    const SpecProvider provider = [stamp](const fs::path& file) -> SpecDecision {
        auto date = read_exif_date(file);
        if (!date) {
            return SkipFile{ErrorCode::MissingMetadataDate, "No EXIF capture date"};
        }
        TextWatermark text = stamp;
        text.content = *date;
        return WatermarkSpec{std::move(text)};
    };

    try {
        ExivSession exiv;
        WatermarkEngine engine;

        BatchResult result = run_batch_export(
            files, engine, provider, placement, date_export_options(output_dir));

        if (!quiet) {
            print_summary(result);
        }
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }

    // Per-file failures are reported but do not change the exit status
    return 0;
}

}  // namespace pwm::cli
