/**
 * @file    cli_app.cpp
 * @brief   photo-watermark command-line application
 * @license MIT
 *
 * @details
 * Batch front end of the watermark engine:
 *
 *   photo-watermark photos/ -o out/ --text "(c) 2025" --position br
 *   photo-watermark a.jpg b.png -o out/ --image logo.png --scale 30 --format png
 *   photo-watermark photos/ -o out/ --text "Draft" --at 400,300 --canvas 800x600
 *
 * Options may also be read from a TOML/INI file with --config.
 */

#include "cli/cli_app.hpp"
#include "cli/console.hpp"
#include "core/batch_export.hpp"
#include "core/color.hpp"
#include "core/watermark_engine.hpp"
#include "utils/path_formatter.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <fmt/color.h>

#include <atomic>
#include <charconv>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace pwm::cli {

namespace {

bool parse_int(std::string_view text, int& out) {
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

bool same_directory(const fs::path& a, const fs::path& b) {
    std::error_code ec;
    const fs::path ca = fs::weakly_canonical(a.empty() ? fs::path(".") : a, ec);
    if (ec) return false;
    const fs::path cb = fs::weakly_canonical(b, ec);
    if (ec) return false;
    return ca == cb;
}

// =============================================================================
// Option values
// =============================================================================

struct Options {
    std::vector<std::string> inputs;
    std::string output_dir;

    // Text watermark
    std::string text;
    std::string font_family;
    std::string font_file;
    int font_size = 36;
    bool bold = false;
    bool italic = false;
    std::string color = "#FFFFFF";
    int opacity = 100;
    bool shadow = false;

    // Image watermark
    std::string image;
    int scale = 100;
    int image_opacity = 100;

    // Placement
    std::string position = "br";
    int margin = kDefaultMargin;
    std::string at;
    std::string canvas;

    // Export
    OutputFormat format = OutputFormat::Jpeg;
    int quality = 95;
    std::string prefix;
    std::string suffix;
    unsigned threads = 0;
    bool force = false;
    std::string preview;

    bool verbose = false;
    bool quiet = false;
};

WatermarkSpec make_spec(const Options& opt, bool use_image) {
    if (use_image) {
        return ImageWatermark{
            .source_path = fs::path(opt.image),
            .scale_percent = opt.scale,
            .opacity_percent = opt.image_opacity,
        };
    }

    TextWatermark text{
        .content = opt.text,
        .font_family = opt.font_family,
        .font_file = std::nullopt,
        .font_size_px = opt.font_size,
        .bold = opt.bold,
        .italic = opt.italic,
        .color = opt.color,
        .opacity_percent = opt.opacity,
        .shadow = opt.shadow,
    };
    if (!opt.font_file.empty()) {
        text.font_file = fs::path(opt.font_file);
    }
    return text;
}

std::optional<PlacementRule> make_placement(const Options& opt) {
    if (opt.at.empty()) {
        return PresetPlacement{
            .anchor = parse_anchor(opt.position).value_or(Anchor::BottomRight),
            .margin_px = opt.margin,
        };
    }

    auto point = parse_point(opt.at);
    auto canvas = parse_canvas(opt.canvas);
    if (!point) {
        spdlog::error("Invalid --at value '{}' (expected X,Y)", opt.at);
        return std::nullopt;
    }
    if (!canvas) {
        spdlog::error("Invalid --canvas value '{}' (expected WxH)", opt.canvas);
        return std::nullopt;
    }
    return CustomPlacement{
        .preview_point = *point,
        .preview_canvas = *canvas,
        .fallback_margin_px = opt.margin,
    };
}

NamingPolicy make_naming(const Options& opt) {
    if (!opt.prefix.empty()) return AddPrefix{opt.prefix};
    if (!opt.suffix.empty()) return AddSuffix{opt.suffix};
    return KeepOriginal{};
}

void write_preview(
    const fs::path& source,
    const fs::path& preview_path,
    const WatermarkEngine& engine,
    const WatermarkSpec& spec,
    const PlacementRule& placement,
    const ExportOptions& options)
{
    try {
        cv::Mat image = decode_image(source);
        PreviewResult preview = engine.render_preview(image, spec, placement);
        write_image(preview_path, preview.image, options);
        spdlog::info("Preview {}x{} (scale {:.3f}) written to {}",
                     preview.image.cols, preview.image.rows, preview.scale, preview_path);
    } catch (const WatermarkError& e) {
        spdlog::error("Preview failed ({}): {}", to_string(e.code()), e.what());
    } catch (const std::exception& e) {
        spdlog::error("Preview failed: {}", e.what());
    }
}

}  // anonymous namespace

// =============================================================================
// Public API
// =============================================================================

std::optional<cv::Point> parse_point(std::string_view text) {
    const size_t comma = text.find(',');
    if (comma == std::string_view::npos) return std::nullopt;

    int x = 0, y = 0;
    if (!parse_int(text.substr(0, comma), x) || !parse_int(text.substr(comma + 1), y)) {
        return std::nullopt;
    }
    if (x < 0 || y < 0) return std::nullopt;
    return cv::Point(x, y);
}

std::optional<cv::Size> parse_canvas(std::string_view text) {
    const size_t sep = text.find_first_of("xX");
    if (sep == std::string_view::npos) return std::nullopt;

    int w = 0, h = 0;
    if (!parse_int(text.substr(0, sep), w) || !parse_int(text.substr(sep + 1), h)) {
        return std::nullopt;
    }
    if (w <= 0 || h <= 0) return std::nullopt;
    return cv::Size(w, h);
}

int run(int argc, char** argv) {
    setup_console();

    CLI::App app{"Photo Watermark - Add text or image watermarks to a batch of photos"};
    app.footer("\nExample: photo-watermark photos/ -o out/ --text \"(c) 2025\" --position br");
    app.set_version_flag("-V,--version", APP_VERSION);
    app.set_config("--config", "", "Read options from a TOML/INI file");

    Options opt;

    // Input/Output paths
    app.add_option("inputs", opt.inputs, "Input image files or directories")->required();
    app.add_option("-o,--output", opt.output_dir, "Output directory")->required();

    // Watermark content
    auto* text_opt = app.add_option("--text", opt.text, "Text watermark content");
    auto* image_opt = app.add_option("--image", opt.image, "Image watermark file (PNG with alpha)");
    text_opt->excludes(image_opt);

    app.add_option("--font-family", opt.font_family, "Font family name or font file path");
    app.add_option("--font", opt.font_file, "Font file (.ttf/.otf/.ttc)");
    app.add_option("--font-size", opt.font_size, "Font size in pixels")
        ->capture_default_str()
        ->check(CLI::PositiveNumber);
    app.add_flag("--bold", opt.bold, "Bold text");
    app.add_flag("--italic", opt.italic, "Italic text");
    app.add_option("--color", opt.color, "Text color (#RRGGBB, #RGB, rgb(r,g,b) or a CSS name)")
        ->capture_default_str();
    app.add_option("--opacity", opt.opacity, "Text opacity percent")
        ->capture_default_str()
        ->check(CLI::Range(0, 100));
    app.add_flag("--shadow", opt.shadow, "Draw a drop shadow under the text");

    app.add_option("--scale", opt.scale, "Image watermark scale percent")
        ->capture_default_str()
        ->check(CLI::Range(10, 100));
    app.add_option("--image-opacity", opt.image_opacity, "Image watermark opacity percent")
        ->capture_default_str()
        ->check(CLI::Range(0, 100));

    // Placement
    const CLI::Validator anchor_check(
        [](std::string& value) -> std::string {
            return parse_anchor(value) ? std::string{} : "Unknown position: " + value;
        },
        "tl|tr|bl|br|center", "ANCHOR");

    app.add_option("--position", opt.position, "Anchor position")
        ->capture_default_str()
        ->check(anchor_check);
    app.add_option("--margin", opt.margin, "Margin in pixels from the anchored edges")
        ->capture_default_str()
        ->check(CLI::NonNegativeNumber);
    auto* at_opt = app.add_option("--at", opt.at, "Custom position X,Y on the preview canvas");
    auto* canvas_opt = app.add_option("--canvas", opt.canvas, "Preview canvas WxH for --at");
    at_opt->needs(canvas_opt);
    canvas_opt->needs(at_opt);

    // Export
    const std::map<std::string, OutputFormat> format_map{
        {"jpeg", OutputFormat::Jpeg}, {"jpg", OutputFormat::Jpeg}, {"png", OutputFormat::Png}
    };
    app.add_option("--format", opt.format, "Output format (jpeg|png)")
        ->transform(CLI::CheckedTransformer(format_map, CLI::ignore_case));
    app.add_option("--quality", opt.quality, "JPEG quality")
        ->capture_default_str()
        ->check(CLI::Range(0, 100));
    auto* prefix_opt = app.add_option("--prefix", opt.prefix, "Prepend to output file names");
    auto* suffix_opt = app.add_option("--suffix", opt.suffix, "Append to output file stems");
    prefix_opt->excludes(suffix_opt);
    app.add_option("--threads", opt.threads, "Worker threads (0 = auto)")->capture_default_str();
    app.add_flag("--force", opt.force, "Allow writing into a source directory");
    app.add_option("--preview", opt.preview, "Also write a preview of the first input");

    // Verbosity
    app.add_flag("-v,--verbose", opt.verbose, "Enable verbose output");
    app.add_flag("-q,--quiet", opt.quiet, "Suppress all output except errors");

    // Parse arguments
    CLI11_PARSE(app, argc, argv);

    if (!opt.quiet) {
        print_banner("Batch Export");
    }
    init_logging(opt.verbose, opt.quiet);

    const bool use_image = image_opt->count() > 0;
    if (text_opt->count() == 0 && !use_image) {
        spdlog::error("Specify a watermark with --text or --image");
        return 1;
    }
    if (!use_image && !parse_color(opt.color)) {
        spdlog::warn("{}: '{}', using white", to_string(ErrorCode::InvalidColor), opt.color);
    }

    auto placement = make_placement(opt);
    if (!placement) {
        return 1;
    }

    // Expand inputs
    std::vector<fs::path> files;
    for (const auto& input_str : opt.inputs) {
        const fs::path input(input_str);
        std::error_code ec;
        if (!fs::exists(input, ec)) {
            spdlog::error("Input not found: {}", input);
            return 1;
        }
        auto found = collect_images(input, kExportExtensions);
        if (found.empty()) {
            spdlog::warn("No supported images in {}", input);
        }
        files.insert(files.end(), found.begin(), found.end());
    }
    if (files.empty()) {
        spdlog::error("No supported image files found");
        return 1;
    }

    const fs::path output_dir(opt.output_dir);
    if (!opt.force) {
        for (const auto& file : files) {
            if (same_directory(file.parent_path(), output_dir)) {
                spdlog::error("Output directory {} contains source files; use --force to write there anyway",
                              output_dir);
                return 1;
            }
        }
    }

    ExportOptions options{
        .output_dir = output_dir,
        .format = opt.format,
        .jpeg_quality = opt.quality,
        .chroma_subsampling = std::nullopt,
        .naming = make_naming(opt),
        .worker_count = opt.threads,
    };

    try {
        WatermarkEngine engine;
        const WatermarkSpec spec = make_spec(opt, use_image);

        if (!opt.preview.empty()) {
            write_preview(files.front(), fs::path(opt.preview), engine, spec, *placement, options);
        }

        std::atomic<bool> cancel_requested{false};
        const InterruptScope interrupt(cancel_requested);

        BatchControl control;
        control.cancel_flag = &cancel_requested;
        control.on_progress = [](size_t completed, size_t total) {
            spdlog::debug("[{}/{}]", completed, total);
        };

        BatchResult result = run_batch_export(files, engine, spec, *placement, options, control);

        if (!opt.quiet) {
            print_summary(result);
        }
        return (result.failed.empty() && !result.cancelled) ? 0 : 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}

}  // namespace pwm::cli
