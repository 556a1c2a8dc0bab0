/**
 * @file    batch_export.hpp
 * @brief   Batch export pipeline
 * @license MIT
 *
 * @details
 * Every input file is processed independently (decode, watermark, encode,
 * write). A failing file is recorded and the batch continues; nothing
 * thrown by per-file work escapes run_batch_export().
 *
 * Output paths are computed for the whole batch before any work starts, so
 * two inputs that would write the same destination are detected up front
 * instead of racing on the file system. Files are dispatched in input order
 * to a bounded worker pool; results are folded back in input order.
 */

#pragma once

#include "core/types.hpp"
#include "core/watermark_engine.hpp"
#include "core/watermark_spec.hpp"

#include <array>
#include <atomic>
#include <filesystem>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pwm {

// Extensions accepted by the batch exporter
inline constexpr std::array<std::string_view, 7> kExportExtensions = {
    ".jpg", ".jpeg", ".png", ".bmp", ".tif", ".tiff", ".webp"
};

// Extensions accepted by the EXIF date tool
inline constexpr std::array<std::string_view, 6> kDateToolExtensions = {
    ".jpg", ".jpeg", ".png", ".tif", ".tiff", ".webp"
};

struct ExportedFile {
    std::filesystem::path source;
    std::filesystem::path output;
};

struct FileFailure {
    std::filesystem::path path;
    ErrorCode code;
    std::string reason;
};

struct BatchResult {
    std::vector<ExportedFile> succeeded;
    std::vector<FileFailure> failed;
    std::vector<FileFailure> skipped;   // Not watermarked by design (e.g. no capture date)
    bool cancelled{false};

    [[nodiscard]] size_t processed() const noexcept {
        return succeeded.size() + failed.size() + skipped.size();
    }
};

/**
 * Progress notification, called once per finished file
 * Invoked from worker threads but never concurrently.
 */
using ProgressCallback = std::function<void(size_t completed, size_t total)>;

struct BatchControl {
    ProgressCallback on_progress;
    const std::atomic<bool>* cancel_flag{nullptr};  // Checked between files
};

/**
 * Per-file watermark decision for batches whose watermark depends on the file
 */
struct SkipFile {
    ErrorCode code;
    std::string reason;
};

using SpecDecision = std::variant<WatermarkSpec, SkipFile>;
using SpecProvider = std::function<SpecDecision(const std::filesystem::path&)>;

/**
 * Output filename for a source file
 *
 *   KeepOriginal: stem + ext
 *   AddPrefix:    prefix + stem + ext
 *   AddSuffix:    stem + suffix + ext
 *
 * ext is ".jpg" or ".png" for Jpeg/Png output and the source extension for
 * OutputFormat::Source.
 */
[[nodiscard]] std::string output_filename(
    const std::filesystem::path& source,
    const NamingPolicy& naming,
    OutputFormat format
);

/**
 * options.output_dir / output_filename(source, ...)
 */
[[nodiscard]] std::filesystem::path output_path_for(
    const std::filesystem::path& source,
    const ExportOptions& options
);

/**
 * Case-insensitive extension check
 */
[[nodiscard]] bool has_extension(
    const std::filesystem::path& path,
    std::span<const std::string_view> extensions
);

/**
 * Expand an input path: a supported file yields itself, a directory yields
 * its supported regular files in sorted order (not recursive).
 */
[[nodiscard]] std::vector<std::filesystem::path> collect_images(
    const std::filesystem::path& input,
    std::span<const std::string_view> extensions
);

/**
 * Watermark and export a set of files with one watermark
 *
 * @param files      Source images
 * @param engine     Watermark engine (shared by all workers)
 * @param spec       Watermark to draw on every file
 * @param placement  Placement rule
 * @param options    Output directory, format, quality, naming, workers
 * @param control    Progress callback and cancellation flag
 * @return           Per-file outcomes; partial when cancelled
 */
[[nodiscard]] BatchResult run_batch_export(
    std::span<const std::filesystem::path> files,
    const WatermarkEngine& engine,
    const WatermarkSpec& spec,
    const PlacementRule& placement,
    const ExportOptions& options,
    const BatchControl& control = {}
);

/**
 * Watermark and export a set of files, deciding the watermark per file
 * Files for which the provider returns SkipFile are recorded as skipped.
 */
[[nodiscard]] BatchResult run_batch_export(
    std::span<const std::filesystem::path> files,
    const WatermarkEngine& engine,
    const SpecProvider& provider,
    const PlacementRule& placement,
    const ExportOptions& options,
    const BatchControl& control = {}
);

}  // namespace pwm
