/**
 * @file    batch_export.cpp
 * @brief   Batch export pipeline
 * @license MIT
 */

#include "core/batch_export.hpp"
#include "utils/path_formatter.hpp"
#include "utils/thread_pool.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <mutex>
#include <optional>
#include <system_error>
#include <unordered_set>

namespace fs = std::filesystem;

namespace pwm {

namespace {

enum class OutcomeKind {
    NotRun,
    Succeeded,
    Failed,
    Skipped
};

struct FileOutcome {
    OutcomeKind kind{OutcomeKind::NotRun};
    ErrorCode code{ErrorCode::Success};
    std::string reason;
};

// Key used to detect two inputs mapping to the same destination
std::string destination_key(const fs::path& path) {
    std::string key = to_utf8(path.lexically_normal());
#ifdef _WIN32
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
#endif
    return key;
}

FileOutcome export_one(
    const fs::path& input,
    const fs::path& output,
    const WatermarkEngine& engine,
    const SpecProvider& provider,
    const PlacementRule& placement,
    const ExportOptions& options)
{
    std::optional<WatermarkSpec> spec;
    try {
        SpecDecision decision = provider(input);
        if (auto* skip = std::get_if<SkipFile>(&decision)) {
            spdlog::info("[SKIP] {}: {}", input.filename(), skip->reason);
            return {OutcomeKind::Skipped, skip->code, skip->reason};
        }
        spec = std::move(std::get<WatermarkSpec>(decision));
    } catch (const std::exception& e) {
        spdlog::error("Cannot prepare watermark for {}: {}", input, e.what());
        return {OutcomeKind::Failed, ErrorCode::RenderFailure, e.what()};
    }

    ProcessResult r = process_image(input, output, engine, *spec, placement, options);
    if (r.success) {
        return {OutcomeKind::Succeeded, ErrorCode::Success, r.message};
    }
    return {OutcomeKind::Failed, r.code, r.message};
}

}  // anonymous namespace

// =============================================================================
// Naming
// =============================================================================

std::string output_filename(
    const fs::path& source,
    const NamingPolicy& naming,
    OutputFormat format)
{
    const std::string stem = to_utf8(source.stem());

    std::string ext;
    switch (format) {
        case OutputFormat::Jpeg:   ext = ".jpg"; break;
        case OutputFormat::Png:    ext = ".png"; break;
        case OutputFormat::Source: ext = to_utf8(source.extension()); break;
    }

    if (const auto* prefix = std::get_if<AddPrefix>(&naming)) {
        return prefix->prefix + stem + ext;
    }
    if (const auto* suffix = std::get_if<AddSuffix>(&naming)) {
        return stem + suffix->suffix + ext;
    }
    return stem + ext;
}

fs::path output_path_for(const fs::path& source, const ExportOptions& options) {
    const std::string name = output_filename(source, options.naming, options.format);
    return options.output_dir / fs::path(std::u8string(name.begin(), name.end()));
}

bool has_extension(const fs::path& path, std::span<const std::string_view> extensions) {
    const std::string ext = lower_extension(path);
    return std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
}

std::vector<fs::path> collect_images(
    const fs::path& input,
    std::span<const std::string_view> extensions)
{
    std::vector<fs::path> files;
    std::error_code ec;

    if (fs::is_regular_file(input, ec)) {
        if (has_extension(input, extensions)) {
            files.push_back(input);
        }
        return files;
    }

    if (!fs::is_directory(input, ec)) {
        return files;
    }

    for (const auto& entry : fs::directory_iterator(input, ec)) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) continue;
        if (!has_extension(entry.path(), extensions)) continue;
        files.push_back(entry.path());
    }
    if (ec) {
        spdlog::warn("Cannot list {}: {}", input, ec.message());
    }

    std::sort(files.begin(), files.end());
    return files;
}

// =============================================================================
// Pipeline
// =============================================================================

BatchResult run_batch_export(
    std::span<const fs::path> files,
    const WatermarkEngine& engine,
    const WatermarkSpec& spec,
    const PlacementRule& placement,
    const ExportOptions& options,
    const BatchControl& control)
{
    const SpecProvider fixed = [&spec](const fs::path&) -> SpecDecision { return spec; };
    return run_batch_export(files, engine, fixed, placement, options, control);
}

BatchResult run_batch_export(
    std::span<const fs::path> files,
    const WatermarkEngine& engine,
    const SpecProvider& provider,
    const PlacementRule& placement,
    const ExportOptions& options,
    const BatchControl& control)
{
    const size_t total = files.size();
    std::vector<fs::path> outputs(total);
    std::vector<FileOutcome> outcomes(total);

    // Claim destinations before dispatch
    std::unordered_set<std::string> claimed;
    for (size_t i = 0; i < total; ++i) {
        outputs[i] = output_path_for(files[i], options);
        if (!claimed.insert(destination_key(outputs[i])).second) {
            outcomes[i] = {OutcomeKind::Failed, ErrorCode::DuplicateOutput,
                           fmt::format("Output {} already produced by another input",
                                       outputs[i].filename())};
            spdlog::error("{}: {} -> {}", to_string(ErrorCode::DuplicateOutput),
                          files[i], outputs[i]);
        }
    }

    auto is_cancelled = [&control] {
        return control.cancel_flag != nullptr && control.cancel_flag->load(std::memory_order_relaxed);
    };

    std::mutex progress_mutex;
    size_t completed = 0;
    auto report = [&] {
        std::lock_guard<std::mutex> lock(progress_mutex);
        ++completed;
        if (control.on_progress) {
            control.on_progress(completed, total);
        }
    };

    auto process = [&](size_t i) {
        if (outcomes[i].kind == OutcomeKind::NotRun) {
            if (is_cancelled()) return;
            outcomes[i] = export_one(files[i], outputs[i], engine, provider, placement, options);
        }
        report();
    };

    const unsigned workers = std::min<unsigned>(
        resolve_worker_count(options.worker_count),
        static_cast<unsigned>(std::max<size_t>(total, 1)));

    spdlog::info("Exporting {} files to {} ({} worker{})",
                 total, options.output_dir, workers, workers == 1 ? "" : "s");

    bool stopped = false;
    if (workers <= 1) {
        for (size_t i = 0; i < total; ++i) {
            if (is_cancelled()) { stopped = true; break; }
            process(i);
        }
    } else {
        ThreadPool pool(workers);
        for (size_t i = 0; i < total; ++i) {
            if (is_cancelled()) { stopped = true; break; }
            pool.submit([&process, i] { process(i); });
        }
        pool.wait_all();
    }

    // Fold outcomes in input order
    BatchResult result;
    for (size_t i = 0; i < total; ++i) {
        switch (outcomes[i].kind) {
            case OutcomeKind::Succeeded:
                result.succeeded.push_back({files[i], outputs[i]});
                break;
            case OutcomeKind::Failed:
                result.failed.push_back({files[i], outcomes[i].code, outcomes[i].reason});
                break;
            case OutcomeKind::Skipped:
                result.skipped.push_back({files[i], outcomes[i].code, outcomes[i].reason});
                break;
            case OutcomeKind::NotRun:
                result.cancelled = true;
                break;
        }
    }
    result.cancelled = result.cancelled || stopped;

    if (result.cancelled) {
        spdlog::warn("Batch cancelled after {} of {} files", result.processed(), total);
    }
    spdlog::info("Batch complete: {} ok, {} failed, {} skipped",
                 result.succeeded.size(), result.failed.size(), result.skipped.size());
    return result;
}

}  // namespace pwm
