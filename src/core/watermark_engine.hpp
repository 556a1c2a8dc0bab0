#pragma once

#include "core/font_provider.hpp"
#include "core/types.hpp"
#include "core/watermark_spec.hpp"

#include <opencv2/core.hpp>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace pwm {

/**
 * Preview canvas used when the caller does not specify one
 */
inline const cv::Size kDefaultPreviewCanvas{800, 600};

/**
 * Preview raster and the canvas size a Custom placement should record
 */
struct PreviewResult {
    cv::Mat image;          // Downscaled composite
    double scale;           // preview / full resolution (<= 1.0)
};

/**
 * Size of `image_size` fitted into `max_canvas` without upscaling
 * scale = min(max.w / W, max.h / H, 1.0)
 */
cv::Size fit_preview_size(const cv::Size& image_size, const cv::Size& max_canvas);

/**
 * Main watermark engine class
 *
 * Dispatches a WatermarkSpec to the text or image renderer. Holds the font
 * resolution chain so faces and the font index are shared across a batch.
 * All methods are const and safe to call from several worker threads.
 *
 * Compositing:
 *   result = alpha * watermark + (1 - alpha) * original   (source-over)
 */
class WatermarkEngine {
public:
    /**
     * Initialize the engine with the default font chain
     * (named face -> bundled Hershey face -> system font)
     */
    WatermarkEngine();

    /**
     * Initialize the engine with a custom font chain
     */
    explicit WatermarkEngine(std::unique_ptr<FontResolver> fonts);

    WatermarkEngine(const WatermarkEngine&) = delete;
    WatermarkEngine& operator=(const WatermarkEngine&) = delete;

    /**
     * Render the watermark onto a copy of `base`
     *
     * @param base       Full-resolution raster (left unmodified)
     * @param spec       Text or image watermark
     * @param placement  Preset anchor or custom preview point
     * @return           Composite in the channel layout of `base`
     */
    cv::Mat apply(
        const cv::Mat& base,
        const WatermarkSpec& spec,
        const PlacementRule& placement
    ) const;

    /**
     * Render a preview that matches the exported result
     *
     * The watermark is composited at full resolution and the composite is
     * then fitted into `max_canvas`, so the preview never disagrees with the
     * export. `result.image.size()` is the canvas a Custom rule records.
     */
    PreviewResult render_preview(
        const cv::Mat& base,
        const WatermarkSpec& spec,
        const PlacementRule& placement,
        const cv::Size& max_canvas = kDefaultPreviewCanvas
    ) const;

    const FontResolver& fonts() const noexcept { return *fonts_; }

private:
    std::unique_ptr<FontResolver> fonts_;
};

/**
 * Decode an image file to 8-bit BGR or BGRA
 * Gray and 16-bit sources are normalised; alpha is kept.
 *
 * @throws WatermarkError (DecodeFailure)
 */
cv::Mat decode_image(const std::filesystem::path& path);

/**
 * cv::imwrite/imencode parameters for an output extension
 *   .jpg/.jpeg  quality + optional chroma subsampling
 *   .png        compression 6
 *   .webp       quality
 */
std::vector<int> encode_params(const std::string& extension, const ExportOptions& options);

/**
 * Encode and write a raster; the codec follows the output extension
 * Parent directories are created. JPEG output drops alpha.
 *
 * @throws WatermarkError (EncodeFailure or WriteFailure)
 */
void write_image(
    const std::filesystem::path& output_path,
    const cv::Mat& image,
    const ExportOptions& options
);

/**
 * Result of processing an image
 */
struct ProcessResult {
    bool success;              // Whether processing succeeded
    ErrorCode code;            // Failure category (Success when it worked)
    std::string message;       // Status message
};

/**
 * Process a single image file: decode, watermark, encode, write
 * Never throws; failures are reported in the result.
 *
 * @param input_path   Input image path
 * @param output_path  Output image path
 * @param engine       The watermark engine to use
 * @param spec         Watermark to draw
 * @param placement    Placement rule
 * @param options      Encoding options
 * @return             Processing result
 */
ProcessResult process_image(
    const std::filesystem::path& input_path,
    const std::filesystem::path& output_path,
    const WatermarkEngine& engine,
    const WatermarkSpec& spec,
    const PlacementRule& placement,
    const ExportOptions& options
);

} // namespace pwm
