/**
 * @file    font_provider.hpp
 * @brief   Font faces and the font resolution chain
 * @license MIT
 *
 * @details
 * A FontFace turns UTF-8 text into an 8-bit coverage mask; the mask size is
 * the measured ink box of the text. Faces come from an ordered list of
 * FontProvider objects tried in sequence:
 *
 *   1. NamedFontProvider   - explicit font file, or a family name looked up
 *                            in the platform font directories (FreeType)
 *   2. BundledFontProvider - OpenCV's built-in Hershey font (ASCII only)
 *   3. SystemFontProvider  - well-known platform font files (FreeType)
 *
 * A provider that cannot serve the request returns nullptr and the next one
 * is asked. Resolution failure is never fatal to the caller.
 */

#pragma once

#include <opencv2/core.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pwm {

/**
 * What the caller asks for
 */
struct FontRequest {
    std::string family;
    std::optional<std::filesystem::path> file;
    int size_px{36};
    bool bold{false};
    bool italic{false};
};

/**
 * Loaded, size-bound font face
 */
class FontFace {
public:
    virtual ~FontFace() = default;

    /**
     * Rasterize a single line of UTF-8 text
     *
     * @return  CV_8UC1 coverage mask cropped to the ink box,
     *          empty if the text has no visible glyphs
     */
    [[nodiscard]] virtual cv::Mat rasterize(std::string_view utf8) const = 0;

    /**
     * Whether every visible code point of `utf8` has a glyph in this face
     */
    [[nodiscard]] virtual bool can_render(std::string_view utf8) const = 0;

    /**
     * Human readable description for logging
     */
    [[nodiscard]] virtual std::string description() const = 0;

    /**
     * Measured ink box of `utf8`
     */
    [[nodiscard]] cv::Size measure(std::string_view utf8) const {
        return rasterize(utf8).size();
    }
};

/**
 * Open a TrueType/OpenType face through FreeType
 *
 * Styles the file does not carry itself are synthesised
 * (emboldened outlines, oblique shear).
 *
 * @return  Face, or nullptr if the file cannot be loaded at this size
 */
[[nodiscard]] std::unique_ptr<FontFace> open_freetype_face(
    const std::filesystem::path& path,
    int size_px,
    bool bold,
    bool italic
);

/**
 * Expand a 1-bit bitmap (most significant bit first, rows `pitch` bytes
 * apart) into 0/255 coverage. Embedded bitmap strikes come out this way.
 */
[[nodiscard]] cv::Mat expand_mono_bitmap(const uint8_t* buffer, int rows, int width, int pitch);

/**
 * OpenCV Hershey vector font face
 */
[[nodiscard]] std::unique_ptr<FontFace> open_hershey_face(int size_px, bool bold, bool italic);

/**
 * Directories searched for font files on this platform
 */
[[nodiscard]] std::vector<std::filesystem::path> font_search_dirs();

/**
 * Well-known system font files on this platform, in preference order
 */
[[nodiscard]] std::vector<std::filesystem::path> system_font_candidates();

// =============================================================================
// Providers
// =============================================================================

class FontProvider {
public:
    virtual ~FontProvider() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /**
     * @param request  Requested face
     * @param text     Text that will be drawn (used for coverage checks)
     * @return         Face, or nullptr to let the next provider try
     */
    [[nodiscard]] virtual std::unique_ptr<FontFace> load(
        const FontRequest& request,
        std::string_view text
    ) const = 0;
};

/**
 * Explicit font file, family given as a path, or family looked up by file name
 */
class NamedFontProvider final : public FontProvider {
public:
    explicit NamedFontProvider(std::vector<std::filesystem::path> search_dirs = font_search_dirs());

    [[nodiscard]] std::string_view name() const noexcept override { return "named"; }

    [[nodiscard]] std::unique_ptr<FontFace> load(
        const FontRequest& request,
        std::string_view text
    ) const override;

    /**
     * Find the file for a family
     *
     * Styled files (e.g. "DejaVuSans-Bold.ttf") are preferred; otherwise the
     * regular file is returned and `styled` is false.
     */
    [[nodiscard]] std::optional<std::filesystem::path> find_family(
        std::string_view family,
        bool bold,
        bool italic,
        bool& styled
    ) const;

private:
    std::vector<std::filesystem::path> search_dirs_;

    // Normalized file stem -> path, built on first lookup
    mutable std::once_flag index_once_;
    mutable std::unordered_map<std::string, std::filesystem::path> index_;

    void build_index() const;
};

/**
 * Hershey font compiled into OpenCV; declines non-ASCII text
 */
class BundledFontProvider final : public FontProvider {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "bundled"; }

    [[nodiscard]] std::unique_ptr<FontFace> load(
        const FontRequest& request,
        std::string_view text
    ) const override;
};

/**
 * First system font that covers the text, else the first one that loads
 */
class SystemFontProvider final : public FontProvider {
public:
    explicit SystemFontProvider(std::vector<std::filesystem::path> candidates = system_font_candidates());

    [[nodiscard]] std::string_view name() const noexcept override { return "system"; }

    [[nodiscard]] std::unique_ptr<FontFace> load(
        const FontRequest& request,
        std::string_view text
    ) const override;

private:
    std::vector<std::filesystem::path> candidates_;
};

// =============================================================================
// Resolver
// =============================================================================

class FontResolver {
public:
    /**
     * Default chain: named -> bundled -> system
     */
    FontResolver();

    explicit FontResolver(std::vector<std::unique_ptr<FontProvider>> providers);

    /**
     * Try each provider in order
     *
     * @return  Face, or nullptr if every provider declined
     *          (logged as a font resolution failure)
     */
    [[nodiscard]] std::unique_ptr<FontFace> resolve(
        const FontRequest& request,
        std::string_view text
    ) const;

private:
    std::vector<std::unique_ptr<FontProvider>> providers_;
};

}  // namespace pwm
