/**
 * @file    font_provider.cpp
 * @brief   Font faces and the font resolution chain
 * @license MIT
 */

#include "core/font_provider.hpp"
#include "core/types.hpp"
#include "utils/path_formatter.hpp"

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_SYNTHESIS_H

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <system_error>
#include <type_traits>

namespace fs = std::filesystem;

namespace pwm {

namespace {

// =============================================================================
// UTF-8
// =============================================================================

constexpr char32_t kReplacementChar = 0xFFFD;

std::vector<char32_t> decode_utf8(std::string_view text) {
    std::vector<char32_t> out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        int extra = 0;
        char32_t cp = 0;

        if (lead < 0x80)                { cp = lead;        extra = 0; }
        else if ((lead & 0xE0) == 0xC0) { cp = lead & 0x1F; extra = 1; }
        else if ((lead & 0xF0) == 0xE0) { cp = lead & 0x0F; extra = 2; }
        else if ((lead & 0xF8) == 0xF0) { cp = lead & 0x07; extra = 3; }
        else {
            out.push_back(kReplacementChar);
            ++i;
            continue;
        }

        // Truncated sequence at the end of the string
        if (i + extra >= text.size()) {
            out.push_back(kReplacementChar);
            break;
        }

        bool valid = true;
        for (int k = 1; k <= extra; ++k) {
            const auto cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) { valid = false; break; }
            cp = (cp << 6) | (cont & 0x3F);
        }

        out.push_back(valid ? cp : kReplacementChar);
        i += valid ? extra + 1 : 1;
    }
    return out;
}

bool is_blank(char32_t cp) {
    return cp == U' ' || cp == U'\t' || cp == U'\r' || cp == U'\n' || cp == 0x3000;
}

// =============================================================================
// FreeType face
// =============================================================================

struct FtLibraryDeleter {
    void operator()(FT_Library lib) const noexcept { FT_Done_FreeType(lib); }
};

struct FtFaceDeleter {
    void operator()(FT_Face face) const noexcept { FT_Done_Face(face); }
};

using FtLibraryPtr = std::unique_ptr<std::remove_pointer_t<FT_Library>, FtLibraryDeleter>;
using FtFacePtr = std::unique_ptr<std::remove_pointer_t<FT_Face>, FtFaceDeleter>;

class FreeTypeFace final : public FontFace {
public:
    FreeTypeFace(FtLibraryPtr library, FtFacePtr face, fs::path path,
                 int size_px, bool synth_bold, bool synth_italic)
        : library_(std::move(library))
        , face_(std::move(face))
        , path_(std::move(path))
        , size_px_(size_px)
        , synth_bold_(synth_bold)
        , synth_italic_(synth_italic) {}

    cv::Mat rasterize(std::string_view utf8) const override {
        struct PlacedGlyph {
            cv::Mat bitmap;
            int x;      // Left edge relative to the pen origin
            int y;      // Top edge relative to the baseline
        };

        std::vector<PlacedGlyph> glyphs;
        const bool kerning = FT_HAS_KERNING(face_.get());
        FT_UInt previous = 0;
        int pen_x = 0;

        for (char32_t cp : decode_utf8(utf8)) {
            if (cp == U'\r' || cp == U'\n') continue;

            const FT_UInt index = FT_Get_Char_Index(face_.get(), static_cast<FT_ULong>(cp));

            if (kerning && previous != 0 && index != 0) {
                FT_Vector delta;
                if (FT_Get_Kerning(face_.get(), previous, index, FT_KERNING_DEFAULT, &delta) == 0) {
                    pen_x += static_cast<int>(delta.x >> 6);
                }
            }

            if (FT_Load_Glyph(face_.get(), index, FT_LOAD_DEFAULT) != 0) {
                spdlog::debug("FreeType: cannot load glyph U+{:04X}", static_cast<uint32_t>(cp));
                continue;
            }

            FT_GlyphSlot slot = face_->glyph;
            if (synth_bold_)   FT_GlyphSlot_Embolden(slot);
            if (synth_italic_) FT_GlyphSlot_Oblique(slot);

            if (FT_Render_Glyph(slot, FT_RENDER_MODE_NORMAL) != 0) {
                spdlog::debug("FreeType: cannot render glyph U+{:04X}", static_cast<uint32_t>(cp));
                continue;
            }

            const FT_Bitmap& bm = slot->bitmap;
            const int rows = static_cast<int>(bm.rows);
            const int width = static_cast<int>(bm.width);
            if (width > 0 && rows > 0) {
                cv::Mat bitmap;
                if (bm.pixel_mode == FT_PIXEL_MODE_GRAY) {
                    bitmap.create(rows, width, CV_8UC1);
                    for (int row = 0; row < rows; ++row) {
                        const unsigned char* src = bm.buffer + static_cast<ptrdiff_t>(row) * bm.pitch;
                        std::copy_n(src, width, bitmap.ptr<uint8_t>(row));
                    }
                } else if (bm.pixel_mode == FT_PIXEL_MODE_MONO) {
                    bitmap = expand_mono_bitmap(bm.buffer, rows, width, bm.pitch);
                } else {
                    spdlog::debug("FreeType: unsupported pixel mode {} for U+{:04X}",
                                  static_cast<int>(bm.pixel_mode), static_cast<uint32_t>(cp));
                }
                if (!bitmap.empty()) {
                    glyphs.push_back({bitmap, pen_x + slot->bitmap_left, -slot->bitmap_top});
                }
            }

            pen_x += static_cast<int>(slot->advance.x >> 6);
            previous = index;
        }

        if (glyphs.empty()) {
            return {};
        }

        // Ink box over all placed glyphs
        int min_x = glyphs.front().x;
        int min_y = glyphs.front().y;
        int max_x = min_x;
        int max_y = min_y;
        for (const auto& g : glyphs) {
            min_x = std::min(min_x, g.x);
            min_y = std::min(min_y, g.y);
            max_x = std::max(max_x, g.x + g.bitmap.cols);
            max_y = std::max(max_y, g.y + g.bitmap.rows);
        }

        cv::Mat mask = cv::Mat::zeros(max_y - min_y, max_x - min_x, CV_8UC1);
        for (const auto& g : glyphs) {
            cv::Mat roi = mask(cv::Rect(g.x - min_x, g.y - min_y, g.bitmap.cols, g.bitmap.rows));
            cv::max(roi, g.bitmap, roi);
        }
        return mask;
    }

    bool can_render(std::string_view utf8) const override {
        for (char32_t cp : decode_utf8(utf8)) {
            if (is_blank(cp)) continue;
            if (cp == kReplacementChar) return false;
            if (FT_Get_Char_Index(face_.get(), static_cast<FT_ULong>(cp)) == 0) return false;
        }
        return true;
    }

    std::string description() const override {
        return fmt::format("{} {}px{}{}", path_, size_px_,
                           synth_bold_ ? " +bold" : "",
                           synth_italic_ ? " +oblique" : "");
    }

private:
    // Declaration order matters: the face must be released before the library
    FtLibraryPtr library_;
    FtFacePtr face_;
    fs::path path_;
    int size_px_;
    bool synth_bold_;
    bool synth_italic_;
};

// =============================================================================
// Hershey face
// =============================================================================

class HersheyFace final : public FontFace {
public:
    HersheyFace(int size_px, bool bold, bool italic)
        : size_px_(size_px)
        , font_(cv::FONT_HERSHEY_SIMPLEX | (italic ? cv::FONT_ITALIC : 0))
        , thickness_(bold ? std::max(2, size_px / 12) : std::max(1, size_px / 24))
        , scale_(cv::getFontScaleFromHeight(cv::FONT_HERSHEY_SIMPLEX, size_px, thickness_)) {}

    cv::Mat rasterize(std::string_view utf8) const override {
        const std::string text(utf8);

        int baseline = 0;
        const cv::Size size = cv::getTextSize(text, font_, scale_, thickness_, &baseline);
        if (size.width <= 0 || size.height <= 0) {
            return {};
        }

        const int pad = thickness_ * 2;
        cv::Mat canvas = cv::Mat::zeros(size.height + baseline + pad * 2, size.width + pad * 2, CV_8UC1);
        cv::putText(canvas, text, cv::Point(pad, pad + size.height),
                    font_, scale_, cv::Scalar(255), thickness_, cv::LINE_AA);

        const cv::Rect ink = cv::boundingRect(canvas);
        if (ink.empty()) {
            return {};
        }
        return canvas(ink).clone();
    }

    bool can_render(std::string_view utf8) const override {
        return std::all_of(utf8.begin(), utf8.end(), [](char c) {
            const auto u = static_cast<unsigned char>(c);
            return u >= 0x20 && u < 0x7F;
        });
    }

    std::string description() const override {
        return fmt::format("Hershey simplex {}px (thickness {})", size_px_, thickness_);
    }

private:
    int size_px_;
    int font_;
    int thickness_;
    double scale_;
};

// =============================================================================
// File lookup helpers
// =============================================================================

std::string normalize_font_key(std::string_view name) {
    std::string key;
    key.reserve(name.size());
    for (char c : name) {
        const auto u = static_cast<unsigned char>(c);
        if (std::isalnum(u)) {
            key.push_back(static_cast<char>(std::tolower(u)));
        } else if (u >= 0x80) {
            key.push_back(c);   // Keep non-ASCII family names intact
        }
    }
    return key;
}

bool is_font_file(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".ttf" || ext == ".otf" || ext == ".ttc";
}

std::optional<fs::path> home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
#else
    const char* home = std::getenv("HOME");
#endif
    if (home == nullptr || *home == '\0') return std::nullopt;
    return fs::path(home);
}

}  // anonymous namespace

// =============================================================================
// Face factories
// =============================================================================

std::unique_ptr<FontFace> open_freetype_face(
    const fs::path& path,
    int size_px,
    bool bold,
    bool italic)
{
    if (size_px <= 0) {
        spdlog::debug("FreeType: invalid size {}px for {}", size_px, path);
        return nullptr;
    }

    FT_Library raw_library = nullptr;
    if (FT_Init_FreeType(&raw_library) != 0) {
        spdlog::warn("FreeType: library initialisation failed");
        return nullptr;
    }
    FtLibraryPtr library(raw_library);

    FT_Face raw_face = nullptr;
    if (FT_New_Face(library.get(), path.string().c_str(), 0, &raw_face) != 0) {
        spdlog::debug("FreeType: cannot open {}", path);
        return nullptr;
    }
    FtFacePtr face(raw_face);

    if (FT_Set_Pixel_Sizes(face.get(), 0, static_cast<FT_UInt>(size_px)) != 0) {
        spdlog::debug("FreeType: {} has no {}px size", path, size_px);
        return nullptr;
    }

    // Synthesise only what the file does not already provide
    const bool synth_bold = bold && !(face->style_flags & FT_STYLE_FLAG_BOLD);
    const bool synth_italic = italic && !(face->style_flags & FT_STYLE_FLAG_ITALIC);

    return std::make_unique<FreeTypeFace>(std::move(library), std::move(face), path,
                                          size_px, synth_bold, synth_italic);
}

cv::Mat expand_mono_bitmap(const uint8_t* buffer, int rows, int width, int pitch) {
    if (buffer == nullptr || rows <= 0 || width <= 0) {
        return {};
    }

    cv::Mat coverage(rows, width, CV_8UC1);
    for (int row = 0; row < rows; ++row) {
        const uint8_t* src = buffer + static_cast<ptrdiff_t>(row) * pitch;
        auto* dst = coverage.ptr<uint8_t>(row);
        for (int col = 0; col < width; ++col) {
            dst[col] = (src[col >> 3] & (0x80 >> (col & 7))) ? 255 : 0;
        }
    }
    return coverage;
}

std::unique_ptr<FontFace> open_hershey_face(int size_px, bool bold, bool italic) {
    return std::make_unique<HersheyFace>(std::max(1, size_px), bold, italic);
}

std::vector<fs::path> font_search_dirs() {
    std::vector<fs::path> dirs;
    const auto home = home_dir();

#ifdef _WIN32
    const char* windir = std::getenv("WINDIR");
    dirs.emplace_back(fs::path(windir ? windir : "C:\\Windows") / "Fonts");
    if (const char* local = std::getenv("LOCALAPPDATA")) {
        dirs.emplace_back(fs::path(local) / "Microsoft" / "Windows" / "Fonts");
    }
#elif defined(__APPLE__)
    dirs.emplace_back("/System/Library/Fonts");
    dirs.emplace_back("/Library/Fonts");
    if (home) dirs.emplace_back(*home / "Library" / "Fonts");
#else
    dirs.emplace_back("/usr/share/fonts");
    dirs.emplace_back("/usr/local/share/fonts");
    if (home) {
        dirs.emplace_back(*home / ".fonts");
        dirs.emplace_back(*home / ".local" / "share" / "fonts");
    }
#endif
    return dirs;
}

std::vector<fs::path> system_font_candidates() {
#ifdef _WIN32
    const char* windir = std::getenv("WINDIR");
    const fs::path fonts = fs::path(windir ? windir : "C:\\Windows") / "Fonts";
    return {fonts / "arial.ttf", fonts / "segoeui.ttf", fonts / "msyh.ttc", fonts / "simsun.ttc"};
#elif defined(__APPLE__)
    return {
        "/System/Library/Fonts/Helvetica.ttc",
        "/Library/Fonts/Arial.ttf",
        "/System/Library/Fonts/PingFang.ttc",
        "/System/Library/Fonts/Hiragino Sans GB.ttc",
    };
#else
    return {
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
        "/usr/share/fonts/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
        "/usr/share/fonts/opentype/noto/NotoSansCJK-Regular.ttc",
        "/usr/share/fonts/noto-cjk/NotoSansCJK-Regular.ttc",
        "/usr/share/fonts/truetype/wqy/wqy-microhei.ttc",
    };
#endif
}

// =============================================================================
// NamedFontProvider
// =============================================================================

NamedFontProvider::NamedFontProvider(std::vector<fs::path> search_dirs)
    : search_dirs_(std::move(search_dirs)) {}

void NamedFontProvider::build_index() const {
    for (const auto& dir : search_dirs_) {
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) continue;

        auto it = fs::recursive_directory_iterator(
            dir, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            spdlog::debug("Font directory {} not readable: {}", dir, ec.message());
            continue;
        }

        for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (ec) break;
            const auto& entry = *it;
            if (!entry.is_regular_file(ec) || !is_font_file(entry.path())) continue;
            index_.try_emplace(normalize_font_key(entry.path().stem().string()), entry.path());
        }
    }
    spdlog::debug("Font index: {} files", index_.size());
}

std::optional<fs::path> NamedFontProvider::find_family(
    std::string_view family,
    bool bold,
    bool italic,
    bool& styled) const
{
    std::call_once(index_once_, [this] { build_index(); });

    const std::string base = normalize_font_key(family);
    styled = false;
    if (base.empty()) return std::nullopt;

    std::vector<std::string> styled_keys;
    if (bold && italic) {
        styled_keys = {base + "bolditalic", base + "boldoblique", base + "bi", base + "z"};
    } else if (bold) {
        styled_keys = {base + "bold", base + "bd", base + "b"};
    } else if (italic) {
        styled_keys = {base + "italic", base + "oblique", base + "it", base + "i"};
    }

    for (const auto& key : styled_keys) {
        if (auto it = index_.find(key); it != index_.end()) {
            styled = true;
            return it->second;
        }
    }

    for (const auto& key : {base, base + "regular", base + "book"}) {
        if (auto it = index_.find(key); it != index_.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

std::unique_ptr<FontFace> NamedFontProvider::load(
    const FontRequest& request,
    std::string_view /*text*/) const
{
    if (request.file) {
        if (auto face = open_freetype_face(*request.file, request.size_px, request.bold, request.italic)) {
            return face;
        }
        spdlog::warn("{}: cannot load font file '{}'",
                     to_string(ErrorCode::FontResolutionFailure), *request.file);
    }

    if (request.family.empty()) {
        return nullptr;
    }

    // Family given as a file path
    std::error_code ec;
    const fs::path as_path(request.family);
    if (is_font_file(as_path) && fs::is_regular_file(as_path, ec)) {
        if (auto face = open_freetype_face(as_path, request.size_px, request.bold, request.italic)) {
            return face;
        }
    }

    bool styled = false;
    const auto file = find_family(request.family, request.bold, request.italic, styled);
    if (!file) {
        spdlog::debug("Font family '{}' not found in {} directories",
                      request.family, search_dirs_.size());
        return nullptr;
    }

    // A styled file already carries the style; the FreeType flags decide what is left
    return open_freetype_face(*file, request.size_px, request.bold, request.italic);
}

// =============================================================================
// BundledFontProvider
// =============================================================================

std::unique_ptr<FontFace> BundledFontProvider::load(
    const FontRequest& request,
    std::string_view text) const
{
    auto face = open_hershey_face(request.size_px, request.bold, request.italic);
    if (!face->can_render(text)) {
        spdlog::debug("Bundled font cannot render non-ASCII text");
        return nullptr;
    }
    return face;
}

// =============================================================================
// SystemFontProvider
// =============================================================================

SystemFontProvider::SystemFontProvider(std::vector<fs::path> candidates)
    : candidates_(std::move(candidates)) {}

std::unique_ptr<FontFace> SystemFontProvider::load(
    const FontRequest& request,
    std::string_view text) const
{
    std::unique_ptr<FontFace> first_loaded;

    for (const auto& path : candidates_) {
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) continue;

        auto face = open_freetype_face(path, request.size_px, request.bold, request.italic);
        if (!face) continue;

        if (face->can_render(text)) {
            return face;
        }
        if (!first_loaded) {
            first_loaded = std::move(face);
        }
    }

    if (first_loaded) {
        spdlog::warn("No system font covers all characters of '{}', using {}",
                     text, first_loaded->description());
    }
    return first_loaded;
}

// =============================================================================
// FontResolver
// =============================================================================

FontResolver::FontResolver() {
    providers_.push_back(std::make_unique<NamedFontProvider>());
    providers_.push_back(std::make_unique<BundledFontProvider>());
    providers_.push_back(std::make_unique<SystemFontProvider>());
}

FontResolver::FontResolver(std::vector<std::unique_ptr<FontProvider>> providers)
    : providers_(std::move(providers)) {}

std::unique_ptr<FontFace> FontResolver::resolve(
    const FontRequest& request,
    std::string_view text) const
{
    for (const auto& provider : providers_) {
        try {
            if (auto face = provider->load(request, text)) {
                spdlog::debug("Font resolved by {} provider: {}", provider->name(), face->description());
                return face;
            }
        } catch (const std::exception& e) {
            spdlog::warn("Font provider '{}' failed: {}", provider->name(), e.what());
        }
    }

    spdlog::warn("{}: no face for family '{}' ({}px)",
                 to_string(ErrorCode::FontResolutionFailure), request.family, request.size_px);
    return nullptr;
}

}  // namespace pwm
